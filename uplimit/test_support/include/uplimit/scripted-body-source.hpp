#pragma once

#include <coroutine>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "uplimit/body-source.hpp"

namespace uplimit::test {

// Body source controlled by a test, standing for a connection transport.
//
// Chunks are served in order, each read returning at most the requested number of bytes (a chunk larger than the
// request is served over several reads). The body ends when all chunks have been read, or, in asynchronous mode,
// once finish() has been called and all fed chunks have been read.
//
// The ScriptedBody controller keeps access to the source state after source() ownership has been given to a request,
// so that tests can feed bytes and inspect read counters.
class ScriptedBody {
 public:
  // Synchronous body made of given chunks, all available immediately.
  explicit ScriptedBody(std::vector<std::string> chunks = {});

  // Synchronous body with given content, delivered in chunks of chunkSize bytes.
  static ScriptedBody Split(std::string_view body, std::size_t chunkSize);

  // Asynchronous body: no chunk is available until fed.
  static ScriptedBody Async();

  // Makes the (nbReads+1)-th read, and all following ones, throw a std::system_error (connection reset).
  ScriptedBody& failAfter(std::size_t nbReads);

  // Returns the source to install in a request. Several calls return sources sharing the same state.
  [[nodiscard]] std::unique_ptr<BodySource> source() const;

  // Makes a new chunk available, resuming the coroutine waiting for it if any.
  void feed(std::string chunk);

  // Marks the end of the body, resuming the coroutine waiting for it if any.
  void finish();

  // Tells whether a coroutine is suspended waiting for bytes.
  [[nodiscard]] bool hasWaiter() const noexcept;

  // Number of sources returned by source() that are not destroyed yet.
  [[nodiscard]] std::size_t nbLiveSources() const noexcept;

  // Number of readChunk() calls received, including failed ones.
  [[nodiscard]] std::size_t nbReads() const noexcept;

  // Number of body bytes handed out to the reader of the source.
  [[nodiscard]] std::size_t bytesRead() const noexcept;

  // Largest maxBytes received by readChunk().
  [[nodiscard]] std::size_t largestRequest() const noexcept;

  // Number of bytes fed (or scripted) and not read yet.
  [[nodiscard]] std::size_t bytesUnread() const noexcept;

  struct State {
    std::deque<std::string> chunks;
    std::coroutine_handle<> waiter;
    std::optional<std::size_t> failAfterReads;
    std::size_t chunkPos{0};
    std::size_t posInChunk{0};
    std::size_t nbReads{0};
    std::size_t bytesRead{0};
    std::size_t largestRequest{0};
    std::size_t nbLiveSources{0};
    bool finished{true};
  };

 private:
  std::shared_ptr<State> _state;
};

}  // namespace uplimit::test
