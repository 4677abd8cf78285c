#pragma once

#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

#include "uplimit/body-source.hpp"
#include "uplimit/limit-policy.hpp"
#include "uplimit/payload-too-large.hpp"

namespace uplimit {

enum class BodyReadState : std::uint8_t {
  Reading,    // body not fully read yet, limit respected so far
  Exhausted,  // end of body reached within the limit (terminal)
  Exceeded    // limit breached, no more bytes are delivered (terminal)
};

// Result of BoundedBodyReader::nextChunk().
// data is non empty only when state is Reading.
struct BodyChunk {
  BodyReadState state{BodyReadState::Reading};
  std::string_view data;
};

// Terminal outcome of a bounded body read, reported once to the completion callback.
struct BodyOutcome {
  BodyReadState state;
  std::size_t consumed;  // bytes delivered to the reader's caller
  std::size_t observed;  // bytes received from the source, including a rejected chunk
  std::size_t limit;
};

// Wraps a BodySource and enforces a maximum number of body bytes, whatever the declared length of the request.
//
// State machine: Reading -> Reading (chunk delivered), Reading -> Exhausted (end of body within the limit),
// Reading -> Exceeded (limit breached). Exhausted and Exceeded are terminal: further reads repeat the same outcome.
//
// The chunk that makes the total go over the limit is read from the underlying source but never delivered.
// The underlying source is abandoned at that point, not rewound: the remaining bytes stay unread.
//
// Chunks are views on the underlying source buffers, the reader does not copy nor buffer body bytes.
// A BoundedBodyReader is owned by a single request and needs no synchronization.
class BoundedBodyReader final : public BodySource {
 public:
  using State = BodyReadState;
  using CompletionCallback = std::function<void(const BodyOutcome&)>;

  static constexpr std::size_t kDefaultReadChunk = 4096;
  static constexpr std::size_t kDefaultMaxChunkBytes = std::size_t{64} << 10;

  class NextChunkAwaitable {
   public:
    NextChunkAwaitable(BoundedBodyReader& reader, std::size_t maxBytes) noexcept
        : _reader(reader), _maxBytes(maxBytes) {}

    NextChunkAwaitable(const NextChunkAwaitable&) = delete;
    NextChunkAwaitable& operator=(const NextChunkAwaitable&) = delete;

    // A coroutine destroyed while suspended here is withdrawn from the underlying source.
    ~NextChunkAwaitable() {
      if (_suspended) {
        _reader.cancelWait(_suspended);
      }
    }

    [[nodiscard]] bool await_ready() const noexcept { return _reader.chunkReady(); }

    bool await_suspend(std::coroutine_handle<> coroutine) {
      if (!_reader.resumeWhenReady(coroutine)) {
        return false;
      }
      _suspended = coroutine;
      return true;
    }

    [[nodiscard]] BodyChunk await_resume() {
      _suspended = {};
      return _reader.nextChunk(_maxBytes);
    }

   private:
    BoundedBodyReader& _reader;
    std::size_t _maxBytes;
    std::coroutine_handle<> _suspended;
  };

  // Creates a reader enforcing given policy on inner.
  // The limit is copied: later changes of the configuration do not affect this reader.
  // maxChunkBytes caps the size requested from inner on each read (clamped to at least 1).
  BoundedBodyReader(LimitPolicy policy, std::unique_ptr<BodySource> inner,
                    std::size_t maxChunkBytes = kDefaultMaxChunkBytes);

  // Reads the next chunk of at most maxBytes bytes.
  // Never throws for a limit violation, which is reported as the Exceeded state.
  // Exceptions from the underlying source (I/O errors) are propagated unchanged and leave the state untouched.
  [[nodiscard]] BodyChunk nextChunk(std::size_t maxBytes = kDefaultReadChunk);

  // Awaitable version of nextChunk(), suspending the awaiting coroutine while the underlying source waits for data.
  [[nodiscard]] NextChunkAwaitable nextChunkAsync(std::size_t maxBytes = kDefaultReadChunk) {
    return {*this, maxBytes};
  }

  // BodySource interface, so that a BoundedBodyReader can transparently replace the body of a request.
  // Throws PayloadTooLarge once the limit has been exceeded, on this call and all subsequent ones.
  [[nodiscard]] std::string_view readChunk(std::size_t maxBytes) override;

  [[nodiscard]] bool chunkReady() const noexcept override;

  bool resumeWhenReady(std::coroutine_handle<> coroutine) override;

  void cancelWait(std::coroutine_handle<> coroutine) noexcept override { _inner->cancelWait(coroutine); }

  [[nodiscard]] const PayloadTooLarge* limitViolation() const noexcept override {
    return _error ? &*_error : nullptr;
  }

  // Sets a callback invoked exactly once, when the reader reaches a terminal state.
  BoundedBodyReader& onCompletion(CompletionCallback callback);

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] bool done() const noexcept { return _state != State::Reading; }

  // Number of bytes delivered so far. Never greater than limit().
  [[nodiscard]] std::size_t consumed() const noexcept { return _consumed; }

  [[nodiscard]] std::size_t limit() const noexcept { return _limit; }

  // Returns the violation of an Exceeded reader.
  // Precondition: state() == State::Exceeded.
  [[nodiscard]] const PayloadTooLarge& error() const noexcept { return *_error; }

 private:
  void finish(State state, std::size_t observed);

  std::unique_ptr<BodySource> _inner;
  CompletionCallback _completionCallback;
  std::optional<PayloadTooLarge> _error;
  std::size_t _limit;
  std::size_t _consumed{0};
  std::size_t _maxChunkBytes;
  State _state{State::Reading};
};

}  // namespace uplimit
