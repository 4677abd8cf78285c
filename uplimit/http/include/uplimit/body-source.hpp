#pragma once

#include <coroutine>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace uplimit {

class PayloadTooLarge;

// Pull-based source of request body bytes, typically backed by the transport of a connection.
// A BodySource is exclusively owned by a single request and is never accessed concurrently.
class BodySource {
 public:
  BodySource() noexcept = default;

  BodySource(const BodySource&) = delete;
  BodySource& operator=(const BodySource&) = delete;

  virtual ~BodySource() = default;

  // Returns the next chunk of at most maxBytes bytes, in arrival order. A maxBytes of 0 is read as 1.
  // An empty view means that the body has been fully consumed; subsequent calls keep returning empty.
  // The returned view remains valid until the next readChunk() call on this source.
  // Transport failures are reported as exceptions.
  [[nodiscard]] virtual std::string_view readChunk(std::size_t maxBytes) = 0;

  // Tells whether readChunk() can be called without waiting for the transport.
  [[nodiscard]] virtual bool chunkReady() const noexcept { return true; }

  // Called by an awaiting coroutine when chunkReady() returned false, just before it suspends.
  // The source takes ownership of resuming the coroutine once a chunk (or the end of the body) is available.
  // Returning false means that the coroutine should not suspend after all.
  virtual bool resumeWhenReady([[maybe_unused]] std::coroutine_handle<> coroutine) { return false; }

  // Withdraws a coroutine registered by resumeWhenReady() that has not been resumed yet, because it is being
  // destroyed (request cancelled). The source must not resume it afterwards.
  virtual void cancelWait([[maybe_unused]] std::coroutine_handle<> coroutine) noexcept {}

  // Returns the body limit violation detected by this source, if any.
  [[nodiscard]] virtual const PayloadTooLarge* limitViolation() const noexcept { return nullptr; }
};

// Awaitable reading the next chunk of a BodySource.
// It suspends the awaiting coroutine only while the source has no data ready.
// If the coroutine is destroyed while suspended, its registration is withdrawn from the source.
class ReadChunkAwaitable {
 public:
  ReadChunkAwaitable(BodySource* source, std::size_t maxBytes) noexcept : _source(source), _maxBytes(maxBytes) {}

  ReadChunkAwaitable(const ReadChunkAwaitable&) = delete;
  ReadChunkAwaitable& operator=(const ReadChunkAwaitable&) = delete;

  ~ReadChunkAwaitable() {
    if (_suspended) {
      _source->cancelWait(_suspended);
    }
  }

  [[nodiscard]] bool await_ready() const noexcept { return _source == nullptr || _source->chunkReady(); }

  bool await_suspend(std::coroutine_handle<> coroutine) {
    if (!_source->resumeWhenReady(coroutine)) {
      return false;
    }
    _suspended = coroutine;
    return true;
  }

  [[nodiscard]] std::string_view await_resume() {
    _suspended = {};
    return _source == nullptr ? std::string_view{} : _source->readChunk(_maxBytes);
  }

 private:
  BodySource* _source;
  std::size_t _maxBytes;
  std::coroutine_handle<> _suspended;
};

// Body fully available in memory, served in chunks of at most maxBytes.
class BufferedBodySource final : public BodySource {
 public:
  BufferedBodySource() noexcept = default;

  explicit BufferedBodySource(std::string body) noexcept : _body(std::move(body)) {}

  [[nodiscard]] std::string_view readChunk(std::size_t maxBytes) override;

  // Number of bytes not read yet.
  [[nodiscard]] std::size_t remaining() const noexcept { return _body.size() - _pos; }

 private:
  std::string _body;
  std::size_t _pos{0};
};

}  // namespace uplimit
