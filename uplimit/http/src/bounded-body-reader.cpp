#include "uplimit/bounded-body-reader.hpp"

#include <algorithm>
#include <coroutine>
#include <cstddef>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "uplimit/body-source.hpp"
#include "uplimit/limit-policy.hpp"
#include "uplimit/log.hpp"
#include "uplimit/payload-too-large.hpp"

namespace uplimit {

namespace {

constexpr std::size_t SaturatingAdd(std::size_t lhs, std::size_t rhs) noexcept {
  return rhs > std::numeric_limits<std::size_t>::max() - lhs ? std::numeric_limits<std::size_t>::max() : lhs + rhs;
}

}  // namespace

BoundedBodyReader::BoundedBodyReader(LimitPolicy policy, std::unique_ptr<BodySource> inner,
                                     std::size_t maxChunkBytes)
    : _inner(std::move(inner)), _limit(policy.maxBytes()), _maxChunkBytes(std::max<std::size_t>(maxChunkBytes, 1)) {
  if (!_inner) {
    throw std::invalid_argument("BoundedBodyReader requires a body source");
  }
}

BodyChunk BoundedBodyReader::nextChunk(std::size_t maxBytes) {
  if (_state != State::Reading) {
    return {_state, {}};
  }

  const std::string_view chunk = _inner->readChunk(std::clamp<std::size_t>(maxBytes, 1, _maxChunkBytes));
  if (chunk.empty()) {
    finish(State::Exhausted, _consumed);
    return {_state, {}};
  }

  // written as a subtraction so that consumed + size cannot overflow
  if (chunk.size() > _limit - _consumed) {
    const std::size_t observed = SaturatingAdd(_consumed, chunk.size());
    log::debug("Request body of at least {} bytes exceeds limit of {} bytes, {} bytes delivered", observed, _limit,
               _consumed);
    finish(State::Exceeded, observed);
    return {_state, {}};
  }

  _consumed += chunk.size();
  return {_state, chunk};
}

std::string_view BoundedBodyReader::readChunk(std::size_t maxBytes) {
  const BodyChunk chunk = nextChunk(maxBytes);
  if (chunk.state == State::Exceeded) {
    throw *_error;
  }
  return chunk.data;
}

bool BoundedBodyReader::chunkReady() const noexcept { return _state != State::Reading || _inner->chunkReady(); }

bool BoundedBodyReader::resumeWhenReady(std::coroutine_handle<> coroutine) {
  if (_state != State::Reading) {
    return false;
  }
  return _inner->resumeWhenReady(coroutine);
}

BoundedBodyReader& BoundedBodyReader::onCompletion(CompletionCallback callback) {
  _completionCallback = std::move(callback);
  return *this;
}

void BoundedBodyReader::finish(State state, std::size_t observed) {
  _state = state;
  if (state == State::Exceeded) {
    _error.emplace(observed, _limit);
  }
  if (_completionCallback) {
    _completionCallback(BodyOutcome{_state, _consumed, observed, _limit});
  }
}

}  // namespace uplimit
