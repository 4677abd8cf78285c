#include "uplimit/scripted-body-source.hpp"

#include <algorithm>
#include <coroutine>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "uplimit/body-source.hpp"

namespace uplimit::test {

namespace {

class ScriptedBodySource final : public BodySource {
 public:
  explicit ScriptedBodySource(std::shared_ptr<ScriptedBody::State> state) noexcept : _state(std::move(state)) {
    ++_state->nbLiveSources;
  }

  ScriptedBodySource(const ScriptedBodySource&) = delete;
  ScriptedBodySource& operator=(const ScriptedBodySource&) = delete;

  ~ScriptedBodySource() override { --_state->nbLiveSources; }

  [[nodiscard]] std::string_view readChunk(std::size_t maxBytes) override {
    ScriptedBody::State& state = *_state;
    ++state.nbReads;
    state.largestRequest = std::max(state.largestRequest, maxBytes);
    if (state.failAfterReads && state.nbReads > *state.failAfterReads) {
      throw std::system_error(std::make_error_code(std::errc::connection_reset), "scripted body read failure");
    }
    if (state.chunkPos == state.chunks.size()) {
      if (!state.finished) {
        throw std::logic_error("No body chunk available yet");
      }
      return {};
    }
    const std::string& chunk = state.chunks[state.chunkPos];
    const std::size_t len = std::min(std::max<std::size_t>(maxBytes, 1), chunk.size() - state.posInChunk);
    std::string_view ret(chunk.data() + state.posInChunk, len);
    state.posInChunk += len;
    if (state.posInChunk == chunk.size()) {
      ++state.chunkPos;
      state.posInChunk = 0;
    }
    state.bytesRead += len;
    return ret;
  }

  [[nodiscard]] bool chunkReady() const noexcept override {
    return _state->finished || _state->chunkPos != _state->chunks.size();
  }

  bool resumeWhenReady(std::coroutine_handle<> coroutine) override {
    if (chunkReady()) {
      return false;
    }
    _state->waiter = coroutine;
    return true;
  }

  void cancelWait(std::coroutine_handle<> coroutine) noexcept override {
    if (_state->waiter == coroutine) {
      _state->waiter = {};
    }
  }

 private:
  std::shared_ptr<ScriptedBody::State> _state;
};

void ResumeWaiter(ScriptedBody::State& state) {
  if (state.waiter) {
    std::exchange(state.waiter, {}).resume();
  }
}

}  // namespace

ScriptedBody::ScriptedBody(std::vector<std::string> chunks) : _state(std::make_shared<State>()) {
  for (auto& chunk : chunks) {
    // empty chunks would be taken for the end of the body
    if (!chunk.empty()) {
      _state->chunks.push_back(std::move(chunk));
    }
  }
}

ScriptedBody ScriptedBody::Split(std::string_view body, std::size_t chunkSize) {
  std::vector<std::string> chunks;
  while (!body.empty()) {
    const std::size_t len = std::min(chunkSize, body.size());
    chunks.emplace_back(body.substr(0, len));
    body.remove_prefix(len);
  }
  return ScriptedBody(std::move(chunks));
}

ScriptedBody ScriptedBody::Async() {
  ScriptedBody body;
  body._state->finished = false;
  return body;
}

ScriptedBody& ScriptedBody::failAfter(std::size_t nbReads) {
  _state->failAfterReads = nbReads;
  return *this;
}

std::unique_ptr<BodySource> ScriptedBody::source() const { return std::make_unique<ScriptedBodySource>(_state); }

void ScriptedBody::feed(std::string chunk) {
  if (chunk.empty()) {
    return;
  }
  _state->chunks.push_back(std::move(chunk));
  ResumeWaiter(*_state);
}

void ScriptedBody::finish() {
  _state->finished = true;
  ResumeWaiter(*_state);
}

bool ScriptedBody::hasWaiter() const noexcept { return static_cast<bool>(_state->waiter); }

std::size_t ScriptedBody::nbLiveSources() const noexcept { return _state->nbLiveSources; }

std::size_t ScriptedBody::nbReads() const noexcept { return _state->nbReads; }

std::size_t ScriptedBody::bytesRead() const noexcept { return _state->bytesRead; }

std::size_t ScriptedBody::largestRequest() const noexcept { return _state->largestRequest; }

std::size_t ScriptedBody::bytesUnread() const noexcept {
  std::size_t total = 0;
  for (std::size_t pos = _state->chunkPos; pos < _state->chunks.size(); ++pos) {
    total += _state->chunks[pos].size();
  }
  return total - _state->posInChunk;
}

}  // namespace uplimit::test
