#include "portico/flow-controller.hpp"

#include <algorithm>
#include <coroutine>
#include <cstddef>
#include <utility>

namespace portico::http {

void FlowController::onBytesConsumed(std::size_t nbBytes) noexcept {
  _unconsumed -= std::min(nbBytes, _unconsumed);
}

void FlowController::onBytesFlushed(std::size_t nbBytes) noexcept { _unflushed -= std::min(nbBytes, _unflushed); }

void FlowController::pauseReading() noexcept {
  if (!_readPaused) {
    _readPaused = true;
    ++_nbPauseSignals;
  }
}

void FlowController::resumeReading() noexcept {
  if (_readPaused) {
    _readPaused = false;
    ++_nbResumeSignals;
  }
}

std::coroutine_handle<> FlowController::takeWritableWaiter(bool force) noexcept {
  std::coroutine_handle<> handle;
  if (_writableWaiter && (force || isWritable())) {
    std::swap(handle, _writableWaiter);
  }
  return handle;
}

std::coroutine_handle<> FlowController::releaseAll() noexcept {
  _unconsumed = 0;
  _unflushed = 0;
  return takeWritableWaiter(true);
}

}  // namespace portico::http
