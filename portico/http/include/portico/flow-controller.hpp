#pragma once

#include <coroutine>
#include <cstddef>
#include <cstdint>

namespace portico::http {

// Buffering thresholds of a connection, in bytes.
struct FlowWatermarks {
  // Reading is paused when more than readHigh received bytes have not been consumed yet...
  std::size_t readHigh{64UL * 1024UL};
  // ... and resumed once at most readLow of them remain.
  std::size_t readLow{16UL * 1024UL};
  // A connection is writable while at most writeHigh queued bytes are not flushed to the socket.
  std::size_t writeHigh{64UL * 1024UL};

  bool operator==(const FlowWatermarks&) const noexcept = default;
};

// Back-pressure accounting of a single connection.
// Inbound: bytes read from the socket minus bytes consumed (framing bytes as soon as parsed, body bytes when handed
// to the request handler or discarded). Outbound: bytes queued for write minus bytes flushed.
// The controller only decides, the connection applies the decision to its event registration.
class FlowController {
 public:
  FlowController() noexcept = default;

  explicit FlowController(FlowWatermarks watermarks) noexcept : _watermarks(watermarks) {}

  void onBytesRead(std::size_t nbBytes) noexcept { _unconsumed += nbBytes; }

  void onBytesConsumed(std::size_t nbBytes) noexcept;

  void onBytesQueuedForWrite(std::size_t nbBytes) noexcept { _unflushed += nbBytes; }

  void onBytesFlushed(std::size_t nbBytes) noexcept;

  // Reading is active and the inbound level crossed the high mark.
  [[nodiscard]] bool shouldPauseReading() const noexcept {
    return !_readPaused && _unconsumed > _watermarks.readHigh;
  }

  // Reading is paused and the inbound level fell to the low mark.
  [[nodiscard]] bool shouldResumeReading() const noexcept {
    return _readPaused && _unconsumed <= _watermarks.readLow;
  }

  // Both are idempotent, only state changes are counted as signals.
  void pauseReading() noexcept;

  void resumeReading() noexcept;

  [[nodiscard]] bool readPaused() const noexcept { return _readPaused; }

  [[nodiscard]] bool isWritable() const noexcept { return _unflushed <= _watermarks.writeHigh; }

  [[nodiscard]] std::size_t unconsumed() const noexcept { return _unconsumed; }

  [[nodiscard]] std::size_t unflushed() const noexcept { return _unflushed; }

  [[nodiscard]] uint32_t nbPauseSignals() const noexcept { return _nbPauseSignals; }

  [[nodiscard]] uint32_t nbResumeSignals() const noexcept { return _nbResumeSignals; }

  [[nodiscard]] const FlowWatermarks& watermarks() const noexcept { return _watermarks; }

  // Registers the suspended writer to resume once the outbound level drops to the write high mark.
  // Only one writer at a time.
  void setWritableWaiter(std::coroutine_handle<> handle) noexcept { _writableWaiter = handle; }

  [[nodiscard]] bool hasWritableWaiter() const noexcept { return static_cast<bool>(_writableWaiter); }

  // Returns and forgets the waiting writer if the connection is writable (or if 'force' is set), a null handle
  // otherwise. The caller decides how and when to resume it.
  std::coroutine_handle<> takeWritableWaiter(bool force = false) noexcept;

  // Drops all outstanding accounting (connection closed or request abandoned) and returns the waiting writer, if any.
  std::coroutine_handle<> releaseAll() noexcept;

 private:
  FlowWatermarks _watermarks;
  std::size_t _unconsumed{0};
  std::size_t _unflushed{0};
  uint32_t _nbPauseSignals{0};
  uint32_t _nbResumeSignals{0};
  bool _readPaused{false};
  std::coroutine_handle<> _writableWaiter;
};

}  // namespace portico::http
