#include "portico/signal-handler.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstring>
#include <span>

#include "portico/log.hpp"

namespace {

constexpr std::size_t kMaxInterceptedSignals = 8;

struct SavedDisposition {
  int sigNum;
  struct sigaction action;
};

volatile std::sig_atomic_t g_lastSignal{};
std::atomic<int> g_nbSignals{0};

static_assert(std::atomic<int>::is_always_lock_free);

SavedDisposition g_saved[kMaxInterceptedSignals]{};
std::size_t g_nbSaved{};

}  // namespace

extern "C" void PorticoSignalHandler(int sigNum) {
  g_lastSignal = sigNum;
  g_nbSignals.fetch_add(1, std::memory_order_relaxed);
}

namespace portico {

void SignalHandler::Enable(std::span<const int> signals) {
  if (g_nbSaved != 0) {
    Disable(false);
  }
  struct sigaction action{};
  action.sa_handler = ::PorticoSignalHandler;
  ::sigemptyset(&action.sa_mask);
  action.sa_flags = SA_RESTART;
  for (int sigNum : signals) {
    if (g_nbSaved == kMaxInterceptedSignals) {
      log::error("Too many signals to intercept, ignoring signal {}", sigNum);
      continue;
    }
    SavedDisposition& saved = g_saved[g_nbSaved];
    if (::sigaction(sigNum, &action, &saved.action) != 0) {
      log::error("sigaction failed for signal {}: {}", sigNum, std::strerror(errno));
      continue;
    }
    saved.sigNum = sigNum;
    ++g_nbSaved;
  }
}

void SignalHandler::Disable(bool reraiseCaptured) {
  for (std::size_t pos = g_nbSaved; pos != 0; --pos) {
    const SavedDisposition& saved = g_saved[pos - 1];
    if (::sigaction(saved.sigNum, &saved.action, nullptr) != 0) {
      log::error("Unable to restore disposition of signal {}: {}", saved.sigNum, std::strerror(errno));
    }
  }
  g_nbSaved = 0;
  if (reraiseCaptured && IsStopRequested()) {
    const int sigNum = LastSignal();
    ResetStopRequest();
    log::debug("Re-raising captured signal {}", sigNum);
    ::raise(sigNum);
  }
}

bool SignalHandler::IsEnabled() { return g_nbSaved != 0; }

bool SignalHandler::IsStopRequested() { return g_nbSignals.load(std::memory_order_relaxed) != 0; }

int SignalHandler::NbSignalsReceived() { return g_nbSignals.load(std::memory_order_relaxed); }

int SignalHandler::LastSignal() { return g_lastSignal; }

void SignalHandler::ResetStopRequest() {
  g_nbSignals.store(0, std::memory_order_relaxed);
  g_lastSignal = 0;
}

}  // namespace portico
