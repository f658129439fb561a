#pragma once

#include <csignal>
#include <initializer_list>
#include <span>

namespace portico {

// Process-wide termination signal interception.
// The installed handler only records the signal (no logging, no allocation): servers poll IsStopRequested() from
// their event loop and react to the first signal with a graceful shutdown, and to any further one with a forced
// shutdown.
class SignalHandler {
 public:
  static constexpr int kDefaultSignals[] = {SIGINT, SIGTERM};

  // Installs the recording handler for the given signals, remembering their previous dispositions.
  // Calling Enable while already enabled first restores the previous dispositions.
  static void Enable(std::span<const int> signals = kDefaultSignals);

  static void Enable(std::initializer_list<int> signals) {
    Enable(std::span<const int>(signals.begin(), signals.size()));
  }

  // Restores the dispositions saved by Enable.
  // If reraiseCaptured is true and a signal was captured since Enable, it is raised again once the previous
  // dispositions are back in place so that an outer handler observes it, and the stop request is cleared.
  static void Disable(bool reraiseCaptured = false);

  [[nodiscard]] static bool IsEnabled();

  [[nodiscard]] static bool IsStopRequested();

  [[nodiscard]] static int NbSignalsReceived();

  // Number of the last captured signal, 0 if none.
  [[nodiscard]] static int LastSignal();

 private:
  friend class SignalHandlerGlobalTest;

  static void ResetStopRequest();
};

}  // namespace portico
