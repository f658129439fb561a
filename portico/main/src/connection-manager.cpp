#include <sys/socket.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>
#include <utility>

#include "portico/connection.hpp"
#include "portico/event-loop.hpp"
#include "portico/http-constants.hpp"
#include "portico/http-server.hpp"
#include "portico/http-status-code.hpp"
#include "portico/internal/connection-state.hpp"
#include "portico/log.hpp"
#include "portico/simple-response.hpp"
#include "portico/socket-ops.hpp"
#include "portico/state-bag.hpp"
#include "portico/timedef.hpp"
#include "portico/transport.hpp"
#include "portico/wire-codec.hpp"

namespace portico {

using internal::ConnectionState;
using internal::RequestCycle;

namespace {

// Drops 'nbBytes' parsed bytes that are not handed to a request handler (head, chunk framing, discarded body).
void Consume(ConnectionState& state, std::size_t nbBytes) {
  if (nbBytes != 0) {
    state.inBuffer.erase_front(nbBytes);
    state.flow.onBytesConsumed(nbBytes);
  }
}

void DropCycle(ConnectionState& state, RequestCycle& cycle) {
  cycle.bridge->markDisconnected();
  state.flow.onBytesConsumed(cycle.bridge->detach());
}

}  // namespace

void HttpServer::acceptNewConnections() {
  while (true) {
    Connection cnx = Connection::Accept(_listenSocket);
    if (!cnx) {
      // no more waiting connections
      break;
    }
    const int cnxFd = cnx.fd();
    if (_config.tcpNoDelay && !SetTcpNoDelay(cnxFd)) {
      log::error("Unable to set TCP_NODELAY on fd # {}", cnxFd);
    }
    static constexpr EventBmp kInitialEvents = EventIn | EventRdHup;
    if (!_eventLoop.add(EventLoop::EventFd{cnxFd, kInitialEvents})) {
      // already logged, the connection is closed when going out of scope
      continue;
    }

    auto peer = ToHostPort(cnx.peer());
    const auto now = SteadyClock::now();
    auto state = std::make_unique<ConnectionState>(
        std::move(cnx), http::MakeWireCodec(_config.codec, http::CodecOptions{_config.maxHeaderBytes}),
        _config.watermarks, now);
    state->registeredEvents = kInitialEvents;
    state->state = std::make_shared<StateBag>(_lifespanState);

    if (peer) {
      state->client = Scope::Address{std::move(peer->host), peer->port};
    }
    if (auto local = LocalHostPort(cnxFd)) {
      state->server = Scope::Address{std::move(local->host), local->port};
    }

    ++_stats.totalConnectionsAccepted;
    _connections.insert_or_assign(cnxFd, std::move(state));
  }
}

void HttpServer::handleReadableClient(int fd, EventBmp eventBmp) {
  const auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) [[unlikely]] {
    log::error("Received an event for fd # {} which is not a known connection", fd);
    return;
  }
  ConnectionState& state = *cnxIt->second;

  if (state.closeMode == ConnectionState::CloseMode::Immediate) {
    serviceFd(cnxIt);
    return;
  }
  if (state.flow.readPaused() || state.closeMode != ConnectionState::CloseMode::None) {
    // Not reading: only a hang up may be reported here, which would otherwise be reported again at each poll.
    if ((eventBmp & (EventErr | EventHup | EventRdHup)) != 0) {
      onPeerClosed(state);
    }
    serviceFd(cnxIt);
    return;
  }

  state.inBuffer.ensureAvailableCapacityExponential(_config.readChunkBytes);
  const auto [nbRead, status] = state.transport.read(state.inBuffer.end(), _config.readChunkBytes);
  if (status == IoStatus::Error) {
    log::debug("Read error on fd # {}", fd);
    onPeerClosed(state);
  } else if (status == IoStatus::PeerClosed) {
    log::debug("Peer closed fd # {}", fd);
    onPeerClosed(state);
  } else if (status == IoStatus::Done) {
    const auto now = SteadyClock::now();
    state.inBuffer.addSize(nbRead);
    state.flow.onBytesRead(nbRead);
    state.bytesRead += nbRead;
    _stats.totalBytesRead += nbRead;
    if (!state.messageInProgress && !state.headStart) {
      state.headStart = now;
    }
  }
  serviceFd(cnxIt);
}

void HttpServer::handleWritableClient(int fd) {
  const auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) [[unlikely]] {
    log::error("Received a writable event for fd # {} which is not a known connection", fd);
    return;
  }
  serviceFd(cnxIt);
}

void HttpServer::onPeerClosed(ConnectionState& state) {
  state.peerClosed = true;
  for (RequestCycle& cycle : state.cycles) {
    cycle.bridge->markDisconnected();
  }
  state.requestImmediateClose();
}

void HttpServer::markDirty(ConnectionState& state) { _dirtyFds.push_back(state.fd()); }

void HttpServer::serviceDirtyConnections() {
  _servicedFds.swap(_dirtyFds);
  for (int fd : _servicedFds) {
    const auto cnxIt = _connections.find(fd);
    // may have been closed meanwhile (or marked several times)
    if (cnxIt != _connections.end()) {
      serviceFd(cnxIt);
    }
  }
  _servicedFds.clear();
}

void HttpServer::serviceFd(ConnectionMap::iterator cnxIt) {
  serviceConnection(*cnxIt->second);
  if (shouldClose(*cnxIt->second)) {
    closeConnection(cnxIt);
  }
}

// Moves the connection forward as far as possible with the data at hand. Never closes it (callers do).
void HttpServer::serviceConnection(ConnectionState& state) {
  if (state.closeMode == ConnectionState::CloseMode::Immediate) {
    return;
  }
  retireCompletedCycles(state);
  parseInput(state);
  startNextHandler(state);
  flushOutbound(state);
  if (state.closeMode == ConnectionState::CloseMode::Immediate) {
    return;
  }
  applyReadBackpressure(state);
  updateInterest(state);
}

void HttpServer::parseInput(ConnectionState& state) {
  while (state.closeMode == ConnectionState::CloseMode::None) {
    if (!state.messageInProgress) {
      // pipelining gate: a new head is parsed only if its response may be queued
      if (state.inBuffer.empty() || state.gracefulCloseRequested || state.cycles.size() >= _config.pipelineDepth) {
        break;
      }
    }

    http::WireEvent event = state.codec->parseNextEvent(state.inBuffer);
    const auto now = SteadyClock::now();

    switch (event.kind) {
      case http::WireEventKind::NeedData:
        Consume(state, event.consumed);
        return;
      case http::WireEventKind::RequestHead: {
        Consume(state, event.consumed);
        state.headStart.reset();
        state.messageInProgress = true;
        if (event.head.hasContentLength && event.head.contentLength > _config.maxBodyBytes) {
          log::warn("Request body of {} bytes exceeds the limit of {} bytes", event.head.contentLength,
                    _config.maxBodyBytes);
          if (state.cycles.empty()) {
            emitEngineResponse(state, http::StatusCodePayloadTooLarge, {});
          } else {
            state.requestDrainAndClose();
          }
          return;
        }
        auto bridge = makeBridge(state, event.head);
        state.cycles.push_back(RequestCycle{std::move(bridge), now});
        break;
      }
      case http::WireEventKind::BodyChunk: {
        const std::size_t bodySize = event.body.size();
        if (state.discardingBody || state.cycles.empty()) {
          Consume(state, event.consumed);
          break;
        }
        RequestCycle& cycle = state.cycles.back();
        if (cycle.bridge->nbBodyBytesReceived() + bodySize > _config.maxBodyBytes) {
          log::warn("Request body exceeds the limit of {} bytes", _config.maxBodyBytes);
          Consume(state, event.consumed);
          failRequest(state, http::StatusCodePayloadTooLarge, {});
          return;
        }
        // body bytes stay accounted as unconsumed until the handler receives them
        cycle.bridge->appendBody(event.body);
        cycle.lastBodyRead = now;
        state.inBuffer.erase_front(event.consumed);
        state.flow.onBytesConsumed(event.consumed - bodySize);
        break;
      }
      case http::WireEventKind::MessageComplete:
        Consume(state, event.consumed);
        state.messageInProgress = false;
        if (state.discardingBody) {
          state.discardingBody = false;
        } else if (!state.cycles.empty()) {
          state.cycles.back().bridge->markMessageComplete();
        }
        break;
      case http::WireEventKind::ParseError: {
        ++_stats.parseErrors;
        log::warn("Invalid HTTP request received on fd # {}: {}", state.fd(), event.errorReason);
        const std::string_view body =
            event.errorStatus == http::StatusCodeBadRequest ? "Invalid HTTP request received." : std::string_view{};
        if (state.messageInProgress && !state.discardingBody && !state.cycles.empty()) {
          failRequest(state, event.errorStatus, body);
        } else if (state.cycles.empty()) {
          emitEngineResponse(state, event.errorStatus, body);
        } else {
          // responses of earlier requests are still pending: they are completed before closing
          state.requestDrainAndClose();
        }
        return;
      }
    }
  }
}

void HttpServer::retireCompletedCycles(ConnectionState& state) {
  while (!state.cycles.empty()) {
    RequestCycle& front = state.cycles.front();
    RequestBridge& bridge = *front.bridge;
    const bool abandoned = bridge.disconnected() && !front.handlerStarted;
    if (!bridge.responseComplete() && !abandoned) {
      break;
    }
    if (!bridge.messageComplete() && state.messageInProgress && state.cycles.size() == 1) {
      // the rest of its body is read and dropped
      state.discardingBody = true;
    }
    const bool keepAlive = bridge.framing().keepAlive && !abandoned;
    state.flow.onBytesConsumed(bridge.detach());
    // a writer still parked on this response has been woken by detach()
    (void)state.flow.takeWritableWaiter(true);
    state.cycles.pop_front();
    state.lastActivity = SteadyClock::now();
    if (!state.messageInProgress && !state.inBuffer.empty()) {
      state.headStart = state.lastActivity;
    }

    if (!keepAlive) {
      state.requestDrainAndClose();
      for (RequestCycle& cycle : state.cycles) {
        DropCycle(state, cycle);
      }
      state.cycles.clear();
      break;
    }
  }
}

void HttpServer::startNextHandler(ConnectionState& state) {
  if (state.closeMode == ConnectionState::CloseMode::Immediate || state.cycles.empty()) {
    return;
  }
  RequestCycle& front = state.cycles.front();
  if (front.handlerStarted || front.bridge->responseComplete() || front.bridge->disconnected()) {
    return;
  }
  startHandler(state, front);
}

// Reading is only paused while a handler is expected to consume the buffered bytes, so that an incomplete request
// head never blocks the connection.
void HttpServer::applyReadBackpressure(ConnectionState& state) {
  const bool waitingForHandler = !state.cycles.empty();
  if (waitingForHandler && state.flow.shouldPauseReading()) {
    log::debug("Pausing reads on fd # {} ({} unconsumed bytes)", state.fd(), state.flow.unconsumed());
    state.flow.pauseReading();
    ++_stats.readPauseSignals;
  } else if (state.flow.readPaused() && (!waitingForHandler || state.flow.shouldResumeReading())) {
    log::debug("Resuming reads on fd # {} ({} unconsumed bytes)", state.fd(), state.flow.unconsumed());
    state.flow.resumeReading();
    ++_stats.readResumeSignals;
  }
}

void HttpServer::flushOutbound(ConnectionState& state) {
  while (!state.outBuffer.empty()) {
    const auto [written, status] = state.transport.write(state.outBuffer);
    if (written != 0) {
      state.outBuffer.erase_front(written);
      state.flow.onBytesFlushed(written);
      state.bytesWritten += written;
      _stats.totalBytesWritten += written;
    }
    if (status == IoStatus::Error) {
      log::debug("Write error on fd # {}", state.fd());
      onPeerClosed(state);
      return;
    }
    if (status == IoStatus::WouldBlock) {
      break;
    }
  }
  if (state.flow.hasWritableWaiter() && state.flow.takeWritableWaiter() && !state.cycles.empty()) {
    if (internal::HandlerUnit* unit = state.cycles.front().bridge->unit()) {
      _supervisor.wake(unit->id, internal::HandlerUnit::Wait::Writable);
    }
  }
}

void HttpServer::updateInterest(ConnectionState& state) {
  EventBmp desired = EventRdHup;
  if (!state.flow.readPaused() && state.closeMode == ConnectionState::CloseMode::None) {
    desired |= EventIn;
  }
  if (!state.outBuffer.empty()) {
    desired |= EventOut;
  }
  if (desired == state.registeredEvents) {
    return;
  }
  if (_eventLoop.mod(EventLoop::EventFd{state.fd(), desired})) {
    state.registeredEvents = desired;
  } else {
    state.requestImmediateClose();
  }
}

void HttpServer::emitEngineResponse(ConnectionState& state, http::StatusCode status, std::string_view body) {
  const auto sizeBefore = state.outBuffer.size();
  http::AppendSimpleResponse(status, body, _config.serverHeader, currentDate(), state.outBuffer);
  state.flow.onBytesQueuedForWrite(static_cast<std::size_t>(state.outBuffer.size() - sizeBefore));
  state.requestDrainAndClose();
}

// Gives up on the request whose message is being read.
void HttpServer::failRequest(ConnectionState& state, http::StatusCode status, std::string_view body) {
  RequestBridge& bridge = *state.cycles.back().bridge;
  if (bridge.responseStarted()) {
    bridge.markDisconnected();
    state.requestImmediateClose();
    return;
  }
  if (state.cycles.size() == 1) {
    bridge.respondWithError(status, body);
  }
  bridge.markDisconnected();
  state.requestDrainAndClose();
}

bool HttpServer::shouldClose(const ConnectionState& state) const noexcept {
  switch (state.closeMode) {
    case ConnectionState::CloseMode::Immediate:
      return true;
    case ConnectionState::CloseMode::DrainThenClose:
      return state.cycles.empty() && state.outBuffer.empty();
    default:
      break;
  }
  return state.peerClosed ||
         (state.gracefulCloseRequested && state.cycles.empty() && state.outBuffer.empty());
}

HttpServer::ConnectionMap::iterator HttpServer::closeConnection(ConnectionMap::iterator cnxIt) {
  const int cfd = cnxIt->first;
  ConnectionState& state = *cnxIt->second;
  for (RequestCycle& cycle : state.cycles) {
    DropCycle(state, cycle);
  }
  state.cycles.clear();
  (void)state.flow.releaseAll();
  state.closed = true;
  _eventLoop.del(cfd);
  log::debug("Closing connection fd # {} ({} request(s) served)", cfd, state.requestsServed);
  return _connections.erase(cnxIt);
}

void HttpServer::closeAllConnections() {
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt = closeConnection(cnxIt);
  }
  _dirtyFds.clear();
}

void HttpServer::sweepIdleConnections() {
  // Periodic maintenance of live connections: timeouts have to be checked by the clock because a stalled peer
  // produces no event at all.
  const auto now = SteadyClock::now();
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    ConnectionState& state = *cnxIt->second;

    if (shouldClose(state)) {
      cnxIt = closeConnection(cnxIt);
      continue;
    }

    const bool betweenRequests = state.cycles.empty() && !state.messageInProgress && state.outBuffer.empty() &&
                                 state.closeMode == ConnectionState::CloseMode::None;
    if (betweenRequests) {
      if (state.headStart) {
        if (_config.headerReadTimeout.count() > 0 && now > *state.headStart + _config.headerReadTimeout) {
          log::warn("Request head read timeout on fd # {}", state.fd());
          emitEngineResponse(state, http::StatusCodeRequestTimeout, {});
          markDirty(state);
        }
      } else if (now > state.lastActivity + _config.keepAliveTimeout) {
        log::debug("Keep-alive timeout on fd # {}", state.fd());
        cnxIt = closeConnection(cnxIt);
        continue;
      }
    } else if (_config.bodyReadTimeout.count() > 0 && state.messageInProgress && !state.discardingBody &&
               !state.cycles.empty() && !state.flow.readPaused() &&
               state.closeMode == ConnectionState::CloseMode::None &&
               now > state.cycles.back().lastBodyRead + _config.bodyReadTimeout) {
      log::warn("Request body read timeout on fd # {}", state.fd());
      failRequest(state, http::StatusCodeRequestTimeout, {});
      markDirty(state);
    }
    ++cnxIt;
  }
}

}  // namespace portico
