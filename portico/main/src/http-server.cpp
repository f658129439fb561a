#include "portico/http-server.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "portico/event-loop.hpp"
#include "portico/http-constants.hpp"
#include "portico/http-header.hpp"
#include "portico/internal/connection-state.hpp"
#include "portico/log.hpp"
#include "portico/request-bridge.hpp"
#include "portico/scope.hpp"
#include "portico/string-equal-ignore-case.hpp"
#include "portico/string-trim.hpp"
#include "portico/timedef.hpp"
#include "portico/timestring.hpp"
#include "portico/url-decode.hpp"
#include "portico/wire-codec.hpp"

namespace portico {

namespace {

// Upper bound of handler steps / connection services chained without polling, so that a handler yielding in a loop
// cannot starve socket events.
constexpr int kMaxHandlerRoundsPerIteration = 16;

// Origin-form part of an absolute-form target ('http://host:port/path?q' -> '/path?q').
std::string_view OriginForm(std::string_view target) {
  std::size_t schemeLen = 0;
  if (StartsWithCaseInsensitive(target, "http://")) {
    schemeLen = 7;
  } else if (StartsWithCaseInsensitive(target, "https://")) {
    schemeLen = 8;
  } else {
    return target;
  }
  const auto pathPos = target.find_first_of("/?", schemeLen);
  if (pathPos == std::string_view::npos || target[pathPos] == '?') {
    return "/";
  }
  return target.substr(pathPos);
}

std::string_view FirstListElement(std::string_view value) {
  return TrimOws(value.substr(0, value.find(',')));
}

}  // namespace

void HttpServer::eventLoop() {
  updatePollTimeout();

  const auto polled = _eventLoop.poll();

  bool maintenanceTick = false;

  if (!polled) [[unlikely]] {
    log::error("Event loop poll failure, forcing shutdown");
    beginGracefulShutdown();
    forceCloseEverything();
    return;
  }
  for (auto event : *polled) {
    const int fd = event.fd;
    if (fd == _listenSocket.fd()) {
      acceptNewConnections();
    } else if (fd == _lifecycle.wakeupFd.fd()) {
      _lifecycle.wakeupFd.consume();
    } else if (fd == _maintenanceTimer.fd()) {
      _maintenanceTimer.drain();
      maintenanceTick = true;
    } else {
      const auto bmp = event.eventBmp;
      if ((bmp & EventOut) != 0) {
        handleWritableClient(fd);
      }
      // EPOLLERR/EPOLLHUP/EPOLLRDHUP can be delivered without EPOLLIN.
      if ((bmp & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
        handleReadableClient(fd, bmp);
      }
    }
  }

  refreshDate();
  if (maintenanceTick || polled->empty()) {
    sweepIdleConnections();
  }

  runHandlers();
}

void HttpServer::runHandlers() {
  for (int round = 0; round < kMaxHandlerRoundsPerIteration; ++round) {
    _supervisor.runReady(SteadyClock::now());
    serviceDirtyConnections();
    if (!_supervisor.hasReady() && _dirtyFds.empty()) {
      break;
    }
  }
}

void HttpServer::updatePollTimeout() {
  std::chrono::milliseconds timeout = _config.pollInterval;
  if (_supervisor.hasReady() || !_dirtyFds.empty()) {
    timeout = std::chrono::milliseconds{0};
  } else if (const auto deadline = _supervisor.nextDeadline()) {
    // rounded up so that the timer is expired when epoll_wait returns
    const auto untilDeadline = std::chrono::ceil<std::chrono::milliseconds>(*deadline - SteadyClock::now());
    timeout = std::clamp(untilDeadline, std::chrono::milliseconds{0}, timeout);
  }
  _eventLoop.updatePollTimeout(timeout);
}

void HttpServer::refreshDate() {
  const auto now = SysClock::now();
  const auto second = std::chrono::floor<std::chrono::seconds>(now);
  if (second != _dateSecond) {
    _dateSecond = second;
    TimeToStringRFC7231(now, _date.data());
  }
}

std::string_view HttpServer::currentDate() const noexcept {
  if (!_config.dateHeader) {
    return {};
  }
  return {_date.data(), _date.size()};
}

void HttpServer::startHandler(internal::ConnectionState& state, internal::RequestCycle& cycle) {
  cycle.handlerStarted = true;
  if (_config.limitConcurrency != 0 &&
      (_connections.size() > _config.limitConcurrency || _supervisor.nbRunning() >= _config.limitConcurrency)) {
    log::warn("Exceeded concurrency limit.");
    ++_stats.rejectedConcurrency;
    cycle.bridge->respondWithError(http::StatusCodeServiceUnavailable, {});
    cycle.bridge->markDisconnected();
    return;
  }
  log::trace("Starting request handler for fd # {}", state.fd());
  _supervisor.spawn(cycle.bridge, _handler);
}

std::shared_ptr<RequestBridge> HttpServer::makeBridge(internal::ConnectionState& state, http::RequestHead& head) {
  http::ResponseFraming framing;
  framing.requestVersion = head.version;
  framing.headRequest = head.method == http::HEAD;
  framing.keepAlive =
      head.keepAlive && _config.enableKeepAlive && !state.gracefulCloseRequested && !_lifecycle.isStopping();
  ++_nbRequestsAdmitted;
  if (_config.limitMaxRequests != 0 && _nbRequestsAdmitted >= _config.limitMaxRequests) {
    // the server stops after this response, the client should not reuse the connection
    framing.keepAlive = false;
  }
  framing.serverHeader = _config.serverHeader;
  if (!_config.defaultHeaders.empty()) {
    framing.defaultHeaders = &_config.defaultHeaders;
  }

  Scope scope;
  fillScope(state, head, scope);

  return std::make_shared<RequestBridge>(static_cast<internal::BridgeHost&>(*this), state, std::move(scope), framing,
                                         RequestBridge::RequestInfo{head.expectContinue});
}

void HttpServer::fillScope(const internal::ConnectionState& state, http::RequestHead& head, Scope& scope) const {
  scope.httpVersion = head.version;
  scope.method = std::move(head.method);
  scope.rootPath = _config.rootPath;

  const std::string_view target = OriginForm(head.target);
  const auto queryPos = target.find('?');
  const std::string_view rawPath = target.substr(0, queryPos);
  if (queryPos != std::string_view::npos) {
    scope.queryString.assign(target.substr(queryPos + 1));
  }
  scope.rawPath.reserve(_config.rootPath.size() + rawPath.size());
  scope.rawPath.append(_config.rootPath).append(rawPath);
  scope.path = _config.rootPath;
  scope.path.append(url::DecodePath(rawPath));

  scope.headers = std::move(head.headers);
  scope.client = state.client;
  scope.server = state.server;
  scope.state = state.state;

  if (!_config.proxyHeaders || !state.client) {
    return;
  }
  const auto& allowed = _config.forwardedAllowIps;
  const bool trusted = std::ranges::any_of(
      allowed, [&state](const std::string& ip) { return ip == "*" || ip == state.client->host; });
  if (!trusted) {
    return;
  }
  if (const http::Header* proto = http::FindHeader(scope.headers, http::XForwardedProto)) {
    const auto scheme = FirstListElement(proto->value);
    if (!scheme.empty()) {
      scope.scheme = ToLower(scheme);
    }
  }
  if (const http::Header* forwardedFor = http::FindHeader(scope.headers, http::XForwardedFor)) {
    const auto host = FirstListElement(forwardedFor->value);
    if (!host.empty()) {
      scope.client = Scope::Address{std::string(host), 0};
    }
  }
}

void HttpServer::logAccess(const RequestBridge& bridge) const {
  if (!_config.accessLog) {
    return;
  }
  const Scope& scope = bridge.scope();
  std::string client = "-";
  if (scope.client) {
    client = scope.client->port == 0 ? scope.client->host
                                     : std::string(scope.client->host) + ':' + std::to_string(scope.client->port);
  }
  log::info("{} - \"{} {}{}{} HTTP/{}\" {}", client, scope.method, scope.rawPath, scope.queryString.empty() ? "" : "?",
            scope.queryString, scope.httpVersionNumber(), bridge.framing().status);
}

// ---- BridgeHost ----

void HttpServer::queueResponseBytes(internal::ConnectionState& connection, std::size_t nbBytes) {
  connection.flow.onBytesQueuedForWrite(nbBytes);
  markDirty(connection);
}

void HttpServer::onResponseComplete(internal::ConnectionState& connection, const RequestBridge& bridge) {
  ++_stats.totalRequestsServed;
  ++connection.requestsServed;
  logAccess(bridge);
  markDirty(connection);
  if (_config.limitMaxRequests != 0 && _stats.totalRequestsServed >= _config.limitMaxRequests &&
      !_maxRequestsReached) {
    _maxRequestsReached = true;
    log::warn("Maximum request limit of {} exceeded. Terminating process.", _config.limitMaxRequests);
    // served by the event loop, never from inside a handler step
    _lifecycle.requestGracefulShutdown();
  }
}

void HttpServer::onBodyConsumed(internal::ConnectionState& connection, std::size_t nbBytes) {
  connection.flow.onBytesConsumed(nbBytes);
  markDirty(connection);
}

void HttpServer::abortConnection(internal::ConnectionState& connection) {
  connection.requestImmediateClose();
  markDirty(connection);
}

void HttpServer::onHandlerFinished(internal::ConnectionState* connection, [[maybe_unused]] RequestBridge& bridge) {
  if (connection != nullptr) {
    markDirty(*connection);
  }
}

}  // namespace portico
