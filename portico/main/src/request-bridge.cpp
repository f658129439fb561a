#include "portico/request-bridge.hpp"

#include <fmt/format.h>

#include <coroutine>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "portico/errors.hpp"
#include "portico/events.hpp"
#include "portico/http-status-code.hpp"
#include "portico/internal/bridge-host.hpp"
#include "portico/internal/connection-state.hpp"
#include "portico/internal/handler-supervisor.hpp"
#include "portico/internal/handler-unit.hpp"
#include "portico/log.hpp"
#include "portico/scope.hpp"
#include "portico/simple-response.hpp"
#include "portico/wire-codec.hpp"

namespace portico {

RequestBridge::RequestBridge(internal::BridgeHost& host, internal::ConnectionState& connection, Scope scope,
                             http::ResponseFraming framing, RequestInfo info)
    : _host(host),
      _connection(&connection),
      _scope(std::move(scope)),
      _framing(framing),
      _expectContinue(info.expectContinue) {}

void RequestBridge::appendBody(std::string_view body) {
  _pendingBody.append(body);
  _nbBodyBytesReceived += body.size();
  wakeReceiver();
}

void RequestBridge::markMessageComplete() {
  _messageComplete = true;
  wakeReceiver();
}

void RequestBridge::markDisconnected() {
  _disconnected = true;
  wakeReceiver();
  wakeWriter();
}

std::size_t RequestBridge::detach() noexcept {
  const std::size_t nbUndelivered = _pendingBody.size();
  _pendingBody.clear();
  _connection = nullptr;
  wakeWriter();
  return nbUndelivered;
}

bool RequestBridge::receiveReady() const noexcept {
  return _disconnected || _framing.complete || _connection == nullptr ||
         (!_bodyDelivered && (!_pendingBody.empty() || _messageComplete));
}

ReceiveEvent RequestBridge::takeReceiveEvent() {
  if (_disconnected || _framing.complete || _connection == nullptr || _bodyDelivered) {
    return ReceiveEvent::Disconnect();
  }
  ReceiveEvent event;
  event.body = std::move(_pendingBody);
  _pendingBody.clear();
  event.moreBody = !_messageComplete;
  _bodyDelivered = _messageComplete;
  if (!event.body.empty()) {
    _host.onBodyConsumed(*_connection, event.body.size());
  }
  return event;
}

void RequestBridge::sendContinueIfNeeded() {
  if (!_expectContinue || _continueSent || _framing.started || _disconnected || _connection == nullptr) {
    return;
  }
  _continueSent = true;
  RawChars& out = _connection->outBuffer;
  const auto sizeBefore = out.size();
  _connection->codec->encodeContinue(out);
  _host.queueResponseBytes(*_connection, static_cast<std::size_t>(out.size() - sizeBefore));
}

void RequestBridge::send(const SendEvent& event) {
  if (_disconnected) {
    return;
  }
  if (_connection == nullptr) {
    if (_framing.complete) {
      throw ProtocolViolation(
          fmt::format("Unexpected '{}' event after response completed", SendEventTypeName(event.type)));
    }
    return;
  }
  if (event.type == SendEvent::Type::Disconnect) {
    abort();
    return;
  }
  if (event.type == SendEvent::Type::ResponseStart && !_framing.started) {
    // The client may still send the announced body after the response: it cannot be parsed reliably.
    if (_expectContinue && !_continueSent) {
      _framing.keepAlive = false;
    }
    _framing.date = _host.currentDate();
  }

  RawChars& out = _connection->outBuffer;
  const auto sizeBefore = out.size();
  _connection->codec->encodeResponseEvent(event, _framing, out);
  _host.queueResponseBytes(*_connection, static_cast<std::size_t>(out.size() - sizeBefore));
  if (_framing.complete) {
    _host.onResponseComplete(*_connection, *this);
  }
}

bool RequestBridge::writable() const noexcept {
  return _connection == nullptr || _disconnected || _connection->flow.isWritable();
}

void RequestBridge::suspendUntilWritable(std::coroutine_handle<> handle) {
  _connection->flow.setWritableWaiter(handle);
  _unit->supervisor->suspend(*_unit, handle, internal::HandlerUnit::Wait::Writable);
}

bool RequestBridge::cancelled() const noexcept { return _unit != nullptr && _unit->cancelled; }

void RequestBridge::failWithInternalError() {
  if (_framing.started) {
    if (!_framing.complete) {
      abort();
    }
    return;
  }
  respondWithError(http::StatusCodeInternalServerError, {});
}

void RequestBridge::respondWithError(http::StatusCode status, std::string_view body) {
  if (_framing.started || _disconnected || _connection == nullptr) {
    return;
  }
  RawChars& out = _connection->outBuffer;
  const auto sizeBefore = out.size();
  http::AppendSimpleResponse(status, body, _framing.serverHeader, _host.currentDate(), out);
  _framing.status = status;
  _framing.started = true;
  _framing.complete = true;
  _framing.keepAlive = false;
  _host.queueResponseBytes(*_connection, static_cast<std::size_t>(out.size() - sizeBefore));
  _host.onResponseComplete(*_connection, *this);
}

void RequestBridge::abort() {
  if (_connection != nullptr && !_disconnected) {
    _host.abortConnection(*_connection);
  }
  _disconnected = true;
}

void RequestBridge::handlerFinished() {
  _handlerDone = true;
  _host.onHandlerFinished(_connection, *this);
}

void RequestBridge::wakeReceiver() const {
  if (_unit != nullptr) {
    _unit->supervisor->wake(_unit->id, internal::HandlerUnit::Wait::Receive);
  }
}

void RequestBridge::wakeWriter() const {
  if (_unit != nullptr) {
    _unit->supervisor->wake(_unit->id, internal::HandlerUnit::Wait::Writable);
  }
}

bool Receive::Awaiter::await_ready() {
  if (_bridge.cancelled()) {
    return true;
  }
  _bridge.sendContinueIfNeeded();
  return _bridge.receiveReady() || _bridge.unit() == nullptr;
}

void Receive::Awaiter::await_suspend(std::coroutine_handle<> handle) {
  internal::HandlerUnit* unit = _bridge.unit();
  unit->supervisor->suspend(*unit, handle, internal::HandlerUnit::Wait::Receive);
}

ReceiveEvent Receive::Awaiter::await_resume() {
  if (_bridge.cancelled()) {
    throw RequestCancelled();
  }
  return _bridge.takeReceiveEvent();
}

bool Send::Awaiter::await_ready() {
  if (_bridge.cancelled()) {
    return true;
  }
  _bridge.send(_event);
  return _bridge.writable() || _bridge.unit() == nullptr;
}

void Send::Awaiter::await_suspend(std::coroutine_handle<> handle) { _bridge.suspendUntilWritable(handle); }

void Send::Awaiter::await_resume() const {
  if (_bridge.cancelled()) {
    throw RequestCancelled();
  }
}

}  // namespace portico
