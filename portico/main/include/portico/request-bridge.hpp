#pragma once

#include <coroutine>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "portico/events.hpp"
#include "portico/http-status-code.hpp"
#include "portico/scope.hpp"
#include "portico/wire-codec.hpp"

namespace portico {

namespace internal {
class BridgeHost;
struct ConnectionState;
struct HandlerUnit;
}  // namespace internal

// Glue between one request of a connection and the handler answering it.
// It buffers the request body produced by the connection until the handler receives it, validates and encodes the
// response events emitted by the handler, and tells the connection when the response is complete.
// The bridge never outlives its request on the connection side: once detached, receive() reports a disconnect and
// send() becomes a no-op.
class RequestBridge {
 public:
  struct RequestInfo {
    bool expectContinue{false};
  };

  RequestBridge(internal::BridgeHost& host, internal::ConnectionState& connection, Scope scope,
                http::ResponseFraming framing, RequestInfo info);

  RequestBridge(const RequestBridge&) = delete;
  RequestBridge(RequestBridge&&) = delete;
  RequestBridge& operator=(const RequestBridge&) = delete;
  RequestBridge& operator=(RequestBridge&&) = delete;

  ~RequestBridge() = default;

  // ---- connection side ----

  void appendBody(std::string_view body);

  void markMessageComplete();

  // The peer went away (or the engine gave up on this request): receive() returns Disconnect and send() is a no-op.
  void markDisconnected();

  // Stops referencing the connection. Returns the number of buffered body bytes that will never be delivered.
  std::size_t detach() noexcept;

  // ---- handler side ----

  // Whether takeReceiveEvent() would return an event without waiting.
  [[nodiscard]] bool receiveReady() const noexcept;

  // Returns all buffered body bytes as one event, or a Disconnect event once the peer disconnected or the response
  // is complete. Repeated calls after a Disconnect keep returning Disconnect.
  ReceiveEvent takeReceiveEvent();

  // Writes the interim '100 Continue' response the first time the handler asks for a body announced with
  // 'Expect: 100-continue', unless the response already started.
  void sendContinueIfNeeded();

  // Validates and encodes 'event'. Throws ProtocolViolation on ordering or framing errors.
  // A no-op after the peer disconnected.
  void send(const SendEvent& event);

  // Whether the connection accepts more response bytes without exceeding its write high watermark.
  [[nodiscard]] bool writable() const noexcept;

  // Parks 'handle' until the connection drains below its write high watermark.
  void suspendUntilWritable(std::coroutine_handle<> handle);

  // ---- supervisor side ----

  void attachUnit(internal::HandlerUnit* unit) noexcept { _unit = unit; }

  [[nodiscard]] internal::HandlerUnit* unit() const noexcept { return _unit; }

  [[nodiscard]] bool cancelled() const noexcept;

  // Answers 500 if the response did not start yet, aborts the connection if it is partially sent.
  void failWithInternalError();

  // Writes a complete engine response closing the connection, unless the response already started.
  void respondWithError(http::StatusCode status, std::string_view body);

  // The connection will not be reused: a response not started yet announces 'connection: close'.
  void disableKeepAlive() noexcept {
    if (!_framing.started) {
      _framing.keepAlive = false;
    }
  }

  // Closes the connection without completing the response.
  void abort();

  void handlerFinished();

  // ---- state ----

  [[nodiscard]] const Scope& scope() const noexcept { return _scope; }

  [[nodiscard]] const http::ResponseFraming& framing() const noexcept { return _framing; }

  [[nodiscard]] bool responseStarted() const noexcept { return _framing.started; }

  [[nodiscard]] bool responseComplete() const noexcept { return _framing.complete; }

  [[nodiscard]] bool disconnected() const noexcept { return _disconnected; }

  [[nodiscard]] bool messageComplete() const noexcept { return _messageComplete; }

  [[nodiscard]] bool handlerDone() const noexcept { return _handlerDone; }

  [[nodiscard]] bool attached() const noexcept { return _connection != nullptr; }

  [[nodiscard]] std::size_t nbBodyBytesReceived() const noexcept { return _nbBodyBytesReceived; }

  [[nodiscard]] std::size_t nbPendingBodyBytes() const noexcept { return _pendingBody.size(); }

 private:
  void wakeReceiver() const;

  void wakeWriter() const;

  internal::BridgeHost& _host;
  internal::ConnectionState* _connection;
  internal::HandlerUnit* _unit{nullptr};
  Scope _scope;
  http::ResponseFraming _framing;
  std::string _pendingBody;
  std::size_t _nbBodyBytesReceived{0};
  bool _expectContinue;
  bool _continueSent{false};
  bool _messageComplete{false};
  bool _bodyDelivered{false};
  bool _disconnected{false};
  bool _handlerDone{false};
};

// receive() callable given to request handlers: 'auto event = co_await receive();'
class Receive {
 public:
  class Awaiter {
   public:
    explicit Awaiter(RequestBridge& bridge) noexcept : _bridge(bridge) {}

    bool await_ready();
    void await_suspend(std::coroutine_handle<> handle);
    ReceiveEvent await_resume();

   private:
    RequestBridge& _bridge;
  };

  explicit Receive(std::shared_ptr<RequestBridge> bridge) noexcept : _bridge(std::move(bridge)) {}

  [[nodiscard]] Awaiter operator()() const noexcept { return Awaiter{*_bridge}; }

 private:
  std::shared_ptr<RequestBridge> _bridge;
};

// send() callable given to request handlers: 'co_await send(SendEvent::Start(200, {...}));'
// It suspends the handler while the connection write buffer is above its high watermark.
class Send {
 public:
  class Awaiter {
   public:
    Awaiter(RequestBridge& bridge, SendEvent event) noexcept : _bridge(bridge), _event(std::move(event)) {}

    bool await_ready();
    void await_suspend(std::coroutine_handle<> handle);
    void await_resume() const;

   private:
    RequestBridge& _bridge;
    SendEvent _event;
  };

  explicit Send(std::shared_ptr<RequestBridge> bridge) noexcept : _bridge(std::move(bridge)) {}

  [[nodiscard]] Awaiter operator()(SendEvent event) const noexcept { return Awaiter{*_bridge, std::move(event)}; }

 private:
  std::shared_ptr<RequestBridge> _bridge;
};

}  // namespace portico
