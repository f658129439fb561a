#include <portico/portico.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using namespace portico;

namespace {

RequestTask<void> Hello(const Scope& scope, Receive receive, Send send) {
  // the request body is drained and ignored
  for (ReceiveEvent event = co_await receive(); !event.isDisconnect() && event.moreBody;) {
    event = co_await receive();
  }

  std::string body = "Hello from portico minimal server! You requested ";
  body.append(scope.path);
  body.append("\nMethod: ").append(scope.method);
  body.append("\nVersion: ").append(scope.httpVersionNumber());
  body.append("\nHeaders:\n");
  for (const auto& [name, value] : scope.headers) {
    body.append(name).append(": ").append(value).append("\n");
  }

  const SendEvent start = SendEvent::Start(http::StatusCodeOK, {{"content-type", "text/plain"},
                                                                {"content-length", std::to_string(body.size())}});
  co_await send(start);
  co_await send(SendEvent::Body(body));
}

}  // namespace

int main(int argc, char** argv) {
  uint16_t port = 0;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  try {
    // SIGINT / SIGTERM begin a graceful shutdown, a second one forces it
    HttpServer server(ServerConfig{}.withPort(port).withSignalHandlers(), MakeRequestHandler(Hello));
    server.run();
  } catch (const std::exception& e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
