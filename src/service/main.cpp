#include "config.hpp"
#include "constants.hpp"
#include "logger.hpp"
#include "opencv_face_embedder.hpp"
#include "protocol.hpp"
#include "transport.hpp"
#include "verification_service.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <string>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

using namespace faceverify;
namespace fs = std::filesystem;

// Global shutdown flag
std::atomic<bool> g_running(true);

void signal_handler(int) { g_running = false; }

void handle_client(int client_fd, VerificationService &service,
                   const ServiceConfig &config) {
  if (!set_socket_timeouts(client_fd, config.read_timeout_ms)) {
    Logger::log(LogLevel::WARN, std::string("Cannot set client timeouts: ") +
                                    std::strerror(errno));
  }

  std::string request;
  std::string response;

  switch (read_request(client_fd, config.max_request_bytes,
                       config.read_timeout_ms, request)) {
  case ReadStatus::OK:
    Logger::log(LogLevel::DEBUG,
                "Received request (" + std::to_string(request.size()) +
                    " bytes)");
    try {
      response = handleRequestText(service, request);
    } catch (const std::exception &e) {
      Logger::log(LogLevel::ERROR,
                  std::string("Exception handling request: ") + e.what());
      response = errorResponse(ErrorKind::MODEL, "internal error").dump();
    }
    break;
  case ReadStatus::TOO_LARGE:
    Logger::log(LogLevel::WARN, "Request dropped: exceeded " +
                                    std::to_string(config.max_request_bytes) +
                                    " bytes");
    if (!drain_input(client_fd, config.max_request_bytes,
                     config.read_timeout_ms)) {
      Logger::log(LogLevel::DEBUG, "Oversized request not fully drained.");
    }
    response = errorResponse(ErrorKind::BAD_REQUEST, "request too large").dump();
    break;
  case ReadStatus::TIMEOUT:
    Logger::log(LogLevel::WARN,
                "Request dropped: client stalled for more than " +
                    std::to_string(config.read_timeout_ms) + " ms");
    response = errorResponse(ErrorKind::BAD_REQUEST, "request timed out").dump();
    break;
  case ReadStatus::FAILED:
    Logger::log(LogLevel::WARN,
                std::string("Request dropped: read failed: ") +
                    std::strerror(errno));
    close(client_fd);
    return;
  }

  if (!write_all(client_fd, response)) {
    Logger::log(LogLevel::WARN, "Client went away before reply was sent.");
  }
  close(client_fd);
}

int main(int argc, char *argv[]) {
  signal(SIGINT, signal_handler);
  signal(SIGTERM, signal_handler);

  // Config path: explicit argument, system path, then local file
  std::string config_path = CONFIG_PATH;
  if (argc > 1) {
    config_path = argv[1];
  } else if (!fs::exists(config_path)) {
    config_path = "config.ini";
  }

  Logger::log(LogLevel::INFO, "Starting faceverify service...");
  Logger::log(LogLevel::INFO, "Loading Config: " + config_path);

  ServiceConfig config;
  if (!loadConfig(config_path, config)) {
    Logger::log(LogLevel::ERROR, "Invalid configuration. Exiting.");
    return 1;
  }
  Logger::setLevel(config.log_level);
  Logger::setLogFile(config.log_file);

  // Built once, shared read-only by every request
  OpenCVFaceEmbedder embedder(config);
  if (!embedder.init()) {
    Logger::log(LogLevel::ERROR, "Failed to load face models. Exiting.");
    return 1;
  }
  VerificationService service(embedder, config.threshold, config.epsilon);

  fs::path p(config.socket_path);
  if (p.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
      Logger::log(LogLevel::ERROR, "Cannot create " +
                                       p.parent_path().string() + ": " +
                                       ec.message());
      return 1;
    }
  }

  int server_fd = socket(AF_UNIX, SOCK_STREAM, 0);
  if (server_fd < 0) {
    Logger::log(LogLevel::ERROR,
                std::string("socket failed: ") + std::strerror(errno));
    return 1;
  }

  struct sockaddr_un address;
  std::memset(&address, 0, sizeof(address));
  address.sun_family = AF_UNIX;
  std::strncpy(address.sun_path, config.socket_path.c_str(),
               sizeof(address.sun_path) - 1);

  unlink(config.socket_path.c_str()); // Remove old socket
  if (bind(server_fd, (struct sockaddr *)&address, sizeof(address)) < 0) {
    Logger::log(LogLevel::ERROR,
                std::string("bind failed: ") + std::strerror(errno));
    close(server_fd);
    return 1;
  }

  // World-accessible socket so unprivileged clients can verify
  chmod(config.socket_path.c_str(), 0666);

  if (listen(server_fd, 16) < 0) {
    Logger::log(LogLevel::ERROR,
                std::string("listen failed: ") + std::strerror(errno));
    close(server_fd);
    return 1;
  }

  Logger::log(LogLevel::INFO, "Listening on " + config.socket_path +
                                  " (model: " + service.modelId() + ")");

  while (g_running) {
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(server_fd, &readfds);

    // Timeout for select to allow checking g_running
    struct timeval timeout;
    timeout.tv_sec = 1;
    timeout.tv_usec = 0;

    int activity = select(server_fd + 1, &readfds, NULL, NULL, &timeout);
    if (activity < 0 && errno != EINTR) {
      Logger::log(LogLevel::ERROR,
                  std::string("select failed: ") + std::strerror(errno));
      break;
    }

    if (g_running && activity > 0 && FD_ISSET(server_fd, &readfds)) {
      int client_fd = accept(server_fd, NULL, NULL);
      if (client_fd >= 0) {
        // Requests are served one at a time
        handle_client(client_fd, service, config);
      }
    }
  }

  close(server_fd);
  unlink(config.socket_path.c_str());
  Logger::log(LogLevel::INFO, "Stopped.");
  return 0;
}
