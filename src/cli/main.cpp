#include "codec.hpp"
#include "constants.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

std::string socket_path() {
  const char *env = std::getenv("FACEVERIFY_SOCKET");
  if (env && strlen(env) > 0) {
    return env;
  }
  return faceverify::SOCKET_PATH;
}

// Sends one request, half-closes, and reads the reply until EOF.
std::string send_request(const json &request) {
  const std::string path = socket_path();
  int sock = socket(AF_UNIX, SOCK_STREAM, 0);
  if (sock < 0) {
    std::cerr << "Error creating socket." << std::endl;
    return "";
  }

  struct sockaddr_un addr;
  memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

  if (connect(sock, (struct sockaddr *)&addr, sizeof(addr)) == -1) {
    std::cerr << "Could not connect to service at " << path
              << ". Is faceverifyd running?" << std::endl;
    close(sock);
    return "";
  }

  const std::string payload = request.dump();
  std::size_t sent = 0;
  while (sent < payload.size()) {
    ssize_t n = send(sock, payload.data() + sent, payload.size() - sent, 0);
    if (n <= 0) {
      std::cerr << "Error sending request." << std::endl;
      close(sock);
      return "";
    }
    sent += static_cast<std::size_t>(n);
  }
  shutdown(sock, SHUT_WR);

  std::string response;
  char buffer[4096];
  ssize_t bytes_read;
  while ((bytes_read = read(sock, buffer, sizeof(buffer))) > 0) {
    response.append(buffer, static_cast<std::size_t>(bytes_read));
  }
  close(sock);
  return response;
}

// Returns the reply object, or nullopt after printing why there is none.
std::optional<json> call(const json &request) {
  std::string resp = send_request(request);
  if (resp.empty()) {
    std::cerr << "Error: Connection closed by service (empty response)."
              << std::endl;
    return std::nullopt;
  }
  json reply = json::parse(resp, nullptr, false);
  if (reply.is_discarded()) {
    std::cerr << "Error: Malformed response: " << resp << std::endl;
    return std::nullopt;
  }
  if (reply.contains("error")) {
    std::cerr << "Error (" << reply["error"].get<std::string>()
              << "): " << reply.value("detail", "") << std::endl;
    return std::nullopt;
  }
  return reply;
}

bool read_file(const std::string &path, std::string &out) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open())
    return false;
  out.assign(std::istreambuf_iterator<char>(f),
             std::istreambuf_iterator<char>());
  return true;
}

// Image file -> base64 payload
bool load_image(const std::string &path, std::string &out) {
  std::string bytes;
  if (!read_file(path, bytes)) {
    std::cerr << "Cannot read image " << path << std::endl;
    return false;
  }
  out = faceverify::base64Encode(
      std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
  return true;
}

// A template argument is either a file holding the string or the string.
std::string load_template(const std::string &arg) {
  std::error_code ec;
  if (fs::is_regular_file(arg, ec)) {
    std::string text;
    if (read_file(arg, text)) {
      text.erase(text.find_last_not_of(" \t\r\n") + 1);
      return text;
    }
  }
  return arg;
}

void print_help() {
  std::cout
#ifdef FACEVERIFY_VERSION
      << "faceverify CLI Tool v" << FACEVERIFY_VERSION << "\n"
#else
      << "faceverify CLI Tool vUnknown\n"
#endif
      << "Usage:\n"
      << "  faceverify embed <image>                       Print face "
         "template\n"
      << "  faceverify verify <image> <template>... [--threshold X]\n"
      << "                                                 Compare against "
         "templates\n"
      << "  faceverify health                              Check service\n"
      << "  faceverify version                             Show versions\n"
      << "  faceverify help                                Show this help\n"
      << "Templates may be given inline or as files. Exit status of verify:\n"
      << "0 match, 2 no match, 1 error.\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cout << "Usage: faceverify <embed|verify|health|version|help> [args]"
              << std::endl;
    return 1;
  }

  std::string op = argv[1];

  if (op == "embed") {
    if (argc < 3) {
      std::cout << "Usage: faceverify embed <image>" << std::endl;
      return 1;
    }
    std::string image;
    if (!load_image(argv[2], image))
      return 1;

    auto reply = call({{"op", "embed"}, {"image_base64", image}});
    if (!reply)
      return 1;
    std::cerr << "Model: " << reply->value("model", "") << std::endl;
    std::cout << reply->value("embedding_b64", "") << std::endl;

  } else if (op == "verify") {
    std::string image_path;
    std::vector<std::string> templates;
    std::optional<double> threshold;

    for (int i = 2; i < argc; i++) {
      std::string arg = argv[i];
      if (arg == "--threshold" && i + 1 < argc) {
        try {
          threshold = std::stod(argv[++i]);
        } catch (const std::logic_error &) {
          std::cerr << "Invalid threshold: " << argv[i] << std::endl;
          return 1;
        }
      } else if (image_path.empty()) {
        image_path = arg;
      } else {
        templates.push_back(load_template(arg));
      }
    }
    if (image_path.empty()) {
      std::cout << "Usage: faceverify verify <image> <template>... "
                   "[--threshold X]"
                << std::endl;
      return 1;
    }

    std::string image;
    if (!load_image(image_path, image))
      return 1;

    json request = {{"op", "verify"},
                    {"image_base64", image},
                    {"templates_b64", templates}};
    if (threshold)
      request["threshold"] = *threshold;

    auto reply = call(request);
    if (!reply)
      return 1;

    bool match = reply->value("match", false);
    std::cout << (match ? "MATCH" : "NO MATCH")
              << " distance: " << reply->value("best_distance", 0.0)
              << " threshold: " << reply->value("threshold", 0.0)
              << " template: " << reply->value("best_index", 0)
              << " model: " << reply->value("model", "") << std::endl;
    return match ? 0 : 2;

  } else if (op == "health") {
    auto reply = call({{"op", "health"}});
    if (!reply)
      return 1;
    std::cout << "Service: " << reply->value("status", "") << std::endl;

  } else if (op == "version" || op == "--version" || op == "-v") {
#ifdef FACEVERIFY_VERSION
    std::cout << "Client Version: " << FACEVERIFY_VERSION << std::endl;
#else
    std::cout << "Client Version: Unknown" << std::endl;
#endif
    std::string resp = send_request({{"op", "version"}});
    json reply = json::parse(resp, nullptr, false);
    if (resp.empty() || reply.is_discarded() || !reply.contains("version")) {
      std::cout << "Daemon Version: Not running or unreachable" << std::endl;
    } else {
      std::cout << "Daemon Version: " << reply["version"].get<std::string>()
                << std::endl;
    }

  } else if (op == "help" || op == "--help" || op == "-h") {
    print_help();
  } else {
    std::cout << "Unknown command. Try 'faceverify help'." << std::endl;
    return 1;
  }

  return 0;
}
