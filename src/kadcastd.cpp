// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/config.hpp"
#include "network/kadcast_node.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "version.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <poll.h>
#include <unistd.h>

namespace {

std::atomic<bool> g_shutdown_requested{false};
std::mutex g_output_mutex;

void SignalHandler(int) {
  static const char msg[] = "\nReceived signal, shutting down\n";
  (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
  g_shutdown_requested = true;
}

void PrintUsage(const char* program_name) {
  std::cout << "kadcastd - Kadcast broadcast node\n\n"
            << "Usage: " << program_name << " --host=<ip:port> [options]\n\n"
            << "Options:\n"
            << "  --host=<ip:port>       Public address other nodes reach us at (required)\n"
            << "  --listen=<ip:port>     Local address to bind (default: --host)\n"
            << "  --bootstrap=<ip:port>  Seed node, may be repeated\n"
            << "  --config=<file.json>   Load node configuration from a JSON file\n"
            << "  --loglevel=<level>     trace, debug, info, warn, error, off (default: info)\n"
            << "  --version              Show version information\n"
            << "  --help                 Show this help message\n\n"
            << "Every line read from stdin is broadcast. Commands:\n"
            << "  report                 Print the routing table and statistics\n"
            << "  quit                   Stop the node\n"
            << std::endl;
}

std::optional<asio::ip::udp::endpoint> ParseEndpointArg(const std::string& option, const std::string& value) {
  auto endpoint = kadcast::util::ParseEndpoint(value);
  if (!endpoint) {
    std::cerr << "Error: invalid " << option << " address '" << value << "' (expected ip:port or [ipv6]:port)\n";
  }
  return endpoint;
}

// Wait for a line on stdin, giving up when shutdown is requested.
// Reads the descriptor directly so poll() sees every byte not yet consumed.
std::optional<std::string> ReadLine() {
  static std::string pending;
  static bool eof = false;

  while (!g_shutdown_requested) {
    const auto newline = pending.find('\n');
    if (newline != std::string::npos) {
      std::string line = pending.substr(0, newline);
      pending.erase(0, newline + 1);
      return line;
    }
    if (eof) {
      if (pending.empty()) {
        return std::nullopt;
      }
      return std::exchange(pending, std::string());
    }

    pollfd fd{STDIN_FILENO, POLLIN, 0};
    const int ready = poll(&fd, 1, 200);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::nullopt;
    }
    if (ready == 0) {
      continue;
    }

    char buf[4096];
    const ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::nullopt;
    }
    if (n == 0) {
      eof = true;
      continue;
    }
    pending.append(buf, static_cast<size_t>(n));
  }
  return std::nullopt;
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    std::optional<asio::ip::udp::endpoint> host;
    std::optional<asio::ip::udp::endpoint> listen;
    std::vector<asio::ip::udp::endpoint> bootstrap;
    std::string config_path;
    std::string log_level = "info";

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version" || arg == "-v") {
        std::cout << kadcast::GetFullVersionString() << std::endl;
        std::cout << kadcast::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.starts_with("--host=")) {
        host = ParseEndpointArg("--host", arg.substr(7));
        if (!host) {
          return 1;
        }
      } else if (arg.starts_with("--listen=")) {
        listen = ParseEndpointArg("--listen", arg.substr(9));
        if (!listen) {
          return 1;
        }
      } else if (arg.starts_with("--bootstrap=")) {
        auto seed = ParseEndpointArg("--bootstrap", arg.substr(12));
        if (!seed) {
          return 1;
        }
        bootstrap.push_back(*seed);
      } else if (arg.starts_with("--config=")) {
        config_path = arg.substr(9);
        if (config_path.empty()) {
          std::cerr << "Error: --config requires a non-empty path\n";
          return 1;
        }
      } else if (arg.starts_with("--loglevel=")) {
        log_level = arg.substr(11);
      } else {
        std::cerr << "Error: unknown option " << arg << "\n\n";
        PrintUsage(argv[0]);
        return 1;
      }
    }

    kadcast::util::LogManager::Initialize(log_level);

    kadcast::network::NodeConfig config;
    if (!config_path.empty()) {
      config = kadcast::network::LoadNodeConfig(config_path);
    }
    // Command line wins over the file.
    if (host) {
      config.public_address = *host;
    } else if (config_path.empty()) {
      std::cerr << "Error: --host is required\n\n";
      PrintUsage(argv[0]);
      return 1;
    }
    if (listen) {
      config.listen_address = *listen;
    }
    config.bootstrap_nodes.insert(config.bootstrap_nodes.end(), bootstrap.begin(), bootstrap.end());

    kadcast::network::KadcastNode node(config);

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    if (!node.start()) {
      std::cerr << "Error: cannot listen on " << kadcast::util::FormatEndpoint(config.effective_listen_address())
                << "\n";
      return 1;
    }

    std::cout << kadcast::GetFullVersionString() << " started, node id "
              << kadcast::routing::ToHex(node.identity().id) << std::endl;

    std::thread printer([&node]() {
      auto& stream = node.incoming_broadcasts();
      while (!g_shutdown_requested) {
        auto received = stream.next(std::chrono::milliseconds(200));
        if (!received) {
          continue;
        }
        std::string text(received->payload.begin(), received->payload.end());
        std::lock_guard<std::mutex> lock(g_output_mutex);
        std::cout << "received " << received->payload.size() << " bytes via "
                  << kadcast::util::FormatEndpoint(received->source) << " (height "
                  << static_cast<int>(received->height) << "): " << text << std::endl;
      }
    });

    while (auto line = ReadLine()) {
      if (*line == "quit") {
        break;
      }
      if (*line == "report") {
        std::lock_guard<std::mutex> lock(g_output_mutex);
        std::cout << node.report().dump(2) << std::endl;
        continue;
      }
      if (line->empty()) {
        continue;
      }

      std::vector<uint8_t> payload(line->begin(), line->end());
      switch (node.broadcast(payload)) {
        case kadcast::network::BroadcastResult::Success:
          break;
        case kadcast::network::BroadcastResult::PayloadTooLarge:
          std::cerr << "Error: message too large\n";
          break;
        case kadcast::network::BroadcastResult::NotRunning:
          std::cerr << "Error: node is not running\n";
          break;
      }
    }

    g_shutdown_requested = true;
    printer.join();
    node.stop();
    kadcast::util::LogManager::Shutdown();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
