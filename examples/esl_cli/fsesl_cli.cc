/**
 * Command-line event socket client.
 *
 *   fsesl_cli --address 127.0.0.1:8021 --api status --api "show calls"
 *   fsesl_cli --config fsesl.yaml --listen 30
 *   fsesl_cli --channels
 */

#include <signal.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "fsesl/config/config_loader.h"
#include "fsesl/esl/event_socket.h"
#include "fsesl/esl/event_socket_pool.h"
#include "fsesl/esl/text_utils.h"

#define FSESL_LOG_COMPONENT "cli"
#include "fsesl/logging/log_macros.h"

namespace {

std::atomic<bool> g_shutdown(false);

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdown = true;
  }
}

void printUsage(const char* program) {
  std::cout << "FreeSWITCH event socket client\n"
            << "Usage: " << program << " [options]\n"
            << "Options:\n"
            << "  --config <file>     Configuration file\n"
            << "  --address <h:p>     Event socket address\n"
            << "  --password <pw>     Event socket password\n"
            << "  --api <command>     Run an api command (repeatable)\n"
            << "  --listen <seconds>  Print subscribed events for a while\n"
            << "  --channels          List active channels\n"
            << "  --log-level <lvl>   debug|info|warning|error|off\n"
            << "  --help              Show this help message\n";
}

int runApiCommands(fsesl::esl::EventSocketPool& pool,
                   const std::vector<std::string>& commands) {
  int failures = 0;
  for (const auto& command : commands) {
    auto acquired = pool.acquire();
    if (fsesl::holds_alternative<fsesl::Error>(acquired)) {
      std::cerr << "Cannot connect: "
                << fsesl::get<fsesl::Error>(acquired).toString() << std::endl;
      return 1;
    }
    auto socket = fsesl::get<fsesl::esl::EventSocketPtr>(acquired);
    auto reply = socket->sendApiCmd(command);
    pool.release(socket);

    if (fsesl::holds_alternative<fsesl::Error>(reply)) {
      std::cerr << command << ": "
                << fsesl::get<fsesl::Error>(reply).toString() << std::endl;
      ++failures;
      continue;
    }
    std::cout << fsesl::get<std::string>(reply);
    if (!fsesl::get<std::string>(reply).empty() &&
        fsesl::get<std::string>(reply).back() != '\n') {
      std::cout << '\n';
    }
  }
  return failures == 0 ? 0 : 1;
}

int listChannels(fsesl::esl::EventSocketPool& pool) {
  auto acquired = pool.acquire();
  if (fsesl::holds_alternative<fsesl::Error>(acquired)) {
    std::cerr << "Cannot connect: "
              << fsesl::get<fsesl::Error>(acquired).toString() << std::endl;
    return 1;
  }
  auto socket = fsesl::get<fsesl::esl::EventSocketPtr>(acquired);
  auto reply = socket->sendApiCmd("show channels");
  pool.release(socket);
  if (fsesl::holds_alternative<fsesl::Error>(reply)) {
    std::cerr << "show channels: "
              << fsesl::get<fsesl::Error>(reply).toString() << std::endl;
    return 1;
  }

  auto rows = fsesl::esl::mapChanData(fsesl::get<std::string>(reply));
  std::cout << rows.size() << " channel(s)\n";
  for (const auto& row : rows) {
    auto uuid = row.find("uuid");
    std::cout << (uuid != row.end() ? uuid->second : "?") << "\n";
    for (const auto& column : row) {
      if (column.first != "uuid" && !column.second.empty()) {
        std::cout << "  " << column.first << ": " << column.second << "\n";
      }
    }
  }
  return 0;
}

int listenForEvents(fsesl::config::EventSocketConfig socket_config,
                    const std::vector<std::string>& events,
                    int seconds) {
  auto print = [](const std::string& body) {
    auto fields = fsesl::esl::eventStrToMap(body);
    std::cout << "[" << fields["Event-Name"] << "]\n" << body << std::endl;
  };
  socket_config.event_handlers.clear();
  if (events.empty()) {
    socket_config.event_handlers[fsesl::esl::kAllEvents].push_back(print);
  }
  for (const auto& name : events) {
    socket_config.event_handlers[name].push_back(print);
  }
  socket_config.read_events = true;

  auto created = fsesl::esl::EventSocket::create(socket_config);
  if (fsesl::holds_alternative<fsesl::Error>(created)) {
    std::cerr << "Cannot connect: "
              << fsesl::get<fsesl::Error>(created).toString() << std::endl;
    return 1;
  }
  auto socket = fsesl::get<fsesl::esl::EventSocketPtr>(created);

  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
  while (!g_shutdown && socket->reading() &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  bool lost = !socket->reading();
  socket->disconnect();
  if (lost) {
    std::cerr << "Connection to " << socket->address() << " lost"
              << std::endl;
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  std::string config_path;
  std::string address;
  std::string password;
  std::string log_level;
  std::vector<std::string> api_commands;
  int listen_seconds = 0;
  bool channels = false;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--address" && i + 1 < argc) {
      address = argv[++i];
    } else if (arg == "--password" && i + 1 < argc) {
      password = argv[++i];
    } else if (arg == "--api" && i + 1 < argc) {
      api_commands.push_back(argv[++i]);
    } else if (arg == "--listen" && i + 1 < argc) {
      try {
        listen_seconds = std::stoi(argv[++i]);
      } catch (const std::exception&) {
        std::cerr << "--listen expects a number of seconds" << std::endl;
        return 2;
      }
    } else if (arg == "--channels") {
      channels = true;
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      printUsage(argv[0]);
      return 2;
    }
  }

  fsesl::config::ClientConfig config;
  try {
    config = fsesl::config::ConfigLoader(config_path).load();
    if (!log_level.empty()) {
      config.logging.level = fsesl::logging::stringToLogLevel(log_level);
    }
    fsesl::config::ConfigLoader::applyLogging(config.logging);
  } catch (const fsesl::config::ConfigParseError& e) {
    std::cerr << e.what() << std::endl;
    return 2;
  }
  if (!address.empty()) {
    config.pool.socket.address = address;
  }
  if (!password.empty()) {
    config.pool.socket.password = password;
  }
  FSESL_LOG(Debug, "Using event socket at {}", config.pool.socket.address);

  if (api_commands.empty() && listen_seconds <= 0 && !channels) {
    printUsage(argv[0]);
    return 2;
  }

  int status = 0;
  if (!api_commands.empty() || channels) {
    // Commands do not need event streaming; replies are read inline
    fsesl::config::PoolConfig pool_config = config.pool;
    pool_config.socket.read_events = false;
    pool_config.socket.event_handlers.clear();
    fsesl::esl::EventSocketPool pool(pool_config);

    if (!api_commands.empty()) {
      status = runApiCommands(pool, api_commands);
    }
    if (channels && status == 0) {
      status = listChannels(pool);
    }
  }
  if (listen_seconds > 0 && status == 0) {
    status =
        listenForEvents(config.pool.socket, config.events, listen_seconds);
  }
  return status;
}
