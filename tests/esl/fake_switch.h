#pragma once

#include <errno.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "fsesl/network/dialer.h"
#include "fsesl/network/tcp_stream.h"

namespace fsesl {
namespace test {

/**
 * In-process event socket server for tests.
 *
 * Every dial() creates a socketpair; the client half is returned as a
 * TcpStream and the other half is served by a thread that plays the switch:
 * it sends the auth challenge, answers commands, records them and lets the
 * test inject events or drop the link.
 */
class FakeSwitch : public network::Dialer {
 public:
  struct Options {
    std::string challenge{"Content-Type: auth/request\n\n"};
    std::string auth_reply{"+OK accepted"};
    std::string event_reply{"+OK event listener enabled plain"};
    std::string filter_reply{"+OK filter added. [Event-Name]=[HEARTBEAT]"};
    std::string sendmsg_reply{"+OK"};
    // Dials that fail with ECONNREFUSED before one succeeds
    int fail_dials{0};
  };

  using ApiResponder = std::function<std::string(const std::string&)>;

  FakeSwitch() : FakeSwitch(Options()) {}
  explicit FakeSwitch(Options options) : options_(std::move(options)) {
    api_responder_ = [](const std::string& command) {
      return "+OK " + command + "\n";
    };
  }

  ~FakeSwitch() override {
    std::vector<std::shared_ptr<Session>> sessions;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      sessions = sessions_;
    }
    for (auto& session : sessions) {
      ::shutdown(session->fd, SHUT_RDWR);
    }
    for (auto& session : sessions) {
      if (session->thread.joinable()) {
        session->thread.join();
      }
      ::close(session->fd);
    }
  }

  IoResult<network::ByteStreamPtr> dial(const std::string& address) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      dial_times_.push_back(std::chrono::steady_clock::now());
      dialed_addresses_.push_back(address);
      if (options_.fail_dials > 0) {
        --options_.fail_dials;
        return IoResult<network::ByteStreamPtr>::error(ECONNREFUSED);
      }
    }

    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
      return IoResult<network::ByteStreamPtr>::from_errno(errno);
    }

    auto session = std::make_shared<Session>();
    session->fd = fds[1];
    {
      std::lock_guard<std::mutex> lock(mutex_);
      sessions_.push_back(session);
    }
    session->thread = std::thread([this, session]() { serve(*session); });
    return IoResult<network::ByteStreamPtr>::success(
        std::make_shared<network::TcpStream>(fds[0]));
  }

  void setApiResponder(ApiResponder responder) {
    std::lock_guard<std::mutex> lock(mutex_);
    api_responder_ = std::move(responder);
  }

  void setSendmsgReply(const std::string& reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.sendmsg_reply = reply;
  }

  void setFailDials(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.fail_dials = count;
  }

  std::vector<std::string> commands() {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_;
  }

  // Waits until a command starting with `prefix` has been received
  bool waitForCommand(const std::string& prefix,
                      std::chrono::milliseconds timeout =
                          std::chrono::milliseconds(2000)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this, &prefix] {
      for (const auto& command : commands_) {
        if (command.compare(0, prefix.size(), prefix) == 0) {
          return true;
        }
      }
      return false;
    });
  }

  size_t countCommands(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& command : commands_) {
      if (command.compare(0, prefix.size(), prefix) == 0) {
        ++count;
      }
    }
    return count;
  }

  size_t dialCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return dial_times_.size();
  }

  std::vector<std::chrono::steady_clock::time_point> dialTimes() {
    std::lock_guard<std::mutex> lock(mutex_);
    return dial_times_;
  }

  size_t sessionCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
  }

  // Raw bytes to the most recent session
  void sendRaw(const std::string& data) {
    auto session = latest();
    if (session) {
      session->write(data);
    }
  }

  void injectEvent(const std::string& event_name,
                   const std::string& extra_headers = "") {
    std::string body = "Event-Name: " + event_name + "\n" + extra_headers +
                       "\n";
    sendRaw("Content-Type: text/event-plain\nContent-Length: " +
            std::to_string(body.size()) + "\n\n" + body);
  }

  // Peer closes the most recent session
  void dropConnection() {
    auto session = latest();
    if (session) {
      ::shutdown(session->fd, SHUT_RDWR);
    }
  }

 private:
  struct Session {
    int fd{-1};
    std::thread thread;
    std::mutex write_mutex;

    void write(const std::string& data) {
      std::lock_guard<std::mutex> lock(write_mutex);
      size_t sent = 0;
      while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent,
                           MSG_NOSIGNAL);
        if (n <= 0) {
          return;
        }
        sent += static_cast<size_t>(n);
      }
    }
  };

  std::shared_ptr<Session> latest() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.empty() ? nullptr : sessions_.back();
  }

  static std::string commandReply(const std::string& text) {
    return "Content-Type: command/reply\nReply-Text: " + text + "\n\n";
  }

  void serve(Session& session) {
    session.write(options_.challenge);

    std::string pending;
    char buffer[1024];
    for (;;) {
      size_t end = pending.find("\n\n");
      while (end != std::string::npos) {
        std::string command = pending.substr(0, end);
        pending.erase(0, end + 2);
        answer(session, command);
        end = pending.find("\n\n");
      }
      ssize_t n = ::recv(session.fd, buffer, sizeof(buffer), 0);
      if (n <= 0) {
        return;
      }
      pending.append(buffer, static_cast<size_t>(n));
    }
  }

  void answer(Session& session, const std::string& command) {
    std::string reply;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      commands_.push_back(command);
      if (command.compare(0, 5, "auth ") == 0) {
        reply = commandReply(options_.auth_reply);
      } else if (command.compare(0, 12, "event plain ") == 0) {
        reply = commandReply(options_.event_reply);
      } else if (command.compare(0, 7, "filter ") == 0) {
        reply = commandReply(options_.filter_reply);
      } else if (command.compare(0, 8, "sendmsg ") == 0) {
        reply = commandReply(options_.sendmsg_reply);
      } else if (command.compare(0, 4, "api ") == 0) {
        std::string body = api_responder_(command.substr(4));
        reply = "Content-Type: api/response\nContent-Length: " +
                std::to_string(body.size()) + "\n\n" + body;
      } else {
        reply = commandReply("-ERR command not found");
      }
    }
    cv_.notify_all();
    session.write(reply);
  }

  Options options_;
  ApiResponder api_responder_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> commands_;
  std::vector<std::string> dialed_addresses_;
  std::vector<std::chrono::steady_clock::time_point> dial_times_;
  std::vector<std::shared_ptr<Session>> sessions_;
};

}  // namespace test
}  // namespace fsesl
