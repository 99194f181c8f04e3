/*
 * Copyright 2018-2021 Board of Trustees of Stanford University
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

// Sessions that record commands instead of running them, for tests.
#ifndef FAKE_SESSION_H
#define FAKE_SESSION_H

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "common/errors.h"
#include "ssh/remote_session.h"

namespace burst {
namespace testing {

// Commands run on every session of one connector, in order, as "host: cmd".
class CommandLog {
public:
  void Add(const std::string& host, const std::string& cmd) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(host + ": " + cmd);
  }

  std::vector<std::string> entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::string> entries_;
};

class FakeSession : public RemoteSession {
public:
  FakeSession(const std::string& host, std::shared_ptr<CommandLog> log)
      : host_(host), log_(log) {}

  std::string Cmd(const std::string& cmd) override {
    log_->Add(host_, cmd);
    return host_ + "\n";
  }

  const std::string& host() const override { return host_; }

private:
  std::string host_;
  std::shared_ptr<CommandLog> log_;
};

class FakeConnector : public SessionConnector {
public:
  FakeConnector() : commands_(std::make_shared<CommandLog>()) {}

  void Unreachable(const std::string& host) {
    std::lock_guard<std::mutex> lock(mutex_);
    unreachable_.insert(host);
  }

  void RejectKey(const std::string& host) {
    std::lock_guard<std::mutex> lock(mutex_);
    rejected_.insert(host);
  }

  std::unique_ptr<RemoteSession> Connect(const std::string& host, int port,
                                         const std::string& key_path) override {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_.push_back(host);
    key_paths_.insert(key_path);
    if (unreachable_.count(host) > 0) {
      throw ConnectionError("failed to connect to ssh port " + host + ":" +
                            std::to_string(port));
    }
    if (rejected_.count(host) > 0) {
      throw AuthenticationError("failed to authenticate ssh session to " +
                                host);
    }
    return std::unique_ptr<RemoteSession>(new FakeSession(host, commands_));
  }

  std::vector<std::string> connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
  }

  std::set<std::string> key_paths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return key_paths_;
  }

  std::vector<std::string> commands() const { return commands_->entries(); }

private:
  mutable std::mutex mutex_;
  std::set<std::string> unreachable_;
  std::set<std::string> rejected_;
  std::vector<std::string> connected_;
  std::set<std::string> key_paths_;
  std::shared_ptr<CommandLog> commands_;
};

}  // namespace testing
}  // namespace burst

#endif  // FAKE_SESSION_H
