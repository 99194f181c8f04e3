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

// Remote shell sessions to fleet instances.
#ifndef REMOTE_SESSION_H
#define REMOTE_SESSION_H

#include <chrono>
#include <memory>
#include <string>

#include <libssh2.h>

namespace burst {

// An authenticated shell connection to one host.
class RemoteSession {
public:
  virtual ~RemoteSession() {}

  // Run cmd to completion and return everything it wrote to stdout.
  // Throws RemoteCommandError if the command could not be run or read.
  virtual std::string Cmd(const std::string& cmd) = 0;

  virtual const std::string& host() const = 0;
};

// Opens sessions for the setup executor.
class SessionConnector {
public:
  virtual ~SessionConnector() {}

  // Throws ConnectionError or AuthenticationError.
  virtual std::unique_ptr<RemoteSession> Connect(
      const std::string& host, int port, const std::string& key_path) = 0;
};

// Owns a connected socket descriptor.
class SocketHandle {
public:
  SocketHandle() : fd_(-1) {}
  explicit SocketHandle(int fd) : fd_(fd) {}
  ~SocketHandle();

  SocketHandle(SocketHandle&& expiring) : fd_(expiring.fd_) {
    expiring.fd_ = -1;
  }
  SocketHandle& operator=(SocketHandle&& expiring);

  SocketHandle(const SocketHandle&) = delete;
  SocketHandle& operator=(const SocketHandle&) = delete;

  int fd() const { return fd_; }

private:
  int fd_;
};

class SshSession : public RemoteSession {
public:
  // Connect to host:port, retrying refused or unreachable TCP connects
  // connect_retries times, then handshake and authenticate as user with the
  // private key at key_path.
  //
  // Throws ConnectionError if the socket cannot be connected or the
  // handshake fails, and AuthenticationError if the key is rejected.
  static std::unique_ptr<SshSession> Connect(
      const std::string& host, int port, const std::string& key_path,
      const std::string& user, int connect_retries,
      std::chrono::milliseconds connect_delay);

  ~SshSession() override;

  std::string Cmd(const std::string& cmd) override;
  const std::string& host() const override { return host_; }

  // For callers that need more than Cmd (file transfer, port forwarding).
  LIBSSH2_SESSION* raw() { return session_; }

private:
  SshSession(const std::string& host, SocketHandle socket);

  std::string host_;
  SocketHandle socket_;
  LIBSSH2_SESSION* session_;
};

class SshConnector : public SessionConnector {
public:
  SshConnector();
  SshConnector(const std::string& user, int connect_retries,
               std::chrono::milliseconds connect_delay);

  std::unique_ptr<RemoteSession> Connect(const std::string& host, int port,
                                         const std::string& key_path) override;

private:
  std::string user_;
  int connect_retries_;
  std::chrono::milliseconds connect_delay_;
};

}  // namespace burst

#endif  // REMOTE_SESSION_H
