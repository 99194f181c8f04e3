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

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <libssh2.h>

#include "common/errors.h"
#include "include/constants.h"
#include "ssh/remote_session.h"

namespace burst {
namespace {

std::once_flag libssh2_once;
int libssh2_init_rc = 0;

void InitLibssh2() {
  std::call_once(libssh2_once, []() { libssh2_init_rc = libssh2_init(0); });
  if (libssh2_init_rc != 0) {
    throw ConnectionError("libssh2 not available (libssh2_init returned " +
                          std::to_string(libssh2_init_rc) + ")");
  }
}

std::string LastError(LIBSSH2_SESSION* session) {
  char* msg = nullptr;
  libssh2_session_last_error(session, &msg, nullptr, 0);
  return std::string(msg ? msg : "no error information available");
}

// libssh2 calls occasionally report a timeout that succeeds when repeated.
template <typename Func>
int RetryOnTimeout(Func func) {
  int rc = LIBSSH2_ERROR_TIMEOUT;
  for (int i = 0; i < ssh_timeout_retries; ++i) {
    rc = func();
    if (rc != LIBSSH2_ERROR_TIMEOUT) { break; }
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }
  return rc;
}

void CloseChannel(LIBSSH2_CHANNEL* channel) {
  libssh2_channel_close(channel);
  libssh2_channel_wait_closed(channel);
  libssh2_channel_free(channel);
}

typedef std::unique_ptr<LIBSSH2_CHANNEL, decltype(&CloseChannel)> UniqueChannel;

// Try every resolved address once. Return a connected socket, or an empty
// handle with *err set to the last errno.
SocketHandle TryConnect(const struct addrinfo* addrs, int* err) {
  for (const struct addrinfo* ai = addrs; ai != nullptr; ai = ai->ai_next) {
    SocketHandle sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
    if (sock.fd() < 0) {
      *err = errno;
      continue;
    }
    if (::connect(sock.fd(), ai->ai_addr, ai->ai_addrlen) == 0) {
      return sock;
    }
    *err = errno;
  }
  return SocketHandle();
}

}  // namespace

SocketHandle::~SocketHandle() {
  if (fd_ >= 0) { ::close(fd_); }
}

SocketHandle& SocketHandle::operator=(SocketHandle&& expiring) {
  if (this != &expiring) {
    if (fd_ >= 0) { ::close(fd_); }
    fd_ = expiring.fd_;
    expiring.fd_ = -1;
  }
  return *this;
}

SshSession::SshSession(const std::string& host, SocketHandle socket)
    : host_(host), socket_(std::move(socket)), session_(nullptr) {
  session_ = libssh2_session_init();
  if (session_ == nullptr) {
    throw ConnectionError("libssh2_session_init failed for " + host_);
  }
  libssh2_session_set_blocking(session_, 1);
}

SshSession::~SshSession() {
  if (session_ != nullptr) {
    libssh2_session_disconnect(session_, "Normal Shutdown");
    libssh2_session_free(session_);
  }
}

std::unique_ptr<SshSession> SshSession::Connect(
    const std::string& host, int port, const std::string& key_path,
    const std::string& user, int connect_retries,
    std::chrono::milliseconds connect_delay) {
  InitLibssh2();

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_NUMERICSERV;

  struct addrinfo* addrs = nullptr;
  std::string service = std::to_string(port);
  int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &addrs);
  if (rc != 0) {
    throw ConnectionError("failed to resolve " + host + ": " +
                          gai_strerror(rc));
  }
  std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> addrs_ptr(
      addrs, freeaddrinfo);

  SocketHandle sock;
  int err = 0;
  for (int attempt = 0;; ++attempt) {
    sock = TryConnect(addrs_ptr.get(), &err);
    if (sock.fd() >= 0) { break; }
    if (attempt >= connect_retries) {
      throw ConnectionError("failed to connect to ssh port " + host + ":" +
                            service + " after " +
                            std::to_string(attempt + 1) +
                            " attempts: " + std::strerror(err));
    }
    std::this_thread::sleep_for(connect_delay);
  }

  std::unique_ptr<SshSession> session(new SshSession(host, std::move(sock)));
  LIBSSH2_SESSION* raw_session = session->session_;
  int socket_fd = session->socket_.fd();

  // Trade banners, exchange keys, and set up crypto.
  int handshake_rc = RetryOnTimeout(
      [&]() { return libssh2_session_handshake(raw_session, socket_fd); });
  if (handshake_rc < 0) {
    throw ConnectionError("failed to perform ssh handshake with " + host +
                          ": " + LastError(raw_session));
  }

  int auth_rc = RetryOnTimeout([&]() {
    return libssh2_userauth_publickey_fromfile(
        raw_session, user.c_str(), nullptr, key_path.c_str(), nullptr);
  });
  if (auth_rc < 0) {
    throw AuthenticationError("failed to authenticate ssh session to " +
                              host + " as " + user + " with key " + key_path +
                              ": " + LastError(raw_session));
  }

  return session;
}

std::string SshSession::Cmd(const std::string& cmd) {
  UniqueChannel channel(nullptr, CloseChannel);
  int open_rc = RetryOnTimeout([&]() -> int {
    channel.reset(libssh2_channel_open_session(session_));
    if (channel != nullptr) { return 0; }
    return libssh2_session_last_errno(session_);
  });
  if (open_rc < 0 || channel == nullptr) {
    throw RemoteCommandError("failed to create ssh channel for command '" +
                             cmd + "' on " + host_ + ": " +
                             LastError(session_));
  }

  // Only stdout is captured; stderr must not fill the window.
  libssh2_channel_handle_extended_data2(channel.get(),
                                        LIBSSH2_CHANNEL_EXTENDED_DATA_IGNORE);

  int exec_rc = RetryOnTimeout(
      [&]() { return libssh2_channel_exec(channel.get(), cmd.c_str()); });
  if (exec_rc < 0) {
    throw RemoteCommandError("failed to execute command '" + cmd + "' on " +
                             host_ + ": " + LastError(session_));
  }

  std::string output;
  char buffer[4096];
  while (true) {
    ssize_t nread = libssh2_channel_read(channel.get(), buffer, sizeof(buffer));
    if (nread == LIBSSH2_ERROR_EAGAIN) { continue; }
    if (nread < 0) {
      throw RemoteCommandError("failed to read results of command '" + cmd +
                               "' on " + host_ + ": " + LastError(session_));
    }
    if (nread == 0) { break; }
    output.append(buffer, nread);
  }

  LIBSSH2_CHANNEL* raw_channel = channel.release();
  int close_rc = libssh2_channel_close(raw_channel);
  if (close_rc == 0) { close_rc = libssh2_channel_wait_closed(raw_channel); }
  libssh2_channel_free(raw_channel);
  if (close_rc < 0) {
    throw RemoteCommandError("command '" + cmd + "' never completed on " +
                             host_ + ": " + LastError(session_));
  }
  return output;
}

SshConnector::SshConnector()
    : user_(ssh_user),
      connect_retries_(ssh_connect_retries),
      connect_delay_(ssh_connect_delay_ms) {}

SshConnector::SshConnector(const std::string& user, int connect_retries,
                           std::chrono::milliseconds connect_delay)
    : user_(user),
      connect_retries_(connect_retries),
      connect_delay_(connect_delay) {}

std::unique_ptr<RemoteSession> SshConnector::Connect(
    const std::string& host, int port, const std::string& key_path) {
  return std::unique_ptr<RemoteSession>(SshSession::Connect(
      host, port, key_path, user_, connect_retries_, connect_delay_));
}

}  // namespace burst
