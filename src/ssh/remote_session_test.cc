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

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <thread>

#include "common/errors.h"
#include "ssh/remote_session.h"

#define FAIL(x) printf("[FAIL]: " #x "\n")
#define PASS(x) printf("[PASS]: " #x "\n")

using burst::SocketHandle;
using burst::SshConnector;
using burst::SshSession;

// Bind a loopback TCP socket to an ephemeral port. Return the port.
static int BindLoopback(const SocketHandle& sock) {
  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  if (::bind(sock.fd(), reinterpret_cast<struct sockaddr*>(&addr),
             sizeof(addr)) < 0) {
    return -1;
  }
  socklen_t len = sizeof(addr);
  if (::getsockname(sock.fd(), reinterpret_cast<struct sockaddr*>(&addr),
                    &len) < 0) {
    return -1;
  }
  return ntohs(addr.sin_port);
}

int main(int argc, char** argv) {
  // Socket ownership
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  {
    SocketHandle first(fd);
    SocketHandle second(std::move(first));
    if (first.fd() != -1 || second.fd() != fd) {
      FAIL("Move socket ownership");
      return 1;
    }
  }
  if (fcntl(fd, F_GETFD) != -1 || errno != EBADF) {
    FAIL("Close the socket with its last owner");
    return 1;
  }
  PASS("Own connected sockets");

  // Nothing listens on a port that was bound and released
  int closed_port = -1;
  {
    SocketHandle sock(::socket(AF_INET, SOCK_STREAM, 0));
    closed_port = BindLoopback(sock);
  }
  if (closed_port <= 0) {
    FAIL("Reserve a loopback port");
    return 1;
  }
  std::string message;
  auto start = std::chrono::steady_clock::now();
  try {
    SshSession::Connect("127.0.0.1", closed_port, "/nonexistent", "ec2-user",
                        2, std::chrono::milliseconds(50));
  } catch (const burst::ConnectionError& e) {
    message = e.what();
  }
  auto took = std::chrono::steady_clock::now() - start;
  if (message.find("after 3 attempts") == std::string::npos ||
      took < std::chrono::milliseconds(100)) {
    FAIL("Retry refused connections then fail");
    return 1;
  }
  PASS("Retry refused connections then fail");

  // The connector applies its own retry count
  message.clear();
  try {
    SshConnector connector("ec2-user", 0, std::chrono::milliseconds(1));
    connector.Connect("127.0.0.1", closed_port, "/nonexistent");
  } catch (const burst::ConnectionError& e) {
    message = e.what();
  }
  if (message.find("after 1 attempts") == std::string::npos) {
    FAIL("Connect through the connector");
    return 1;
  }
  PASS("Connect through the connector");

  // A peer that hangs up before the handshake
  SocketHandle listener(::socket(AF_INET, SOCK_STREAM, 0));
  int port = BindLoopback(listener);
  if (port <= 0 || ::listen(listener.fd(), 1) < 0) {
    FAIL("Listen on a loopback port");
    return 1;
  }
  std::thread peer([&listener]() {
    SocketHandle conn(::accept(listener.fd(), nullptr, nullptr));
  });
  message.clear();
  try {
    SshSession::Connect("127.0.0.1", port, "/nonexistent", "ec2-user", 0,
                        std::chrono::milliseconds(1));
  } catch (const burst::ConnectionError& e) {
    message = e.what();
  } catch (const burst::AuthenticationError&) {
    message = "authenticated past a closed peer";
  }
  peer.join();
  if (message.find("handshake") == std::string::npos) {
    FAIL("Fail the handshake with a closed peer");
    return 1;
  }
  PASS("Fail the handshake with a closed peer");

  // A rejected key (AuthenticationError) needs a real sshd to answer the
  // handshake and is not exercised here. FakeConnector::RejectKey covers how
  // callers handle it in setup_executor_test.

  return 0;
}
