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

// Error types raised while bringing up, configuring and tearing down a fleet.
// Phase errors abort the run; per-instance errors are collected by the setup
// executor and the first one is rethrown after the fan-out completes.
#ifndef BURST_ERRORS_H
#define BURST_ERRORS_H

#include <stdexcept>
#include <string>

namespace burst {

// Security group, ingress rules, key pair, or the local key file.
class ProvisioningError : public std::runtime_error {
public:
  explicit ProvisioningError(const std::string& msg)
      : std::runtime_error(msg) {}
};

class RequestSubmissionError : public std::runtime_error {
public:
  explicit RequestSubmissionError(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Raised for non-transient describe failures and for rejected requests.
class ResolutionPollingError : public std::runtime_error {
public:
  explicit ResolutionPollingError(const std::string& msg)
      : std::runtime_error(msg) {}
};

class ReadinessPollingError : public std::runtime_error {
public:
  explicit ReadinessPollingError(const std::string& msg)
      : std::runtime_error(msg) {}
};

// TCP connect (after retries) or SSH handshake failed.
class ConnectionError : public std::runtime_error {
public:
  explicit ConnectionError(const std::string& msg)
      : std::runtime_error(msg) {}
};

class AuthenticationError : public std::runtime_error {
public:
  explicit AuthenticationError(const std::string& msg)
      : std::runtime_error(msg) {}
};

// A channel could not be opened, or a command could not be run or read.
class RemoteCommandError : public std::runtime_error {
public:
  explicit RemoteCommandError(const std::string& msg)
      : std::runtime_error(msg) {}
};

class SetupRoutineError : public std::runtime_error {
public:
  explicit SetupRoutineError(const std::string& msg)
      : std::runtime_error(msg) {}
};

// what() is the callback's own message.
class CallbackError : public std::runtime_error {
public:
  explicit CallbackError(const std::string& msg) : std::runtime_error(msg) {}
};

// Only ever logged.
class CleanupError : public std::runtime_error {
public:
  explicit CleanupError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace burst

#endif  // BURST_ERRORS_H
