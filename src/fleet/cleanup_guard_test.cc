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

#include <chrono>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "control-plane/fake_control_plane.h"
#include "fleet/cleanup_guard.h"

#define FAIL(x) printf("[FAIL]: " #x "\n")
#define PASS(x) printf("[PASS]: " #x "\n")

using burst::CleanupPolicy;
using burst::ControlPlaneError;
using burst::Logger;
using burst::internal::CleanupGuard;
using burst::testing::FakeControlPlane;

static const std::chrono::milliseconds grace(5000);

static CleanupPolicy FastPolicy() {
  CleanupPolicy policy = {std::chrono::milliseconds(1),
                          std::chrono::milliseconds(4), 5,
                          std::chrono::milliseconds(1)};
  return policy;
}

static std::shared_ptr<std::vector<std::string>> NoInstances() {
  return std::make_shared<std::vector<std::string>>();
}

int main(int argc, char** argv) {
  CleanupPolicy defaults = CleanupPolicy::Default();
  if (defaults.initial_backoff != std::chrono::milliseconds(100) ||
      defaults.max_backoff != std::chrono::milliseconds(30000)) {
    FAIL("Back off from 100ms up to 30s by default");
    return 1;
  }
  if (defaults.teardown_attempts != 30 ||
      defaults.teardown_interval != std::chrono::milliseconds(10000)) {
    FAIL("Try the security group 30 times, 10s apart, by default");
    return 1;
  }
  PASS("Back off from 100ms up to 30s by default");

  // Ids discovered after arming are terminated; later ones are not
  {
    auto ec2 = std::make_shared<FakeControlPlane>();
    auto ids = NoInstances();
    CleanupGuard guard(ec2, ids, Logger(), FastPolicy());
    ids->push_back("i-1");
    ids->push_back("i-2");
    guard.Release();
    ids->push_back("i-3");
    guard.Release();
    if (!CleanupGuard::WaitForPendingCleanup(grace)) {
      FAIL("Finish background cleanup");
      return 1;
    }
    std::vector<std::vector<std::string>> terminated = ec2->terminated();
    if (ec2->Calls("TerminateInstances") != 1 || terminated.size() != 1 ||
        terminated[0] != std::vector<std::string>({"i-1", "i-2"})) {
      FAIL("Terminate exactly the resolved instances once");
      return 1;
    }
    if (!guard.released()) {
      FAIL("Mark the guard released");
      return 1;
    }
  }
  PASS("Terminate exactly the resolved instances once");

  // Leaving scope, normally or by exception, releases the guard
  {
    auto ec2 = std::make_shared<FakeControlPlane>();
    {
      auto ids = NoInstances();
      CleanupGuard guard(ec2, ids, Logger(), FastPolicy());
      ids->push_back("i-1");
    }
    try {
      auto ids = NoInstances();
      CleanupGuard guard(ec2, ids, Logger(), FastPolicy());
      ids->push_back("i-2");
      throw std::runtime_error("setup failed");
    } catch (const std::runtime_error&) {
    }
    CleanupGuard::WaitForPendingCleanup(grace);
    if (ec2->terminated().size() != 2) {
      FAIL("Release the guard on scope exit");
      return 1;
    }
  }
  PASS("Release the guard on scope exit");

  // Transient failures are retried until termination goes through
  {
    auto ec2 = std::make_shared<FakeControlPlane>();
    ec2->FailWith("TerminateInstances", ControlPlaneError::kTransient, 6);
    auto ids = NoInstances();
    ids->push_back("i-1");
    {
      CleanupGuard guard(ec2, ids, Logger(), FastPolicy());
    }
    CleanupGuard::WaitForPendingCleanup(grace);
    if (ec2->Calls("TerminateInstances") != 7 ||
        ec2->terminated().size() != 1) {
      FAIL("Retry transient termination failures");
      return 1;
    }
  }
  PASS("Retry transient termination failures");

  // Any other failure gives up without throwing
  {
    auto ec2 = std::make_shared<FakeControlPlane>();
    ec2->FailWith("TerminateInstances", ControlPlaneError::kFatal, -1);
    auto ids = NoInstances();
    ids->push_back("i-1");
    {
      CleanupGuard guard(ec2, ids, Logger(), FastPolicy());
    }
    if (!CleanupGuard::WaitForPendingCleanup(grace) ||
        ec2->Calls("TerminateInstances") != 1 ||
        !ec2->terminated().empty()) {
      FAIL("Give up on fatal termination failures");
      return 1;
    }
  }
  PASS("Give up on fatal termination failures");

  // Nothing resolved, nothing to terminate
  {
    auto ec2 = std::make_shared<FakeControlPlane>();
    {
      CleanupGuard guard(ec2, NoInstances(), Logger(), FastPolicy());
    }
    CleanupGuard::WaitForPendingCleanup(grace);
    if (ec2->Calls("TerminateInstances") != 0) {
      FAIL("Skip termination without instances");
      return 1;
    }
  }
  PASS("Skip termination without instances");

  // Optional teardown of the security group and key pair
  {
    auto ec2 = std::make_shared<FakeControlPlane>();
    ec2->FailWith("DeleteSecurityGroup", ControlPlaneError::kFatal, 2);
    auto ids = NoInstances();
    ids->push_back("i-1");
    {
      CleanupGuard guard(ec2, ids, Logger(), FastPolicy());
      guard.DeleteResourcesOnRelease("sg-1", "burst_key_test");
    }
    CleanupGuard::WaitForPendingCleanup(grace);
    if (ec2->terminated().size() != 1 ||
        ec2->deleted_key_pairs() !=
            std::vector<std::string>({"burst_key_test"}) ||
        ec2->deleted_security_groups() != std::vector<std::string>({"sg-1"}) ||
        ec2->Calls("DeleteSecurityGroup") != 3) {
      FAIL("Delete the security group once its instances are gone");
      return 1;
    }
  }
  {
    auto ec2 = std::make_shared<FakeControlPlane>();
    ec2->FailWith("TerminateInstances", ControlPlaneError::kFatal, -1);
    auto ids = NoInstances();
    ids->push_back("i-1");
    {
      CleanupGuard guard(ec2, ids, Logger(), FastPolicy());
      guard.DeleteResourcesOnRelease("sg-1", "burst_key_test");
    }
    CleanupGuard::WaitForPendingCleanup(grace);
    if (ec2->Calls("DeleteSecurityGroup") != 0 ||
        ec2->deleted_key_pairs().size() != 1) {
      FAIL("Keep the security group while instances may run");
      return 1;
    }
  }
  {
    auto ec2 = std::make_shared<FakeControlPlane>();
    ec2->FailWith("DeleteSecurityGroup", ControlPlaneError::kFatal, -1);
    {
      CleanupGuard guard(ec2, NoInstances(), Logger(), FastPolicy());
      guard.DeleteResourcesOnRelease("sg-1", "");
    }
    CleanupGuard::WaitForPendingCleanup(grace);
    if (ec2->Calls("DeleteSecurityGroup") != 5 ||
        ec2->Calls("DeleteKeyPair") != 0) {
      FAIL("Stop deleting the security group after the last attempt");
      return 1;
    }
  }
  PASS("Tear down provisioned resources");

  if (CleanupGuard::PendingCleanupTasks() != 0) {
    FAIL("No cleanup left running");
    return 1;
  }
  PASS("No cleanup left running");

  return 0;
}
