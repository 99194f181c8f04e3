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

#include <algorithm>
#include <cstdio>
#include <exception>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/errors.h"
#include "fleet/setup_executor.h"
#include "include/constants.h"
#include "ssh/fake_session.h"

#define FAIL(x) printf("[FAIL]: " #x "\n")
#define PASS(x) printf("[PASS]: " #x "\n")

using burst::FleetMap;
using burst::Logger;
using burst::Machine;
using burst::RemoteSession;
using burst::SetupRoutine;
using burst::internal::ParallelSetupExecutor;
using burst::internal::SetupReport;
using burst::testing::FakeConnector;

static const std::string key_path = "/tmp/burst_key_test";

static Machine MakeMachine(const std::string& group, const std::string& ip) {
  Machine machine;
  machine.instance_id = "i-" + ip;
  machine.group = group;
  machine.instance_type = "t3.small";
  machine.private_ip = "172.31.0.1";
  machine.public_dns = "ec2-" + ip + ".compute-1.amazonaws.com";
  machine.public_ip = ip;
  return machine;
}

// A and B are workers, C leads.
static FleetMap ThreeMachines() {
  FleetMap fleet;
  fleet["workers"].push_back(MakeMachine("workers", "54.0.0.1"));
  fleet["workers"].push_back(MakeMachine("workers", "54.0.0.2"));
  fleet["leader"].push_back(MakeMachine("leader", "54.0.0.3"));
  return fleet;
}

static void Provision(RemoteSession& session) {
  session.Cmd("sudo yum install -y gcc");
}

static bool Ran(const std::vector<std::string>& commands,
                const std::string& host) {
  return std::find(commands.begin(), commands.end(),
                   host + ": sudo yum install -y gcc") != commands.end();
}

// Return the message of error if it holds an E.
template <typename E>
static bool Holds(const std::exception_ptr& error, std::string* message) {
  try {
    std::rethrow_exception(error);
  } catch (const E& e) {
    *message = e.what();
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

int main(int argc, char** argv) {
  // One failing routine does not stop its siblings
  {
    auto connector = std::make_shared<FakeConnector>();
    std::map<std::string, SetupRoutine> routines;
    routines["workers"] = [](RemoteSession& session) {
      if (session.host() == "54.0.0.2") {
        throw std::runtime_error("disk full");
      }
      Provision(session);
    };
    routines["leader"] = Provision;

    FleetMap fleet = ThreeMachines();
    ParallelSetupExecutor executor(connector, Logger(), 0, burst::ssh_port);
    SetupReport report = executor.Run(&fleet, routines, key_path);

    std::string message;
    if (report.AllClear() || report.errors.size() != 1 ||
        !Holds<burst::SetupRoutineError>(report.errors[0], &message) ||
        message.find("54.0.0.2") == std::string::npos ||
        message.find("disk full") == std::string::npos) {
      FAIL("Collect exactly the failing machine's error");
      return 1;
    }
    std::vector<std::string> commands = connector->commands();
    if (!Ran(commands, "54.0.0.1") || !Ran(commands, "54.0.0.3") ||
        commands.size() != 2) {
      FAIL("Set up the other machines");
      return 1;
    }
    if (!fleet["workers"][0].ssh || fleet["workers"][1].ssh ||
        !fleet["leader"][0].ssh) {
      FAIL("Keep sessions of machines that were set up");
      return 1;
    }
    if (connector->connected().size() != 3 ||
        connector->key_paths().size() != 1 ||
        *connector->key_paths().begin() != key_path) {
      FAIL("Connect to every machine with the shared key");
      return 1;
    }
  }
  PASS("Collect setup routine failures");

  // Connection and authentication failures keep their kind
  {
    auto connector = std::make_shared<FakeConnector>();
    connector->Unreachable("54.0.0.1");
    connector->RejectKey("54.0.0.3");
    std::map<std::string, SetupRoutine> routines;
    routines["workers"] = Provision;
    routines["leader"] = Provision;

    FleetMap fleet = ThreeMachines();
    ParallelSetupExecutor executor(connector, Logger(), 2, burst::ssh_port);
    SetupReport report = executor.Run(&fleet, routines, key_path);
    if (report.errors.size() != 2) {
      FAIL("Report one error per failed connection");
      return 1;
    }
    int connection = 0, authentication = 0;
    for (const auto& error : report.errors) {
      std::string message;
      if (Holds<burst::ConnectionError>(error, &message) &&
          message.find("workers machine 54.0.0.1") != std::string::npos) {
        ++connection;
      }
      if (Holds<burst::AuthenticationError>(error, &message) &&
          message.find("leader machine 54.0.0.3") != std::string::npos) {
        ++authentication;
      }
    }
    if (connection != 1 || authentication != 1) {
      FAIL("Distinguish connection and authentication failures");
      return 1;
    }
    if (!Ran(connector->commands(), "54.0.0.2")) {
      FAIL("Set up the reachable machine");
      return 1;
    }
  }
  PASS("Report connection failures");

  // A single worker still attempts every machine
  {
    auto connector = std::make_shared<FakeConnector>();
    std::map<std::string, SetupRoutine> routines;
    routines["workers"] = Provision;
    routines["leader"] = Provision;
    FleetMap fleet = ThreeMachines();
    ParallelSetupExecutor executor(connector, Logger(), 1, burst::ssh_port);
    SetupReport report = executor.Run(&fleet, routines, key_path);
    if (!report.AllClear() || connector->commands().size() != 3) {
      FAIL("Set up every machine on one worker");
      return 1;
    }
  }
  PASS("Set up every machine on one worker");

  // A group without a routine is an error, not a crash
  {
    auto connector = std::make_shared<FakeConnector>();
    std::map<std::string, SetupRoutine> routines;
    routines["workers"] = Provision;
    FleetMap fleet = ThreeMachines();
    ParallelSetupExecutor executor(connector, Logger(), 0, burst::ssh_port);
    SetupReport report = executor.Run(&fleet, routines, key_path);
    std::string message;
    if (report.errors.size() != 1 ||
        !Holds<burst::SetupRoutineError>(report.errors[0], &message) ||
        message.find("leader") == std::string::npos ||
        connector->commands().size() != 2) {
      FAIL("Report groups without a setup routine");
      return 1;
    }
  }
  PASS("Report groups without a setup routine");

  return 0;
}
