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
#include <atomic>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "common/errors.h"
#include "fleet/setup_executor.h"

namespace burst {
namespace internal {

ParallelSetupExecutor::ParallelSetupExecutor(
    std::shared_ptr<SessionConnector> connector, const Logger& log,
    size_t max_workers, int port)
    : connector_(connector), log_(log), max_workers_(max_workers),
      port_(port) {
  if (max_workers_ == 0) {
    max_workers_ = std::max(1u, std::thread::hardware_concurrency());
  }
}

SetupReport ParallelSetupExecutor::Run(
    FleetMap* fleet, const std::map<std::string, SetupRoutine>& routines,
    const std::string& key_path) {
  SetupReport report;
  std::vector<Task> tasks;
  for (auto& entry : *fleet) {
    auto routine = routines.find(entry.first);
    if (routine == routines.end()) {
      // Every group in the fleet comes from the plan.
      report.errors.push_back(std::make_exception_ptr(SetupRoutineError(
          "no setup routine registered for " + entry.first)));
      continue;
    }
    for (auto& machine : entry.second) {
      Task task = {&entry.first, &machine, &routine->second};
      tasks.push_back(task);
    }
  }
  if (tasks.empty()) { return report; }

  std::atomic<size_t> next(0);
  std::mutex errors_mutex;
  auto worker = [&]() {
    while (true) {
      size_t i = next.fetch_add(1);
      if (i >= tasks.size()) { return; }
      std::exception_ptr error = RunOne(tasks[i], key_path);
      if (error) {
        std::lock_guard<std::mutex> lock(errors_mutex);
        report.errors.push_back(error);
      }
    }
  };

  size_t num_workers = std::min(max_workers_, tasks.size());
  log_.Trace("running " + std::to_string(tasks.size()) +
             " setup routines on " + std::to_string(num_workers) +
             " workers");
  std::vector<std::thread> pool;
  pool.reserve(num_workers);
  for (size_t i = 0; i < num_workers; ++i) {
    try {
      pool.push_back(std::thread(worker));
    } catch (const std::system_error& e) {
      log_.Warn("started only " + std::to_string(pool.size()) +
                " setup workers: " + e.what());
      break;
    }
  }
  if (pool.empty()) { worker(); }
  for (auto& t : pool) { t.join(); }
  return report;
}

std::exception_ptr ParallelSetupExecutor::RunOne(const Task& task,
                                                 const std::string& key_path) {
  const std::string& name = *task.group;
  Machine* machine = task.machine;
  const std::string where = name + " machine " + machine->public_ip;

  std::unique_ptr<RemoteSession> session;
  try {
    session = connector_->Connect(machine->public_ip, port_, key_path);
  } catch (const AuthenticationError& e) {
    log_.Error("failed to ssh to " + name + ":" + machine->public_ip);
    return std::make_exception_ptr(
        AuthenticationError("failed to ssh to " + where + ": " + e.what()));
  } catch (const std::exception& e) {
    log_.Error("failed to ssh to " + name + ":" + machine->public_ip);
    return std::make_exception_ptr(
        ConnectionError("failed to ssh to " + where + ": " + e.what()));
  } catch (...) {
    log_.Error("failed to ssh to " + name + ":" + machine->public_ip);
    return std::make_exception_ptr(
        ConnectionError("failed to ssh to " + where));
  }
  if (!session) {
    return std::make_exception_ptr(
        ConnectionError("failed to ssh to " + where + ": no session"));
  }

  log_.Debug("setting up " + name + " instance ip=" + machine->public_ip);
  try {
    (*task.routine)(*session);
  } catch (const std::exception& e) {
    log_.Error("setup for " + name + " machine failed");
    return std::make_exception_ptr(SetupRoutineError(
        "setup routine for " + where + " failed: " + e.what()));
  } catch (...) {
    log_.Error("setup for " + name + " machine failed");
    return std::make_exception_ptr(SetupRoutineError(
        "setup routine for " + where + " failed with a non-standard exception"));
  }

  machine->ssh = std::move(session);
  log_.Info("finished setting up " + name + " instance ip=" +
            machine->public_ip);
  return nullptr;
}

}  // namespace internal
}  // namespace burst
