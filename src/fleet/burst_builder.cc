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
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/errors.h"
#include "control-plane/ec2_control_plane.h"
#include "fleet/burst_builder.h"
#include "fleet/readiness_waiter.h"
#include "fleet/setup_executor.h"
#include "fleet/spot_scheduler.h"
#include "include/constants.h"

namespace burst {

BurstBuilder::BurstBuilder()
    : max_duration_minutes_(0),
      region_(default_region),
      poll_interval_(std::chrono::milliseconds(poll_interval_ms)),
      setup_parallelism_(0),
      cleanup_policy_(CleanupPolicy::Default()),
      delete_resources_(false) {}

BurstBuilder& BurstBuilder::AddSet(const std::string& name, int32_t count,
                                   const MachineSetup& setup) {
  if (count <= 0) {
    throw std::invalid_argument("machine set " + name +
                                " needs at least one machine");
  }
  if (plan_.find(name) != plan_.end()) {
    throw std::invalid_argument("machine set " + name + " already exists");
  }
  MachineSet set = {setup, count};
  plan_.insert(std::make_pair(name, set));
  return *this;
}

BurstBuilder& BurstBuilder::SetMaxDuration(uint8_t hours) {
  max_duration_minutes_ = static_cast<int>(hours) * 60;
  return *this;
}

BurstBuilder& BurstBuilder::SetLogger(const Logger& log) {
  log_ = log;
  return *this;
}

BurstBuilder& BurstBuilder::UseTermLogger() {
  log_ = Logger::Terminal();
  return *this;
}

BurstBuilder& BurstBuilder::SetRegion(const std::string& region) {
  region_ = region;
  return *this;
}

BurstBuilder& BurstBuilder::SetControlPlane(std::shared_ptr<ControlPlane> ec2) {
  control_plane_ = ec2;
  return *this;
}

BurstBuilder& BurstBuilder::SetSessionConnector(
    std::shared_ptr<SessionConnector> connector) {
  connector_ = connector;
  return *this;
}

BurstBuilder& BurstBuilder::SetPollInterval(std::chrono::milliseconds interval) {
  poll_interval_ = interval;
  return *this;
}

BurstBuilder& BurstBuilder::SetSetupParallelism(size_t workers) {
  setup_parallelism_ = workers;
  return *this;
}

BurstBuilder& BurstBuilder::SetCleanupPolicy(const CleanupPolicy& policy) {
  cleanup_policy_ = policy;
  return *this;
}

BurstBuilder& BurstBuilder::SetDeleteProvisionedResources(bool enable) {
  delete_resources_ = enable;
  return *this;
}

void BurstBuilder::ArmTeardown(
    internal::CleanupGuard* guard,
    const internal::ProvisionedResources& resources) const {
  if (delete_resources_) {
    guard->DeleteResourcesOnRelease(resources.security_group_id,
                                    resources.key_name);
  }
}

void BurstBuilder::Run(const FleetCallback& callback) {
  log_.Debug("connecting to ec2");
  std::shared_ptr<ControlPlane> ec2 = control_plane_;
  if (!ec2) { ec2 = std::make_shared<Ec2ControlPlane>(region_); }
  std::shared_ptr<SessionConnector> connector = connector_;
  if (!connector) { connector = std::make_shared<SshConnector>(); }

  log_.Info("spinning up burst");
  if (max_duration_minutes_ > 0) {
    log_.Debug("max duration " + std::to_string(max_duration_minutes_) +
               " minutes (not enforced)");
  }

  // Destruction runs in reverse: machines close their sessions, the guard
  // starts termination, then the key file is removed.
  internal::ResourceProvisioner provisioner(ec2, log_);
  std::shared_ptr<std::vector<std::string>> instance_ids =
      std::make_shared<std::vector<std::string>>();
  internal::CleanupGuard guard(ec2, instance_ids, log_, cleanup_policy_);
  try {
    provisioner.Provision();
  } catch (const std::exception&) {
    ArmTeardown(&guard, provisioner.resources());
    throw;
  }
  ArmTeardown(&guard, provisioner.resources());
  const internal::ProvisionedResources& resources = provisioner.resources();

  internal::SpotRequestScheduler scheduler(ec2, log_, poll_interval_);
  scheduler.SetRetryBackoff(cleanup_policy_.initial_backoff,
                            cleanup_policy_.max_backoff);
  internal::SpotResolution resolution;
  try {
    scheduler.Submit(plan_, resources);
    resolution = scheduler.AwaitResolution(instance_ids.get());
  } catch (const std::exception&) {
    // Requests may have been fulfilled since they were last described.
    scheduler.CancelRequests();
    scheduler.CollectFulfilled(instance_ids.get());
    throw;
  }
  scheduler.CancelRequests();

  internal::InstanceReadinessWaiter waiter(ec2, log_, poll_interval_);
  FleetMap machines = waiter.Await(resolution);

  if (!resolution.AllActive()) {
    std::string rejected;
    for (const auto& id : resolution.rejected) {
      if (!rejected.empty()) { rejected += ", "; }
      auto group = scheduler.request_groups().find(id);
      rejected += id;
      if (group != scheduler.request_groups().end()) {
        rejected += " (" + group->second + ")";
      }
    }
    log_.Error("not all spot requests were fulfilled");
    throw ResolutionPollingError("spot requests were not fulfilled: " +
                                 rejected);
  }

  std::map<std::string, SetupRoutine> routines;
  for (const auto& entry : plan_) {
    routines[entry.first] = entry.second.setup.setup();
  }
  internal::ParallelSetupExecutor executor(connector, log_,
                                           setup_parallelism_, ssh_port);
  internal::SetupReport report =
      executor.Run(&machines, routines, resources.private_key_path);
  if (!report.AllClear()) {
    log_.Error(std::to_string(report.errors.size()) +
               " machines failed to set up");
    std::rethrow_exception(report.errors.front());
  }

  log_.Info("quiet before the storm");
  auto start = std::chrono::steady_clock::now();
  try {
    callback(machines);
  } catch (const std::exception& e) {
    log_.Crit("main routine failed: " + std::string(e.what()));
    throw CallbackError(e.what());
  }
  auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  log_.Info("finished main routine in " + std::to_string(took.count()) +
            "ms");
  log_.Info("all done");
}

}  // namespace burst
