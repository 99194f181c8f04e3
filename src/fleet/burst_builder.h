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

// Entry point for callers: describe the fleet, then Run a routine on it once
// every machine is up and set up. Instances are terminated whichever way Run
// exits.
#ifndef BURST_BUILDER_H
#define BURST_BUILDER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "common/logger.h"
#include "control-plane/control_plane.h"
#include "fleet/cleanup_guard.h"
#include "fleet/machine.h"
#include "fleet/resource_provisioner.h"
#include "ssh/remote_session.h"

namespace burst {

class BurstBuilder {
public:
  BurstBuilder();

  // Request count machines of the given setup under name. Throws
  // std::invalid_argument if name is already taken or count is not positive.
  BurstBuilder& AddSet(const std::string& name, int32_t count,
                       const MachineSetup& setup);

  // Advisory only: recorded and logged, not enforced.
  BurstBuilder& SetMaxDuration(uint8_t hours);

  BurstBuilder& SetLogger(const Logger& log);
  BurstBuilder& UseTermLogger();

  // Ignored once a control plane has been injected.
  BurstBuilder& SetRegion(const std::string& region);
  BurstBuilder& SetControlPlane(std::shared_ptr<ControlPlane> ec2);
  BurstBuilder& SetSessionConnector(std::shared_ptr<SessionConnector> connector);

  BurstBuilder& SetPollInterval(std::chrono::milliseconds interval);
  // 0 means one setup worker per hardware thread.
  BurstBuilder& SetSetupParallelism(size_t workers);
  BurstBuilder& SetCleanupPolicy(const CleanupPolicy& policy);
  // Also delete the run's security group and key pair after its instances
  // are terminated.
  BurstBuilder& SetDeleteProvisionedResources(bool enable);

  int max_duration_minutes() const { return max_duration_minutes_; }

  // Provision, request and wait for every machine, run each group's setup
  // routine on its machines, then hand the fleet to callback.
  //
  // Throws the error of the first phase that failed: ProvisioningError,
  // RequestSubmissionError, ResolutionPollingError (also when any request
  // was not fulfilled), ReadinessPollingError, the first setup failure
  // (ConnectionError, AuthenticationError or SetupRoutineError), or
  // CallbackError carrying the callback's message.
  //
  // Termination of every instance that was fulfilled is started before Run
  // returns or throws, and completes in the background. See
  // internal::CleanupGuard::WaitForPendingCleanup.
  void Run(const FleetCallback& callback);

private:
  void ArmTeardown(internal::CleanupGuard* guard,
                   const internal::ProvisionedResources& resources) const;

  FleetPlan plan_;
  int max_duration_minutes_;
  Logger log_;
  std::string region_;
  std::shared_ptr<ControlPlane> control_plane_;
  std::shared_ptr<SessionConnector> connector_;
  std::chrono::milliseconds poll_interval_;
  size_t setup_parallelism_;
  CleanupPolicy cleanup_policy_;
  bool delete_resources_;
};

}  // namespace burst

#endif  // BURST_BUILDER_H
