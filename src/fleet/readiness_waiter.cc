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
#include <map>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "common/errors.h"
#include "fleet/readiness_waiter.h"

namespace burst {
namespace internal {

bool IsFullyAddressed(const InstanceDescription& desc) {
  return !desc.instance_id.empty() && !desc.instance_type.empty() &&
         !desc.private_ip.empty() && !desc.public_dns.empty() &&
         !desc.public_ip.empty();
}

InstanceReadinessWaiter::InstanceReadinessWaiter(
    std::shared_ptr<ControlPlane> ec2, const Logger& log,
    std::chrono::milliseconds poll_interval)
    : ec2_(ec2), log_(log), poll_interval_(poll_interval) {}

FleetMap InstanceReadinessWaiter::Await(const SpotResolution& resolution) {
  FleetMap machines;
  if (resolution.instance_ids.empty()) { return machines; }

  bool all_ready = false;
  while (!all_ready) {
    machines.clear();
    all_ready = true;

    std::vector<InstanceDescription> descriptions;
    try {
      descriptions = ec2_->DescribeInstances(resolution.instance_ids);
    } catch (const ControlPlaneError& e) {
      if (!e.IsTransient() && !e.IsNotFound()) {
        throw ReadinessPollingError("failed to describe instances: " +
                                    std::string(e.what()));
      }
      log_.Trace("instances not yet visible: " + std::string(e.what()));
      all_ready = false;
    }

    std::set<std::string> ready;
    for (const auto& desc : descriptions) {
      auto group = resolution.instance_groups.find(desc.instance_id);
      if (group == resolution.instance_groups.end()) { continue; }
      if (!IsFullyAddressed(desc)) {
        all_ready = false;
        continue;
      }
      if (!ready.insert(desc.instance_id).second) { continue; }

      Machine machine;
      machine.instance_id = desc.instance_id;
      machine.group = group->second;
      machine.instance_type = desc.instance_type;
      machine.private_ip = desc.private_ip;
      machine.public_dns = desc.public_dns;
      machine.public_ip = desc.public_ip;
      log_.Trace("instance ready set=" + machine.group +
                 " ip=" + machine.public_ip);
      machines[machine.group].push_back(std::move(machine));
    }
    if (ready.size() != resolution.instance_ids.size()) { all_ready = false; }

    if (!all_ready && poll_interval_.count() > 0) {
      std::this_thread::sleep_for(poll_interval_);
    }
  }
  return machines;
}

}  // namespace internal
}  // namespace burst
