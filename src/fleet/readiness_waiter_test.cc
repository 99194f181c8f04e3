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
#include <string>
#include <vector>

#include "common/errors.h"
#include "control-plane/fake_control_plane.h"
#include "fleet/readiness_waiter.h"

#define FAIL(x) printf("[FAIL]: " #x "\n")
#define PASS(x) printf("[PASS]: " #x "\n")

using burst::ControlPlaneError;
using burst::FleetMap;
using burst::InstanceDescription;
using burst::Logger;
using burst::SpotLaunchSpec;
using burst::internal::InstanceReadinessWaiter;
using burst::internal::SpotResolution;
using burst::testing::FakeControlPlane;

static const std::chrono::milliseconds no_wait(0);

// Launch count instances of instance_type directly on the fake and file them
// under group.
static void Launch(FakeControlPlane* ec2, SpotResolution* resolution,
                   const std::string& group, const std::string& instance_type,
                   int count) {
  SpotLaunchSpec spec;
  spec.image_id = "ami-" + group;
  spec.instance_type = instance_type;
  for (const auto& request : ec2->RequestSpotInstances(spec, count)) {
    std::string instance_id = "i-" + request.substr(request.find('-') + 1);
    resolution->instance_groups[instance_id] = group;
    resolution->instance_ids.push_back(instance_id);
  }
}

int main(int argc, char** argv) {
  InstanceDescription desc;
  desc.instance_id = "i-1";
  desc.instance_type = "c5.large";
  desc.private_ip = "172.31.0.1";
  desc.public_dns = "ec2-54-0-0-1.compute-1.amazonaws.com";
  if (burst::internal::IsFullyAddressed(desc)) {
    FAIL("Instance without a public address is not ready");
    return 1;
  }
  desc.public_ip = "54.0.0.1";
  if (!burst::internal::IsFullyAddressed(desc)) {
    FAIL("Instance with every address is ready");
    return 1;
  }
  PASS("Check instance addressing");

  // Nothing resolved, nothing to wait for
  {
    auto ec2 = std::make_shared<FakeControlPlane>();
    InstanceReadinessWaiter waiter(ec2, Logger(), no_wait);
    FleetMap machines = waiter.Await(SpotResolution());
    if (!machines.empty() || ec2->Calls("DescribeInstances") != 0) {
      FAIL("Skip readiness polling without instances");
      return 1;
    }
  }
  PASS("Skip readiness polling without instances");

  // Retry until every instance has its public address in the same round
  {
    auto ec2 = std::make_shared<FakeControlPlane>();
    SpotResolution resolution;
    Launch(ec2.get(), &resolution, "workers", "c5.large", 2);
    Launch(ec2.get(), &resolution, "leader", "m5.xlarge", 1);
    ec2->FailWith("DescribeInstances", ControlPlaneError::kNotFound, 1);
    ec2->SetReadinessLag(2);

    InstanceReadinessWaiter waiter(ec2, Logger(), no_wait);
    FleetMap machines = waiter.Await(resolution);
    if (ec2->Calls("DescribeInstances") != 4) {
      FAIL("Poll until all instances are addressed");
      return 1;
    }
    if (machines.size() != 2 || machines["workers"].size() != 2 ||
        machines["leader"].size() != 1) {
      FAIL("Group ready machines by their request's group");
      return 1;
    }
    const burst::Machine& leader = machines["leader"][0];
    if (leader.group != "leader" || leader.instance_type != "m5.xlarge" ||
        leader.public_ip.empty() || leader.private_ip.empty() ||
        leader.public_dns.empty() || leader.ssh) {
      FAIL("Describe ready machines");
      return 1;
    }
  }
  PASS("Wait for instances to be addressed");

  // Transient failures are retried, anything else is fatal
  {
    auto ec2 = std::make_shared<FakeControlPlane>();
    SpotResolution resolution;
    Launch(ec2.get(), &resolution, "workers", "c5.large", 1);
    ec2->FailWith("DescribeInstances", ControlPlaneError::kTransient, 3);
    InstanceReadinessWaiter waiter(ec2, Logger(), no_wait);
    FleetMap machines = waiter.Await(resolution);
    if (machines["workers"].size() != 1 ||
        ec2->Calls("DescribeInstances") != 4) {
      FAIL("Retry transient describe failures");
      return 1;
    }

    ec2->FailWith("DescribeInstances", ControlPlaneError::kFatal, 1);
    bool thrown = false;
    try {
      waiter.Await(resolution);
    } catch (const burst::ReadinessPollingError&) {
      thrown = true;
    }
    if (!thrown) {
      FAIL("Fail readiness polling on a fatal describe error");
      return 1;
    }
  }
  PASS("Handle describe failures");

  return 0;
}
