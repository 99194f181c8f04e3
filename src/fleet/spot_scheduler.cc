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
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "common/errors.h"
#include "fleet/spot_scheduler.h"
#include "include/constants.h"

namespace burst {
namespace internal {

RequestState ClassifyRequest(const SpotRequestStatus& status) {
  if (status.state == "open") { return RequestState::kOpen; }
  if (status.state == "active") {
    return status.instance_id.empty() ? RequestState::kActiveWithoutInstance
                                      : RequestState::kActive;
  }
  return RequestState::kRejected;
}

SpotRequestScheduler::SpotRequestScheduler(
    std::shared_ptr<ControlPlane> ec2, const Logger& log,
    std::chrono::milliseconds poll_interval)
    : ec2_(ec2),
      log_(log),
      poll_interval_(poll_interval),
      initial_backoff_(cleanup_initial_backoff_ms),
      max_backoff_(cleanup_max_backoff_ms),
      cancelled_(false) {}

void SpotRequestScheduler::SetRetryBackoff(
    std::chrono::milliseconds initial_backoff,
    std::chrono::milliseconds max_backoff) {
  initial_backoff_ = initial_backoff;
  max_backoff_ = max_backoff;
}

void SpotRequestScheduler::Submit(const FleetPlan& plan,
                                  const ProvisionedResources& resources) {
  log_.Debug("issuing spot requests");
  for (const auto& entry : plan) {
    const std::string& name = entry.first;
    const MachineSet& set = entry.second;
    if (set.count <= 0) {
      log_.Trace("skipping " + name + ": no machines requested");
      continue;
    }

    SpotLaunchSpec spec;
    spec.image_id = set.setup.ami();
    spec.instance_type = set.setup.instance_type();
    spec.security_group_id = resources.security_group_id;
    spec.key_name = resources.key_name;

    std::vector<std::string> ids;
    try {
      ids = ec2_->RequestSpotInstances(spec, set.count);
    } catch (const ControlPlaneError& e) {
      throw RequestSubmissionError("failed to request spot instance for " +
                                   name + ": " + e.what());
    }
    log_.Trace("issued spot request for " + name +
               " #=" + std::to_string(set.count));
    if (ids.size() != static_cast<size_t>(set.count)) {
      log_.Warn("spot request for " + name + " returned " +
                std::to_string(ids.size()) + " request ids for " +
                std::to_string(set.count) + " machines");
    }
    for (const auto& id : ids) {
      log_.Trace("activated spot request id=" + id);
      request_ids_.push_back(id);
      request_groups_[id] = name;
    }
  }
}

SpotResolution SpotRequestScheduler::AwaitResolution(
    std::vector<std::string>* seen_instance_ids) {
  SpotResolution resolution;
  if (request_ids_.empty()) { return resolution; }

  log_.Debug("waiting for instances to spawn");
  while (true) {
    log_.Trace("checking spot request status");
    std::vector<SpotRequestStatus> statuses;
    try {
      statuses = ec2_->DescribeSpotRequests(request_ids_);
    } catch (const ControlPlaneError& e) {
      if (e.IsNotFound()) {
        log_.Trace("spot instance request not yet ready");
        Sleep();
        continue;
      }
      throw ResolutionPollingError("failed to describe spot instances: " +
                                   std::string(e.what()));
    }

    std::map<std::string, const SpotRequestStatus*> by_request;
    for (const auto& status : statuses) {
      by_request[status.request_id] = &status;
      if (ClassifyRequest(status) == RequestState::kActive &&
          std::find(seen_instance_ids->begin(), seen_instance_ids->end(),
                    status.instance_id) == seen_instance_ids->end()) {
        seen_instance_ids->push_back(status.instance_id);
      }
    }

    // A request the control plane did not report is still pending.
    bool any_pending = false;
    for (const auto& id : request_ids_) {
      auto it = by_request.find(id);
      if (it == by_request.end() || IsPending(ClassifyRequest(*it->second))) {
        any_pending = true;
        break;
      }
    }
    if (any_pending) {
      Sleep();
      continue;
    }

    for (const auto& id : request_ids_) {
      const SpotRequestStatus& status = *by_request[id];
      const std::string& name = request_groups_[id];
      if (ClassifyRequest(status) == RequestState::kActive) {
        log_.Trace("spot request satisfied setup=" + name +
                   " iid=" + status.instance_id);
        resolution.instance_groups[status.instance_id] = name;
        resolution.instance_ids.push_back(status.instance_id);
      } else {
        log_.Trace("spot request rejected setup=" + name + " id=" + id +
                   " state=" + status.state);
        resolution.rejected.push_back(id);
      }
    }
    return resolution;
  }
}

void SpotRequestScheduler::CancelRequests() {
  if (cancelled_ || request_ids_.empty()) { return; }
  cancelled_ = true;
  log_.Trace("cancelling spot requests");
  std::chrono::milliseconds backoff = initial_backoff_;
  while (true) {
    try {
      ec2_->CancelSpotRequests(request_ids_);
      return;
    } catch (const ControlPlaneError& e) {
      if (!e.IsTransient()) {
        log_.Warn("failed to cancel spot instance requests: " +
                  std::string(e.what()));
        return;
      }
      log_.Trace("retrying spot request cancellation: " +
                 std::string(e.what()));
    }
    std::this_thread::sleep_for(backoff);
    backoff = std::min(backoff * 2, max_backoff_);
  }
}

void SpotRequestScheduler::CollectFulfilled(
    std::vector<std::string>* seen_instance_ids) {
  if (request_ids_.empty()) { return; }
  std::vector<SpotRequestStatus> statuses;
  try {
    statuses = ec2_->DescribeSpotRequests(request_ids_);
  } catch (const ControlPlaneError& e) {
    log_.Warn("could not check spot requests for fulfilled instances: " +
              std::string(e.what()));
    return;
  }
  for (const auto& status : statuses) {
    if (status.instance_id.empty() ||
        std::find(seen_instance_ids->begin(), seen_instance_ids->end(),
                  status.instance_id) != seen_instance_ids->end()) {
      continue;
    }
    log_.Trace("found instance " + status.instance_id + " for request " +
               status.request_id);
    seen_instance_ids->push_back(status.instance_id);
  }
}

void SpotRequestScheduler::Sleep() const {
  if (poll_interval_.count() > 0) {
    std::this_thread::sleep_for(poll_interval_);
  }
}

}  // namespace internal
}  // namespace burst
