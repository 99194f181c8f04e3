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

// Submits one spot request per group, waits until every request is resolved,
// then cancels the requests (never the instances) so that nothing is
// fulfilled again later.
#ifndef SPOT_SCHEDULER_H
#define SPOT_SCHEDULER_H

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/logger.h"
#include "control-plane/control_plane.h"
#include "fleet/machine.h"
#include "fleet/resource_provisioner.h"

namespace burst {
namespace internal {

enum class RequestState {
  kOpen,
  kActiveWithoutInstance,  // Fulfilled, instance id not reported yet
  kActive,
  kRejected  // closed, cancelled or failed
};

RequestState ClassifyRequest(const SpotRequestStatus& status);

inline bool IsPending(RequestState state) {
  return state == RequestState::kOpen ||
         state == RequestState::kActiveWithoutInstance;
}

struct SpotResolution {
  // Instance id -> group name, for every fulfilled request.
  std::map<std::string, std::string> instance_groups;
  // Fulfilled instance ids, in the order they were described.
  std::vector<std::string> instance_ids;
  // Request ids that resolved without an instance.
  std::vector<std::string> rejected;

  bool AllActive() const { return rejected.empty(); }
};

class SpotRequestScheduler {
public:
  SpotRequestScheduler(std::shared_ptr<ControlPlane> ec2, const Logger& log,
                       std::chrono::milliseconds poll_interval);

  // Issue one request per group for that group's count. Requests issued
  // before a failure stay recorded so that CancelRequests covers them.
  // Throws RequestSubmissionError.
  void Submit(const FleetPlan& plan, const ProvisionedResources& resources);

  // Poll until no request is open or active without an instance. Every
  // instance id is appended to *seen_instance_ids the first time a poll
  // reports it. Throws ResolutionPollingError on any describe failure other
  // than the control plane not knowing a fresh request id yet.
  SpotResolution AwaitResolution(std::vector<std::string>* seen_instance_ids);

  // Cancel every submitted request. Transient failures are retried with
  // backoff; any other failure is logged, not thrown.
  void CancelRequests();

  // One last describe after a failed submission or poll, so that instances
  // fulfilled since the last successful poll are appended to
  // *seen_instance_ids too. Failure is logged, not thrown.
  void CollectFulfilled(std::vector<std::string>* seen_instance_ids);

  // Backoff between cancellation retries, doubling up to max_backoff.
  void SetRetryBackoff(std::chrono::milliseconds initial_backoff,
                       std::chrono::milliseconds max_backoff);

  const std::vector<std::string>& request_ids() const { return request_ids_; }
  const std::map<std::string, std::string>& request_groups() const {
    return request_groups_;
  }

private:
  void Sleep() const;

  std::shared_ptr<ControlPlane> ec2_;
  Logger log_;
  std::chrono::milliseconds poll_interval_;
  std::chrono::milliseconds initial_backoff_;
  std::chrono::milliseconds max_backoff_;
  std::vector<std::string> request_ids_;
  std::map<std::string, std::string> request_groups_;  // Request id -> group
  bool cancelled_;
};

}  // namespace internal
}  // namespace burst

#endif  // SPOT_SCHEDULER_H
