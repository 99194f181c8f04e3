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

// Terminates every instance a run ever resolved, whichever way the run exits.
#ifndef CLEANUP_GUARD_H
#define CLEANUP_GUARD_H

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/logger.h"
#include "control-plane/control_plane.h"

namespace burst {

struct CleanupPolicy {
  // Transient termination failures are retried forever; the delay doubles
  // from initial_backoff up to max_backoff.
  std::chrono::milliseconds initial_backoff;
  std::chrono::milliseconds max_backoff;
  // Security group deletion fails until its instances are gone.
  int teardown_attempts;
  std::chrono::milliseconds teardown_interval;

  static CleanupPolicy Default();
};

namespace internal {

class CleanupGuard {
public:
  // instance_ids is shared with whoever discovers instances; it may still be
  // empty here and is read once, at release.
  CleanupGuard(std::shared_ptr<ControlPlane> ec2,
               std::shared_ptr<std::vector<std::string>> instance_ids,
               const Logger& log, const CleanupPolicy& policy);

  // Releases if Release has not run yet.
  ~CleanupGuard();

  CleanupGuard(const CleanupGuard&) = delete;
  CleanupGuard& operator=(const CleanupGuard&) = delete;

  // After termination, also delete this security group and key pair.
  void DeleteResourcesOnRelease(const std::string& security_group_id,
                                const std::string& key_name);

  // Snapshot the instance ids and hand their termination to a background
  // thread that the caller does not wait for. Only the first call acts.
  // Never throws.
  void Release();

  bool released() const { return released_; }

  // Block until every background cleanup started by any guard has finished,
  // or until grace has elapsed. Return true if none is left running. Call
  // before process exit.
  static bool WaitForPendingCleanup(std::chrono::milliseconds grace);

  static int PendingCleanupTasks();

private:
  struct Job {
    std::shared_ptr<ControlPlane> ec2;
    std::vector<std::string> instance_ids;
    std::string security_group_id;
    std::string key_name;
    Logger log;
    CleanupPolicy policy;
  };

  // Takes the job by value so that the control plane is released before the
  // task counts as finished.
  static void Reap(Job job);
  static void TerminateWithRetry(const Job& job);
  static void DeleteResources(const Job& job, bool instances_gone);
  static void FinishTask();

  std::shared_ptr<ControlPlane> ec2_;
  std::shared_ptr<std::vector<std::string>> instance_ids_;
  Logger log_;
  CleanupPolicy policy_;
  std::string security_group_id_;
  std::string key_name_;
  bool released_;

  static std::mutex pending_mutex_;
  static std::condition_variable pending_cv_;
  static int pending_tasks_;
};

}  // namespace internal
}  // namespace burst

#endif  // CLEANUP_GUARD_H
