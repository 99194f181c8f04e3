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
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "common/errors.h"
#include "fleet/cleanup_guard.h"
#include "include/constants.h"

namespace burst {

CleanupPolicy CleanupPolicy::Default() {
  CleanupPolicy policy;
  policy.initial_backoff = std::chrono::milliseconds(cleanup_initial_backoff_ms);
  policy.max_backoff = std::chrono::milliseconds(cleanup_max_backoff_ms);
  policy.teardown_attempts = burst::teardown_attempts;
  policy.teardown_interval = std::chrono::milliseconds(teardown_interval_ms);
  return policy;
}

namespace internal {

std::mutex CleanupGuard::pending_mutex_;
std::condition_variable CleanupGuard::pending_cv_;
int CleanupGuard::pending_tasks_ = 0;

CleanupGuard::CleanupGuard(
    std::shared_ptr<ControlPlane> ec2,
    std::shared_ptr<std::vector<std::string>> instance_ids, const Logger& log,
    const CleanupPolicy& policy)
    : ec2_(ec2),
      instance_ids_(instance_ids),
      log_(log),
      policy_(policy),
      released_(false) {}

CleanupGuard::~CleanupGuard() { Release(); }

void CleanupGuard::DeleteResourcesOnRelease(const std::string& security_group_id,
                                            const std::string& key_name) {
  security_group_id_ = security_group_id;
  key_name_ = key_name;
}

void CleanupGuard::Release() {
  if (released_) { return; }
  released_ = true;

  Job job;
  job.ec2 = ec2_;
  job.instance_ids = *instance_ids_;
  job.security_group_id = security_group_id_;
  job.key_name = key_name_;
  job.log = log_;
  job.policy = policy_;

  log_.Debug("terminating instances");
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    ++pending_tasks_;
  }
  try {
    std::thread(&CleanupGuard::Reap, job).detach();
  } catch (const std::system_error& e) {
    log_.Warn("could not start background cleanup, cleaning up inline: " +
              std::string(e.what()));
    Reap(job);
  }
}

void CleanupGuard::Reap(Job job) {
  bool terminated = false;
  try {
    TerminateWithRetry(job);
    terminated = true;
  } catch (const CleanupError& e) {
    job.log.Warn(e.what());
  } catch (const std::exception& e) {
    job.log.Warn("failed to terminate instances: " + std::string(e.what()));
  }
  try {
    DeleteResources(job, terminated);
  } catch (const std::exception& e) {
    job.log.Warn("failed to clean up temporary resources: " +
                 std::string(e.what()));
  }
  job.ec2.reset();
  FinishTask();
}

void CleanupGuard::TerminateWithRetry(const Job& job) {
  if (job.instance_ids.empty()) {
    job.log.Trace("no instances to terminate");
    return;
  }

  std::chrono::milliseconds backoff = job.policy.initial_backoff;
  while (true) {
    try {
      job.ec2->TerminateInstances(job.instance_ids);
      job.log.Debug("terminated " + std::to_string(job.instance_ids.size()) +
                    " instances");
      return;
    } catch (const ControlPlaneError& e) {
      if (!e.IsTransient()) {
        throw CleanupError("failed to terminate instances: " +
                           std::string(e.what()));
      }
      job.log.Trace("retrying instance termination: " + std::string(e.what()));
    }
    std::this_thread::sleep_for(backoff);
    backoff = std::min(backoff * 2, job.policy.max_backoff);
  }
}

void CleanupGuard::DeleteResources(const Job& job, bool instances_gone) {
  if (!job.key_name.empty()) {
    job.log.Trace("cleaning up keypair " + job.key_name);
    try {
      job.ec2->DeleteKeyPair(job.key_name);
    } catch (const ControlPlaneError& e) {
      job.log.Warn("failed to clean up key pair: " + std::string(e.what()));
    }
  }

  if (job.security_group_id.empty()) { return; }
  if (!instances_gone) {
    job.log.Warn("leaving security group " + job.security_group_id +
                 " behind: its instances may still be running");
    return;
  }
  job.log.Trace("cleaning up security group " + job.security_group_id);
  for (int attempt = 1;; ++attempt) {
    try {
      job.ec2->DeleteSecurityGroup(job.security_group_id);
      return;
    } catch (const ControlPlaneError& e) {
      if (attempt >= job.policy.teardown_attempts) {
        job.log.Warn("failed to clean up security group: " +
                     std::string(e.what()));
        return;
      }
      job.log.Trace("security group still in use: " + std::string(e.what()));
    }
    std::this_thread::sleep_for(job.policy.teardown_interval);
  }
}

void CleanupGuard::FinishTask() {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  --pending_tasks_;
  pending_cv_.notify_all();
}

bool CleanupGuard::WaitForPendingCleanup(std::chrono::milliseconds grace) {
  std::unique_lock<std::mutex> lock(pending_mutex_);
  return pending_cv_.wait_for(lock, grace,
                              []() { return pending_tasks_ == 0; });
}

int CleanupGuard::PendingCleanupTasks() {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  return pending_tasks_;
}

}  // namespace internal
}  // namespace burst
