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

// Waits until every fulfilled instance reports complete network addressing.
#ifndef READINESS_WAITER_H
#define READINESS_WAITER_H

#include <chrono>
#include <memory>
#include <string>

#include "common/logger.h"
#include "control-plane/control_plane.h"
#include "fleet/machine.h"
#include "fleet/spot_scheduler.h"

namespace burst {
namespace internal {

// True if the description carries an id, a type, both addresses and a DNS
// name.
bool IsFullyAddressed(const InstanceDescription& desc);

class InstanceReadinessWaiter {
public:
  InstanceReadinessWaiter(std::shared_ptr<ControlPlane> ec2, const Logger& log,
                          std::chrono::milliseconds poll_interval);

  // Describe resolution.instance_ids until all of them are fully addressed
  // in the same round, and return one Machine per instance grouped by the
  // group of its request. Each round rebuilds the result from scratch. There
  // is no timeout.
  //
  // Transient and not-found describe errors are retried; anything else
  // throws ReadinessPollingError.
  FleetMap Await(const SpotResolution& resolution);

private:
  std::shared_ptr<ControlPlane> ec2_;
  Logger log_;
  std::chrono::milliseconds poll_interval_;
};

}  // namespace internal
}  // namespace burst

#endif  // READINESS_WAITER_H
