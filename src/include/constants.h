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

// Defaults shared by the fleet orchestrator, burst_run and the tests.
#ifndef BURST_CONSTANTS_H
#define BURST_CONSTANTS_H

#include <cstdint>
#include <string>

namespace burst {

// Control plane
static const std::string default_region = "us-east-1";
static const std::string security_group_prefix = "burst_security_";
static const std::string key_pair_prefix = "burst_key_";
static const std::string security_group_description =
    "Temporary access groups for burst vms";
static const int random_suffix_length = 10;

// Ingress rules: remote shell from anywhere, everything inside the VPC.
static const std::string ssh_ingress_cidr = "0.0.0.0/0";
static const std::string fleet_ingress_cidr = "172.31.0.0/16";

// Remote shell
static const int ssh_port = 22;
static const std::string ssh_user = "ec2-user";
static const int ssh_connect_retries = 4;     // After the first attempt
static const int ssh_connect_delay_ms = 1000;  // Between attempts
static const int ssh_timeout_retries = 10;     // libssh2 spurious timeouts

// Polling
static const int poll_interval_ms = 2000;

// Cleanup: retry transient termination failures forever, backing off.
static const int cleanup_initial_backoff_ms = 100;
static const int cleanup_max_backoff_ms = 30000;
// Security groups can only be deleted once their instances are gone.
static const int teardown_attempts = 30;
static const int teardown_interval_ms = 10000;

// How long burst_run waits for detached cleanup before exiting.
static const int cleanup_grace_seconds = 120;

}  // namespace burst

#endif  // BURST_CONSTANTS_H
