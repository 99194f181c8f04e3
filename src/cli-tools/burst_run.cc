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
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include <aws/core/Aws.h>

#include "fleet/burst_builder.h"
#include "fleet/cleanup_guard.h"
#include "include/constants.h"

int main(int argc, char** argv) {
  if (argc < 6) {
    std::cout << "Usage: burst_run <instance-type> <ami> <count> <setup-cmd> "
              << "<main-cmd> [region]" << std::endl;
    std::cout << "setup-cmd: run on every machine once it is reachable"
              << std::endl;
    std::cout << "main-cmd: run on every machine once all of them are set up"
              << std::endl;
    std::cout << "region: defaults to " << burst::default_region << std::endl;
    return 1;
  }

  const std::string instance_type(argv[1]);
  const std::string ami(argv[2]);
  const int32_t count = std::atoi(argv[3]);
  const std::string setup_cmd(argv[4]);
  const std::string main_cmd(argv[5]);
  const std::string region = argc > 6 ? argv[6] : burst::default_region;
  if (count <= 0) {
    std::cerr << "count must be a positive number, got " << argv[3]
              << std::endl;
    return 1;
  }

  int rc = 0;
  Aws::SDKOptions options;
  Aws::InitAPI(options);
  {
    burst::BurstBuilder fleet;
    fleet.AddSet("machines", count,
                 burst::MachineSetup(instance_type, ami,
                                     [setup_cmd](burst::RemoteSession& ssh) {
                                       ssh.Cmd(setup_cmd);
                                     }))
        .SetRegion(region)
        .SetMaxDuration(1)
        .UseTermLogger();

    try {
      fleet.Run([&main_cmd](burst::FleetMap& machines) {
        for (auto& machine : machines["machines"]) {
          std::cout << "== " << machine.public_ip << " ==" << std::endl;
          std::cout << machine.ssh->Cmd(main_cmd);
        }
      });
    } catch (const std::exception& e) {
      std::cerr << "burst run failed: " << e.what() << std::endl;
      rc = 1;
    }
  }

  // Termination continues in the background; give it a chance to finish.
  if (!burst::internal::CleanupGuard::WaitForPendingCleanup(
          std::chrono::seconds(burst::cleanup_grace_seconds))) {
    std::cerr << "gave up waiting for instance termination; check the EC2 "
              << "console for leftover instances" << std::endl;
    // The cleanup thread still uses the SDK.
    return 1;
  }
  Aws::ShutdownAPI(options);
  return rc;
}
