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

// ControlPlane backed by the AWS EC2 API. The hosting program must call
// Aws::InitAPI before constructing one and Aws::ShutdownAPI after the last
// one (and any pending cleanup) is gone.
#ifndef EC2_CONTROL_PLANE_H
#define EC2_CONTROL_PLANE_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <aws/core/Aws.h>
#include <aws/ec2/EC2Client.h>

#include "control-plane/control_plane.h"

namespace burst {

class Ec2ControlPlane : public ControlPlane {
public:
  // Credentials come from the SDK's default provider chain.
  explicit Ec2ControlPlane(const std::string& region);

  std::string CreateSecurityGroup(const std::string& name,
                                  const std::string& description) override;
  void AuthorizeIngress(const std::string& group_id,
                        const std::string& protocol, int from_port,
                        int to_port, const std::string& cidr) override;
  KeyPair CreateKeyPair(const std::string& name) override;
  std::vector<std::string> RequestSpotInstances(const SpotLaunchSpec& spec,
                                                int32_t count) override;
  std::vector<SpotRequestStatus> DescribeSpotRequests(
      const std::vector<std::string>& request_ids) override;
  void CancelSpotRequests(const std::vector<std::string>& request_ids) override;
  std::vector<InstanceDescription> DescribeInstances(
      const std::vector<std::string>& instance_ids) override;
  void TerminateInstances(const std::vector<std::string>& instance_ids) override;
  void DeleteSecurityGroup(const std::string& group_id) override;
  void DeleteKeyPair(const std::string& name) override;

private:
  std::unique_ptr<Aws::EC2::EC2Client> ec2_;
};

}  // namespace burst

#endif  // EC2_CONTROL_PLANE_H
