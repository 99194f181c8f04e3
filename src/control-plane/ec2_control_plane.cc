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

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <aws/core/Aws.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/ec2/EC2Client.h>
#include <aws/ec2/model/AuthorizeSecurityGroupIngressRequest.h>
#include <aws/ec2/model/AuthorizeSecurityGroupIngressResponse.h>
#include <aws/ec2/model/CancelSpotInstanceRequestsRequest.h>
#include <aws/ec2/model/CancelSpotInstanceRequestsResponse.h>
#include <aws/ec2/model/CreateKeyPairRequest.h>
#include <aws/ec2/model/CreateKeyPairResponse.h>
#include <aws/ec2/model/CreateSecurityGroupRequest.h>
#include <aws/ec2/model/CreateSecurityGroupResponse.h>
#include <aws/ec2/model/DeleteKeyPairRequest.h>
#include <aws/ec2/model/DeleteSecurityGroupRequest.h>
#include <aws/ec2/model/DescribeInstancesRequest.h>
#include <aws/ec2/model/DescribeInstancesResponse.h>
#include <aws/ec2/model/DescribeSpotInstanceRequestsRequest.h>
#include <aws/ec2/model/DescribeSpotInstanceRequestsResponse.h>
#include <aws/ec2/model/InstanceType.h>
#include <aws/ec2/model/RequestSpotInstancesRequest.h>
#include <aws/ec2/model/RequestSpotInstancesResponse.h>
#include <aws/ec2/model/RequestSpotLaunchSpecification.h>
#include <aws/ec2/model/SpotInstanceState.h>
#include <aws/ec2/model/TerminateInstancesRequest.h>
#include <aws/ec2/model/TerminateInstancesResponse.h>

#include "control-plane/ec2_control_plane.h"

namespace burst {
namespace {

namespace model = Aws::EC2::Model;

inline std::string ToStd(const Aws::String& s) {
  return std::string(s.c_str(), s.size());
}

inline Aws::String ToAws(const std::string& s) {
  return Aws::String(s.c_str(), s.size());
}

Aws::Vector<Aws::String> ToAws(const std::vector<std::string>& ids) {
  Aws::Vector<Aws::String> aws_ids;
  aws_ids.reserve(ids.size());
  for (const auto& id : ids) { aws_ids.push_back(ToAws(id)); }
  return aws_ids;
}

// Identifiers the control plane handed out a moment ago may not be visible to
// describe calls yet.
bool IsMissingIdentifier(const std::string& name, const std::string& msg) {
  if (name == "InvalidSpotInstanceRequestID.NotFound" ||
      name == "InvalidInstanceID.NotFound") {
    return true;
  }
  return msg.find("The spot instance request ID") != std::string::npos &&
         msg.find("does not exist") != std::string::npos;
}

// Throw a ControlPlaneError if the outcome failed.
template <typename Outcome>
void CheckOutcome(const Outcome& outcome, const std::string& operation) {
  if (outcome.IsSuccess()) { return; }
  const auto& error = outcome.GetError();
  std::string name = ToStd(error.GetExceptionName());
  std::string msg = ToStd(error.GetMessage());

  ControlPlaneError::Kind kind = ControlPlaneError::kFatal;
  if (IsMissingIdentifier(name, msg)) {
    kind = ControlPlaneError::kNotFound;
  } else if (error.ShouldRetry()) {
    kind = ControlPlaneError::kTransient;
  }
  throw ControlPlaneError(operation, kind, name, msg);
}

}  // namespace

Ec2ControlPlane::Ec2ControlPlane(const std::string& region) {
  Aws::Client::ClientConfiguration client_config;
  client_config.region = ToAws(region);
  ec2_ = std::unique_ptr<Aws::EC2::EC2Client>(
      new Aws::EC2::EC2Client(client_config));
}

std::string Ec2ControlPlane::CreateSecurityGroup(
    const std::string& name, const std::string& description) {
  model::CreateSecurityGroupRequest request;
  request.SetGroupName(ToAws(name));
  request.SetDescription(ToAws(description));
  auto outcome = ec2_->CreateSecurityGroup(request);
  CheckOutcome(outcome, "CreateSecurityGroup");
  return ToStd(outcome.GetResult().GetGroupId());
}

void Ec2ControlPlane::AuthorizeIngress(const std::string& group_id,
                                       const std::string& protocol,
                                       int from_port, int to_port,
                                       const std::string& cidr) {
  model::AuthorizeSecurityGroupIngressRequest request;
  request.SetGroupId(ToAws(group_id));
  request.SetIpProtocol(ToAws(protocol));
  request.SetFromPort(from_port);
  request.SetToPort(to_port);
  request.SetCidrIp(ToAws(cidr));
  auto outcome = ec2_->AuthorizeSecurityGroupIngress(request);
  CheckOutcome(outcome, "AuthorizeSecurityGroupIngress");
}

KeyPair Ec2ControlPlane::CreateKeyPair(const std::string& name) {
  model::CreateKeyPairRequest request;
  request.SetKeyName(ToAws(name));
  auto outcome = ec2_->CreateKeyPair(request);
  CheckOutcome(outcome, "CreateKeyPair");

  const auto& result = outcome.GetResult();
  KeyPair key;
  key.name = ToStd(result.GetKeyName());
  key.fingerprint = ToStd(result.GetKeyFingerprint());
  key.material = ToStd(result.GetKeyMaterial());
  return key;
}

std::vector<std::string> Ec2ControlPlane::RequestSpotInstances(
    const SpotLaunchSpec& spec, int32_t count) {
  model::RequestSpotLaunchSpecification launch;
  launch.SetImageId(ToAws(spec.image_id));
  launch.SetInstanceType(model::InstanceTypeMapper::GetInstanceTypeForName(
      ToAws(spec.instance_type)));
  launch.AddSecurityGroupIds(ToAws(spec.security_group_id));
  launch.SetKeyName(ToAws(spec.key_name));

  model::RequestSpotInstancesRequest request;
  request.SetInstanceCount(count);
  request.SetLaunchSpecification(launch);
  auto outcome = ec2_->RequestSpotInstances(request);
  CheckOutcome(outcome, "RequestSpotInstances");

  std::vector<std::string> request_ids;
  for (const auto& sir : outcome.GetResult().GetSpotInstanceRequests()) {
    if (!sir.GetSpotInstanceRequestId().empty()) {
      request_ids.push_back(ToStd(sir.GetSpotInstanceRequestId()));
    }
  }
  return request_ids;
}

std::vector<SpotRequestStatus> Ec2ControlPlane::DescribeSpotRequests(
    const std::vector<std::string>& request_ids) {
  model::DescribeSpotInstanceRequestsRequest request;
  request.SetSpotInstanceRequestIds(ToAws(request_ids));
  auto outcome = ec2_->DescribeSpotInstanceRequests(request);
  CheckOutcome(outcome, "DescribeSpotInstanceRequests");

  std::vector<SpotRequestStatus> statuses;
  for (const auto& sir : outcome.GetResult().GetSpotInstanceRequests()) {
    SpotRequestStatus status;
    status.request_id = ToStd(sir.GetSpotInstanceRequestId());
    status.state = ToStd(
        model::SpotInstanceStateMapper::GetNameForSpotInstanceState(
            sir.GetState()));
    status.instance_id = ToStd(sir.GetInstanceId());
    statuses.push_back(status);
  }
  return statuses;
}

void Ec2ControlPlane::CancelSpotRequests(
    const std::vector<std::string>& request_ids) {
  model::CancelSpotInstanceRequestsRequest request;
  request.SetSpotInstanceRequestIds(ToAws(request_ids));
  auto outcome = ec2_->CancelSpotInstanceRequests(request);
  CheckOutcome(outcome, "CancelSpotInstanceRequests");
}

std::vector<InstanceDescription> Ec2ControlPlane::DescribeInstances(
    const std::vector<std::string>& instance_ids) {
  model::DescribeInstancesRequest request;
  request.SetInstanceIds(ToAws(instance_ids));
  auto outcome = ec2_->DescribeInstances(request);
  CheckOutcome(outcome, "DescribeInstances");

  std::vector<InstanceDescription> descriptions;
  for (const auto& reservation : outcome.GetResult().GetReservations()) {
    for (const auto& instance : reservation.GetInstances()) {
      InstanceDescription desc;
      desc.instance_id = ToStd(instance.GetInstanceId());
      if (instance.InstanceTypeHasBeenSet()) {
        desc.instance_type =
            ToStd(model::InstanceTypeMapper::GetNameForInstanceType(
                instance.GetInstanceType()));
      }
      desc.private_ip = ToStd(instance.GetPrivateIpAddress());
      desc.public_dns = ToStd(instance.GetPublicDnsName());
      desc.public_ip = ToStd(instance.GetPublicIpAddress());
      descriptions.push_back(desc);
    }
  }
  return descriptions;
}

void Ec2ControlPlane::TerminateInstances(
    const std::vector<std::string>& instance_ids) {
  model::TerminateInstancesRequest request;
  request.SetInstanceIds(ToAws(instance_ids));
  request.SetDryRun(false);
  auto outcome = ec2_->TerminateInstances(request);
  CheckOutcome(outcome, "TerminateInstances");
}

void Ec2ControlPlane::DeleteSecurityGroup(const std::string& group_id) {
  model::DeleteSecurityGroupRequest request;
  request.SetGroupId(ToAws(group_id));
  auto outcome = ec2_->DeleteSecurityGroup(request);
  CheckOutcome(outcome, "DeleteSecurityGroup");
}

void Ec2ControlPlane::DeleteKeyPair(const std::string& name) {
  model::DeleteKeyPairRequest request;
  request.SetKeyName(ToAws(name));
  auto outcome = ec2_->DeleteKeyPair(request);
  CheckOutcome(outcome, "DeleteKeyPair");
}

}  // namespace burst
