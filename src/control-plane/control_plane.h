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

// The subset of the cloud control plane the orchestrator drives. Values are
// plain structs so that fleet logic is independent of the SDK.
#ifndef CONTROL_PLANE_H
#define CONTROL_PLANE_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace burst {

struct KeyPair {
  std::string name;
  std::string fingerprint;
  std::string material;  // PEM-encoded private key
};

struct SpotLaunchSpec {
  std::string image_id;
  std::string instance_type;
  std::string security_group_id;
  std::string key_name;
};

// One spot instance request as reported by describe. instance_id is empty
// until the control plane has assigned an instance.
struct SpotRequestStatus {
  std::string request_id;
  std::string state;  // open, active, closed, cancelled, failed
  std::string instance_id;
};

// Fields the control plane has not reported yet are empty.
struct InstanceDescription {
  std::string instance_id;
  std::string instance_type;
  std::string private_ip;
  std::string public_dns;
  std::string public_ip;
};

class ControlPlaneError : public std::runtime_error {
public:
  enum Kind {
    kFatal = 0,
    kTransient,  // Connection reset, broken pipe, throttling
    kNotFound    // Identifier not yet visible (read-after-write lag)
  };

  ControlPlaneError(const std::string& operation, Kind kind,
                    const std::string& exception_name,
                    const std::string& message)
      : std::runtime_error(operation + " failed: " + exception_name + ": " +
                           message),
        operation_(operation),
        kind_(kind),
        exception_name_(exception_name) {}

  const std::string& operation() const { return operation_; }
  Kind kind() const { return kind_; }
  const std::string& exception_name() const { return exception_name_; }
  bool IsTransient() const { return kind_ == kTransient; }
  bool IsNotFound() const { return kind_ == kNotFound; }

private:
  std::string operation_;
  Kind kind_;
  std::string exception_name_;
};

// All calls throw ControlPlaneError on failure.
class ControlPlane {
public:
  virtual ~ControlPlane() {}

  // Return the new group's id.
  virtual std::string CreateSecurityGroup(const std::string& name,
                                          const std::string& description) = 0;

  virtual void AuthorizeIngress(const std::string& group_id,
                                const std::string& protocol, int from_port,
                                int to_port, const std::string& cidr) = 0;

  virtual KeyPair CreateKeyPair(const std::string& name) = 0;

  // Submit one request for count instances. Return one request id per
  // instance.
  virtual std::vector<std::string> RequestSpotInstances(
      const SpotLaunchSpec& spec, int32_t count) = 0;

  virtual std::vector<SpotRequestStatus> DescribeSpotRequests(
      const std::vector<std::string>& request_ids) = 0;

  virtual void CancelSpotRequests(
      const std::vector<std::string>& request_ids) = 0;

  virtual std::vector<InstanceDescription> DescribeInstances(
      const std::vector<std::string>& instance_ids) = 0;

  virtual void TerminateInstances(
      const std::vector<std::string>& instance_ids) = 0;

  virtual void DeleteSecurityGroup(const std::string& group_id) = 0;

  virtual void DeleteKeyPair(const std::string& name) = 0;
};

}  // namespace burst

#endif  // CONTROL_PLANE_H
