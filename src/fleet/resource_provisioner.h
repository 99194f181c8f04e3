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

// Creates the security group and key pair shared by every instance of a run.
#ifndef RESOURCE_PROVISIONER_H
#define RESOURCE_PROVISIONER_H

#include <memory>
#include <string>

#include "common/logger.h"
#include "control-plane/control_plane.h"

namespace burst {
namespace internal {

struct ProvisionedResources {
  std::string security_group_id;
  std::string key_name;
  std::string private_key_path;
};

// A private file created with owner-only permissions and removed on
// destruction.
class TempKeyFile {
public:
  TempKeyFile() {}
  ~TempKeyFile();

  TempKeyFile(const TempKeyFile&) = delete;
  TempKeyFile& operator=(const TempKeyFile&) = delete;

  // Create the file and write contents to it. Throws ProvisioningError.
  void Write(const std::string& contents);

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

class ResourceProvisioner {
public:
  ResourceProvisioner(std::shared_ptr<ControlPlane> ec2, const Logger& log);

  // Create the security group with remote-shell and intra-fleet ingress, and
  // a fresh key pair whose private half is written to a temporary file.
  // Call once. Throws ProvisioningError.
  void Provision();

  // Valid after Provision. The key file lives as long as this object.
  const ProvisionedResources& resources() const { return resources_; }

private:
  std::shared_ptr<ControlPlane> ec2_;
  Logger log_;
  ProvisionedResources resources_;
  TempKeyFile key_file_;
};

// Name prefix followed by random alphanumerics.
std::string RandomName(const std::string& prefix, int length);

}  // namespace internal
}  // namespace burst

#endif  // RESOURCE_PROVISIONER_H
