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

#include <stdlib.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "common/errors.h"
#include "fleet/resource_provisioner.h"
#include "include/constants.h"

namespace burst {
namespace internal {

std::string RandomName(const std::string& prefix, int length) {
  static const char alphanumeric[] =
      "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> pick(0, sizeof(alphanumeric) - 2);

  std::string name = prefix;
  for (int i = 0; i < length; ++i) { name.push_back(alphanumeric[pick(gen)]); }
  return name;
}

TempKeyFile::~TempKeyFile() {
  if (!path_.empty() && unlink(path_.c_str()) < 0) {
    std::cerr << "warning: remove " << path_ << " failed" << std::endl;
  }
}

void TempKeyFile::Write(const std::string& contents) {
  const char* tmpdir = getenv("TMPDIR");
  std::string templ =
      std::string(tmpdir ? tmpdir : "/tmp") + "/burst_key_XXXXXX";
  std::vector<char> name(templ.begin(), templ.end());
  name.push_back('\0');

  // mkstemp creates the file with mode 0600.
  int fd = mkstemp(name.data());
  if (fd < 0) {
    throw ProvisioningError(
        "failed to create temporary file for key-pair: " +
        std::string(std::strerror(errno)));
  }
  path_ = name.data();

  size_t written = 0;
  while (written < contents.size()) {
    ssize_t rc = ::write(fd, contents.data() + written,
                         contents.size() - written);
    if (rc < 0) {
      if (errno == EINTR) { continue; }
      int err = errno;
      ::close(fd);
      throw ProvisioningError("could not write private key to " + path_ +
                              ": " + std::strerror(err));
    }
    written += rc;
  }
  if (::close(fd) < 0) {
    throw ProvisioningError("could not write private key to " + path_ +
                            ": " + std::strerror(errno));
  }
}

ResourceProvisioner::ResourceProvisioner(std::shared_ptr<ControlPlane> ec2,
                                         const Logger& log)
    : ec2_(ec2), log_(log) {}

void ResourceProvisioner::Provision() {
  std::string group_name = RandomName(security_group_prefix,
                                      random_suffix_length);
  log_.Trace("creating security group name=" + group_name);
  try {
    resources_.security_group_id =
        ec2_->CreateSecurityGroup(group_name, security_group_description);
  } catch (const ControlPlaneError& e) {
    throw ProvisioningError(
        "failed to create security group for new machines: " +
        std::string(e.what()));
  }
  if (resources_.security_group_id.empty()) {
    throw ProvisioningError("control plane created security group " +
                            group_name + " with no group id");
  }
  log_.Trace("created security group id=" + resources_.security_group_id);

  try {
    log_.Trace("adding ssh access to security group");
    ec2_->AuthorizeIngress(resources_.security_group_id, "tcp", ssh_port,
                           ssh_port, ssh_ingress_cidr);
    log_.Trace("adding internal VM access to security group");
    ec2_->AuthorizeIngress(resources_.security_group_id, "tcp", 0, 65535,
                           fleet_ingress_cidr);
  } catch (const ControlPlaneError& e) {
    throw ProvisioningError("failed to fill in security group " +
                            resources_.security_group_id + ": " + e.what());
  }

  std::string key_name = RandomName(key_pair_prefix, random_suffix_length);
  log_.Trace("creating keypair name=" + key_name);
  KeyPair key;
  try {
    key = ec2_->CreateKeyPair(key_name);
  } catch (const ControlPlaneError& e) {
    throw ProvisioningError("failed to generate new key pair: " +
                            std::string(e.what()));
  }
  if (key.material.empty()) {
    throw ProvisioningError("control plane did not generate key material for " +
                            key_name);
  }
  resources_.key_name = key.name.empty() ? key_name : key.name;
  log_.Trace("created keypair fingerprint=" + key.fingerprint);

  key_file_.Write(key.material);
  resources_.private_key_path = key_file_.path();
  log_.Trace("wrote keypair to file filename=" + resources_.private_key_path);
}

}  // namespace internal
}  // namespace burst
