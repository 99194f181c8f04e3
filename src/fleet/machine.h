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

// Fleet descriptors supplied by the caller and the machines handed back.
#ifndef MACHINE_H
#define MACHINE_H

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ssh/remote_session.h"

namespace burst {

// Runs once per instance of a group, over that instance's session. Signal
// failure by throwing. The same routine runs concurrently for every instance
// of its group, so it must not mutate state shared between calls.
typedef std::function<void(RemoteSession&)> SetupRoutine;

// How to launch and prepare every machine of one group.
class MachineSetup {
public:
  MachineSetup(const std::string& instance_type, const std::string& ami,
               SetupRoutine setup)
      : instance_type_(instance_type), ami_(ami), setup_(setup) {}

  const std::string& instance_type() const { return instance_type_; }
  const std::string& ami() const { return ami_; }
  const SetupRoutine& setup() const { return setup_; }

private:
  std::string instance_type_;
  std::string ami_;
  SetupRoutine setup_;
};

struct MachineSet {
  MachineSetup setup;
  int32_t count;
};

// Group name -> descriptor and requested count.
typedef std::map<std::string, MachineSet> FleetPlan;

// A running instance with complete network addressing. ssh is empty until
// the group's setup routine has succeeded on it.
struct Machine {
  std::string instance_id;
  std::string group;
  std::string instance_type;
  std::string private_ip;
  std::string public_dns;
  std::string public_ip;
  std::unique_ptr<RemoteSession> ssh;
};

// Group name -> machines of that group.
typedef std::map<std::string, std::vector<Machine>> FleetMap;

// Receives the fully set-up fleet. Signal failure by throwing.
typedef std::function<void(FleetMap&)> FleetCallback;

}  // namespace burst

#endif  // MACHINE_H
