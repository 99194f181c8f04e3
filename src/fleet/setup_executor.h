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

// Runs each group's setup routine on every machine of the group, in parallel
// on a bounded pool of threads.
#ifndef SETUP_EXECUTOR_H
#define SETUP_EXECUTOR_H

#include <cstddef>
#include <exception>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/logger.h"
#include "fleet/machine.h"
#include "ssh/remote_session.h"

namespace burst {
namespace internal {

struct SetupReport {
  // One entry per failed machine, in no particular order. Each holds a
  // ConnectionError, AuthenticationError or SetupRoutineError.
  std::vector<std::exception_ptr> errors;

  bool AllClear() const { return errors.empty(); }
};

class ParallelSetupExecutor {
public:
  // max_workers of 0 means one worker per hardware thread.
  ParallelSetupExecutor(std::shared_ptr<SessionConnector> connector,
                        const Logger& log, size_t max_workers, int port);

  // Attempt every machine exactly once: connect to its public address with
  // the key at key_path, then run routines[machine group] on the session. A
  // failure does not stop any other machine. On success the session is
  // stored in Machine::ssh.
  SetupReport Run(FleetMap* fleet,
                  const std::map<std::string, SetupRoutine>& routines,
                  const std::string& key_path);

private:
  struct Task {
    const std::string* group;
    Machine* machine;
    const SetupRoutine* routine;
  };

  // Return nullptr on success, otherwise the failure.
  std::exception_ptr RunOne(const Task& task, const std::string& key_path);

  std::shared_ptr<SessionConnector> connector_;
  Logger log_;
  size_t max_workers_;
  int port_;
};

}  // namespace internal
}  // namespace burst

#endif  // SETUP_EXECUTOR_H
