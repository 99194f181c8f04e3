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
#include <cstdio>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "common/logger.h"

#define FAIL(x) printf("[FAIL]: " #x "\n")
#define PASS(x) printf("[PASS]: " #x "\n")

using burst::Logger;
using burst::LogLevel;

int main(int argc, char** argv) {
  LogLevel level = LogLevel::kCrit;
  if (!Logger::ParseLevel("trace", &level) || level != LogLevel::kTrace ||
      !Logger::ParseLevel("warn", &level) || level != LogLevel::kWarn ||
      Logger::ParseLevel("verbose", &level) || level != LogLevel::kWarn) {
    FAIL("Parse log level names");
    return 1;
  }
  PASS("Parse log level names");

  std::ostringstream out;
  Logger log(&out, LogLevel::kInfo);
  log.Debug("hidden");
  log.Info("spinning up burst");
  log.Warn("failed to cancel spot instance requests");
  if (out.str() !=
      "[LOG]: spinning up burst\n"
      "[WARN]: failed to cancel spot instance requests\n") {
    FAIL("Tag and filter log lines");
    return 1;
  }
  PASS("Tag and filter log lines");

  // Copies share the sink, so concurrent lines never interleave
  std::ostringstream shared;
  Logger original(&shared, LogLevel::kTrace);
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    Logger copy = original;
    threads.push_back(std::thread([copy]() {
      for (int j = 0; j < 100; ++j) { copy.Trace("setting up machine"); }
    }));
  }
  for (auto& t : threads) { t.join(); }
  std::istringstream lines(shared.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    if (line != "[TRACE]: setting up machine") {
      FAIL("Serialize writes between copies");
      return 1;
    }
    ++count;
  }
  if (count != 400) {
    FAIL("Serialize writes between copies");
    return 1;
  }
  PASS("Serialize writes between copies");

  Logger silent;
  if (silent.Enabled(LogLevel::kCrit)) {
    FAIL("Discard everything by default");
    return 1;
  }
  setenv("BURST_LOG_LEVEL", "error", 1);
  Logger terminal = Logger::Terminal();
  if (terminal.Enabled(LogLevel::kWarn) || !terminal.Enabled(LogLevel::kError)) {
    FAIL("Take the terminal level from the environment");
    return 1;
  }
  PASS("Configure loggers");

  return 0;
}
