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
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "common/logger.h"

namespace burst {
namespace {

const char* LevelTag(LogLevel level) {
  switch (level) {
    case LogLevel::kTrace:
      return "[TRACE]: ";
    case LogLevel::kDebug:
      return "[DEBUG]: ";
    case LogLevel::kInfo:
      return "[LOG]: ";
    case LogLevel::kWarn:
      return "[WARN]: ";
    case LogLevel::kError:
      return "[ERROR]: ";
    case LogLevel::kCrit:
      return "[CRIT]: ";
  }
  return "[LOG]: ";
}

}  // namespace

Logger::Logger()
    : sink_(nullptr),
      level_(LogLevel::kCrit),
      mutex_(std::make_shared<std::mutex>()) {}

Logger::Logger(std::ostream* sink, LogLevel level)
    : sink_(sink), level_(level), mutex_(std::make_shared<std::mutex>()) {}

Logger Logger::Terminal() {
  LogLevel level = LogLevel::kDebug;
  if (const char* env_level = getenv("BURST_LOG_LEVEL")) {
    if (!ParseLevel(env_level, &level)) {
      std::cerr << "Ignoring unknown BURST_LOG_LEVEL: " << env_level
                << std::endl;
    }
  }
  return Logger(&std::cerr, level);
}

bool Logger::ParseLevel(const std::string& name, LogLevel* level) {
  if (name == "trace") {
    *level = LogLevel::kTrace;
  } else if (name == "debug") {
    *level = LogLevel::kDebug;
  } else if (name == "info") {
    *level = LogLevel::kInfo;
  } else if (name == "warn") {
    *level = LogLevel::kWarn;
  } else if (name == "error") {
    *level = LogLevel::kError;
  } else if (name == "crit") {
    *level = LogLevel::kCrit;
  } else {
    return false;
  }
  return true;
}

bool Logger::Enabled(LogLevel level) const {
  return sink_ != nullptr && level >= level_;
}

void Logger::Log(LogLevel level, const std::string& message) const {
  if (!Enabled(level)) { return; }
  std::lock_guard<std::mutex> lock(*mutex_);
  *sink_ << LevelTag(level) << message << std::endl;
}

}  // namespace burst
