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

// Leveled logging to a caller-supplied stream. Copies share the sink and the
// lock guarding it, so setup workers and the cleanup thread can log through
// their own copy.
#ifndef BURST_LOGGER_H
#define BURST_LOGGER_H

#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace burst {

enum class LogLevel { kTrace = 0, kDebug, kInfo, kWarn, kError, kCrit };

class Logger {
public:
  // Discards everything.
  Logger();

  // sink must outlive every copy of this logger, including the ones held by
  // a pending cleanup task.
  Logger(std::ostream* sink, LogLevel level);

  // Logs to stderr at debug, or at the level named by BURST_LOG_LEVEL.
  static Logger Terminal();

  // Parse "trace", "debug", "info", "warn", "error" or "crit".
  // Return false if the name is not recognized.
  static bool ParseLevel(const std::string& name, LogLevel* level);

  bool Enabled(LogLevel level) const;
  void Log(LogLevel level, const std::string& message) const;

  void Trace(const std::string& message) const {
    Log(LogLevel::kTrace, message);
  }
  void Debug(const std::string& message) const {
    Log(LogLevel::kDebug, message);
  }
  void Info(const std::string& message) const {
    Log(LogLevel::kInfo, message);
  }
  void Warn(const std::string& message) const {
    Log(LogLevel::kWarn, message);
  }
  void Error(const std::string& message) const {
    Log(LogLevel::kError, message);
  }
  void Crit(const std::string& message) const {
    Log(LogLevel::kCrit, message);
  }

private:
  std::ostream* sink_;
  LogLevel level_;
  std::shared_ptr<std::mutex> mutex_;
};

}  // namespace burst

#endif  // BURST_LOGGER_H
