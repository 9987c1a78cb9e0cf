/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <unistd.h>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <fmt/chrono.h>

#include <droidflow/IncludeMacros.h>
#include <droidflow/Log.h>

namespace {

constexpr std::string_view k_trace_module = "DROIDFLOW";

/**
 * Parse the `TRACE` variable. Tokens are separated by `,`, `:` or spaces. A
 * non-numeric token names a module and the numeric token that follows it is
 * that module's level. A lone number applies to every module.
 */
int level_from_trace(const std::string& configuration) {
  std::vector<std::string> tokens;
  boost::split(tokens, configuration, boost::is_any_of(",: "));

  int level = 0;
  std::string module;
  for (const auto& token : tokens) {
    if (token.empty()) {
      continue;
    }
    int value = std::atoi(token.c_str());
    if (value == 0) {
      module = token;
    } else if (module.empty() || module == k_trace_module) {
      level = value;
    }
  }
  return level;
}

class LoggerImplementation {
 public:
  LoggerImplementation() : level_(0), file_(stderr), owns_file_(false) {
    if (const char* trace = std::getenv("TRACE")) {
      level_ = level_from_trace(trace);
    }
    is_interactive_ = isatty(fileno(stderr));
  }

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(LoggerImplementation)

  void set_level(int level) {
    level_ = level;
  }

  int get_level() const {
    return level_;
  }

  bool enabled(int level) const {
    return level <= level_;
  }

  bool is_interactive() const {
    return is_interactive_;
  }

  void set_output_file(const std::filesystem::path& path) {
    FILE* file = std::fopen(path.c_str(), "a");
    if (file == nullptr) {
      throw std::invalid_argument(
          fmt::format("Unable to open log file `{}`.", path.string()));
    }

    std::lock_guard<std::mutex> guard(mutex_);
    if (owns_file_) {
      std::fclose(file_);
    }
    file_ = file;
    owns_file_ = true;
    is_interactive_ = false;
  }

  void log(std::string_view section, int level, std::string_view message) {
    if (!enabled(level)) {
      return;
    }

    std::string line = fmt::format(
        "{:%Y-%m-%d %H:%M:%S} {} {}\n",
        fmt::localtime(std::time(nullptr)),
        section,
        message);

    std::lock_guard<std::mutex> guard(mutex_);
    std::fwrite(line.data(), 1, line.size(), file_);
    std::fflush(file_);
  }

 private:
  int level_;
  FILE* file_;
  bool owns_file_;
  bool is_interactive_;
  std::mutex mutex_;
};

LoggerImplementation& logger() {
  static LoggerImplementation implementation;
  return implementation;
}

} // namespace

namespace droidflow {

void Logger::set_level(int level) {
  logger().set_level(level);
}

int Logger::get_level() {
  return logger().get_level();
}

bool Logger::enabled(int level) {
  return logger().enabled(level);
}

void Logger::set_output_file(const std::filesystem::path& path) {
  logger().set_output_file(path);
}

void Logger::log(
    std::string_view section,
    int level,
    std::string_view message) {
  logger().log(section, level, message);
}

bool Logger::is_interactive_output() {
  return logger().is_interactive();
}

} // namespace droidflow
