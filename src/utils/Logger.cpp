#include "utils/Logger.hpp"

#include <cstdlib>
#include <ctime>
#include <iostream>
#include <sstream>

#include "utils/utils.hpp"

namespace markup {

// Logger instance implementation used as a temporary RAII stream object
// constructed by the MARKUP_LOG(...) macro.

Logger::Logger(LogLevel level, const char* file, int line)
    : msgLevel_(level), file_(file), line_(line) {}

Logger::~Logger() {
  std::ostringstream oss;
  if (level_ == DEBUG) {
    oss << "(" << file_ << ":" << line_ << ")\t";
  }
  oss << stream_.str();
  Logger::log(msgLevel_, oss.str());
}

std::ostringstream& Logger::stream() {
  return stream_;
}

Logger::LogLevel Logger::level_ = Logger::INFO;

void Logger::setLevel(LogLevel level) {
  level_ = level;
}

Logger::LogLevel Logger::getLevel() {
  return level_;
}

bool Logger::isEnabled(LogLevel level) {
  return level >= level_;
}

std::string Logger::getCurrentTime() {
  static const size_t kTimeBufferSize = 32;
  time_t now = time(0);
  struct tm timeinfo;
  localtime_r(&now, &timeinfo);
  char buffer[kTimeBufferSize];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &timeinfo);
  return std::string(buffer);
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
    case DEBUG:
      return "DEBUG";
    case INFO:
      return "INFO";
    case ERROR:
      return "ERROR";
    default:
      return "UNKNOWN";
  }
}

void Logger::log(LogLevel level, const std::string& message) {
  if (level < level_) {
    return;
  }

  // A library must not write to stdout, which may carry the rendered markup.
  std::clog << "[" << getCurrentTime() << "] [" << levelToString(level)
            << "]\t" << message << '\n';
}

bool Logger::configureFromEnv() {
  const char* value = std::getenv("MARKUP_LOG_LEVEL");
  if (value == NULL) {
    return false;
  }
  int level = parseLogLevel(value);
  if (level < 0) {
    MARKUP_LOG(ERROR) << "Ignoring invalid MARKUP_LOG_LEVEL '" << value
                      << "'";
    return false;
  }
  setLevel(static_cast<LogLevel>(level));
  return true;
}

int parseLogLevel(const std::string& arg) {
  std::string value = trim_copy(arg);

  // Flag form: "-l:N"
  if (value.length() == 4 && value.compare(0, 3, "-l:") == 0) {
    value = value.substr(3);
  }

  if (value.length() == 1) {
    char level = value[0];
    if (level < '0' || level > '2') {
      return -1;
    }
    return level - '0';
  }

  std::string lowered = asciiLower(value);
  if (lowered == "debug") {
    return Logger::DEBUG;
  }
  if (lowered == "info") {
    return Logger::INFO;
  }
  if (lowered == "error") {
    return Logger::ERROR;
  }
  return -1;
}

}  // namespace markup
