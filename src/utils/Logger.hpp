#pragma once

#include <sstream>
#include <string>

namespace markup {

class Logger {
 public:
  enum LogLevel { DEBUG, INFO, ERROR };

  // Logger can also be used as a temporary RAII stream object. This allows
  // usage like: MARKUP_LOG(INFO) << "message"; A temporary Logger is
  // constructed with the message location and level, its stream() is used to
  // build the message, and the destructor forwards the composed message to
  // the static logging backend.
  Logger(LogLevel level, const char* file, int line);
  ~Logger();

  std::ostringstream& stream();

 private:
  // Disable copying since this is a temporary RAII object
  Logger(const Logger&);
  Logger& operator=(const Logger&);

  LogLevel msgLevel_;
  const char* file_;
  int line_;
  std::ostringstream stream_;

  static LogLevel level_;

  static std::string getCurrentTime();

 public:
  static void setLevel(LogLevel level);
  static LogLevel getLevel();
  static bool isEnabled(LogLevel level);
  static std::string levelToString(LogLevel level);
  static void log(LogLevel level, const std::string& message);

  // Read MARKUP_LOG_LEVEL from the environment and apply it. Unset leaves
  // the current level alone; an unparsable value is reported and ignored.
  // Returns true if the level was changed.
  static bool configureFromEnv();
};

// Parse a log level given as "0".."2", "debug"/"info"/"error" (any case) or
// the "-l:N" flag form. Returns the level as int, or -1 if not recognized.
int parseLogLevel(const std::string& arg);

}  // namespace markup

// Skips building the message entirely when the level is filtered out.
#define MARKUP_LOG(level)                                        \
  if (!::markup::Logger::isEnabled(::markup::Logger::level)) {   \
  } else                                                         \
    ::markup::Logger(::markup::Logger::level, __FILE__, __LINE__).stream()
