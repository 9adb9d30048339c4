#pragma once
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

// Asynchronous logger that writes time stamped messages to stderr and to
// pointview.log in the working directory.
class Logger {
public:
  static constexpr const char *kLogFileName = "pointview.log";

  // Access singleton instance, creating log file on first use.
  static Logger &Instance();

  // Queue a message to be logged.
  void Log(const std::string &msg);

  // Disable the stderr copy (the log file is always written).
  void SetEchoToStderr(bool echo);

private:
  Logger();
  ~Logger();
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void Worker();

  struct Entry {
    std::string timestamp;
    std::string text;
  };

  std::ofstream file_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<Entry> queue_;
  bool done_ = false;
  bool echo_ = true;
  std::thread worker_;
};
