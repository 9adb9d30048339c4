#include "logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
std::string CurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3)
     << std::setfill('0') << ms.count();
  return ss.str();
}
} // namespace

Logger &Logger::Instance() {
  static Logger instance;
  return instance;
}

Logger::Logger() {
  file_.open(kLogFileName, std::ios::out | std::ios::trunc);
  worker_ = std::thread(&Logger::Worker, this);
}

Logger::~Logger() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_ = true;
  }
  cv_.notify_one();
  if (worker_.joinable())
    worker_.join();
  if (file_.is_open())
    file_.close();
}

void Logger::Log(const std::string &msg) {
  // Stamp on the caller thread so queued messages keep their real time
  Entry entry{CurrentTimestamp(), msg};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(entry));
  }
  cv_.notify_one();
}

void Logger::SetEchoToStderr(bool echo) {
  std::lock_guard<std::mutex> lock(mutex_);
  echo_ = echo;
}

void Logger::Worker() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this] { return done_ || !queue_.empty(); });
    if (done_ && queue_.empty())
      break;
    Entry entry = std::move(queue_.front());
    queue_.pop();
    bool echo = echo_;
    lock.unlock();
    if (file_.is_open()) {
      file_ << '[' << entry.timestamp << "] " << entry.text << std::endl;
    }
    if (echo)
      std::cerr << '[' << entry.timestamp << "] " << entry.text << std::endl;
    lock.lock();
  }
}
