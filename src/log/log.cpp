#include "dheap/log.h"

#include <ctime>
#include <sstream>
#include <unordered_map>

#include "dheap/utils/string.h"

namespace dheap {

const Logger::Formatter Logger::default_formatter =
    [](Logger::Level level, const std::string &content,
       std::thread::id thread_id, const std::source_location location,
       std::chrono::time_point<std::chrono::system_clock> time) -> std::string {
  // format time
  // year-month-day hour:min:second, for example 2023-01-05 09:05:01
  auto in_time_t = std::chrono::system_clock::to_time_t(time);
  std::tm tm_buf{};
  localtime_r(&in_time_t, &tm_buf);
  char strtime[32] = {};
  std::strftime(strtime, sizeof(strtime), "%Y-%m-%d %H:%M:%S", &tm_buf);

  std::stringstream ss;
  ss << "[" << Logger::to_string(level) << "]"  // Level
     << "[" << strtime << "]"                    // Time
     << "[thread " << thread_id << "]"           // Thread
     << "[" << location.file_name() << "(" << location.line() << ":"
     << location.column() << ") `" << location.function_name() << "`"
     << "]: " << content << "\n";
  return ss.str();
};

std::string Logger::to_string(Logger::Level level) {
  switch (level) {
    case Level::TRACE:
      return "TRACE";
    case Level::DEBUG:
      return "DEBUG";
    case Level::INFO:
      return "INFO";
    case Level::WARN:
      return "WARN";
    case Level::ERROR:
      return "ERROR";
    case Level::FATAL:
      return "FATAL";
  }
  return "";
}

bool Logger::parse(const std::string &name, Logger::Level &level) {
  static const std::unordered_map<std::string, Level> str2level = {
      {"trace", Level::TRACE}, {"debug", Level::DEBUG},
      {"info", Level::INFO},   {"warn", Level::WARN},
      {"error", Level::ERROR}, {"fatal", Level::FATAL},
  };
  if (auto it = str2level.find(utils::tolower(name)); it != str2level.end()) {
    level = it->second;
    return true;
  }
  return false;
}

static void close_writer(std::fstream *ptr) {
  if (ptr == nullptr) return;
  ptr->flush();
  ptr->close();
  delete ptr;
}

bool Logger::set(std::unique_ptr<std::fstream> writer) {
  if (writer == nullptr) return false;

  if (!running_) {
    writer_ = WriterPtr(writer.release(), close_writer);
    return true;
  }

  // save logs in the previous writer
  flush();
  temporary_stop_ = true;
  // The reason why stop the writer thread is to avoid writer_ conflict
  stop();
  writer_ = WriterPtr(writer.release(), close_writer);
  start();
  temporary_stop_ = false;
  return true;
}

bool Logger::open(const std::string &path) {
  auto fs = std::make_unique<std::fstream>(path, std::ios::out | std::ios::app);
  if (!fs->is_open()) return false;
  return set(std::move(fs));
}

bool Logger::start() {
  if (running_ || writer_ == nullptr) return false;
  running_ = true;
  writer_thread_ = std::thread(&Logger::writer_worker, this);
  return true;
}

bool Logger::log(Logger::Level level, const std::string &content,
                 std::thread::id id, const std::source_location location,
                 const Logger::Formatter &formatter) {
  // logs are kept during a temporary suspension caused by set()
  if (!running_ && !temporary_stop_) return false;
  if (level < level_) return false;
  auto time = std::chrono::system_clock::now();
  auto msg = formatter == nullptr
                 ? content + "\n"
                 : formatter(level, content, id, location, time);
  bool notify = false;
  {
    std::lock_guard lock(logs_mutex_);
    logs_.emplace_back(std::move(msg));
    notify = waiting_flush_ || logs_.size() >= write_size_;
  }
  // wake the writer thread
  if (notify) logs_avail_cv_.notify_one();
  return true;
}

bool Logger::flush() {
  if (!running_) return false;
  std::unique_lock lock(logs_mutex_);
  waiting_flush_ = true;
  logs_avail_cv_.notify_one();
  flush_done_cv_.wait(lock, [this] { return logs_.empty() && !writing_; });
  waiting_flush_ = false;
  return true;
}

bool Logger::stop() {
  if (!running_) return false;
  {
    std::lock_guard lock(logs_mutex_);
    running_ = false;
  }
  logs_avail_cv_.notify_one();
  writer_thread_.join();
  return true;
}

void Logger::write(std::list<std::string> &logs) {
  for (auto &log : logs) (*writer_) << log;
  writer_->flush();
}

void Logger::writer_worker() {
  std::unique_lock lock(logs_mutex_);
  for (;;) {
    logs_avail_cv_.wait(lock, [this] {
      return !running_ || (!logs_.empty() &&
                           (waiting_flush_ || logs_.size() >= write_size_));
    });
    if (!logs_.empty()) {
      decltype(logs_) logs;
      logs.swap(logs_);
      writing_ = true;
      lock.unlock();
      write(logs);
      lock.lock();
      writing_ = false;
    }
    flush_done_cv_.notify_all();
    // the remaining logs have been written above
    if (!running_ && logs_.empty()) break;
  }
}

Logger::~Logger() {
  if (running_) {
    // ensure the writer thread ends before Logger
    stop();
  } else if (writer_ != nullptr) {
    std::list<std::string> logs;
    {
      std::lock_guard lock(logs_mutex_);
      logs.swap(logs_);
    }
    write(logs);
  }
}

}  // namespace dheap
