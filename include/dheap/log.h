#ifndef DHEAP_LOG_H_
#define DHEAP_LOG_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <thread>

namespace dheap {

class Logger {
 protected:
  using WriterPtr =
      std::unique_ptr<std::fstream, std::function<void(std::fstream *)>>;

 private:
  Logger() = default;
  Logger(const Logger &) = delete;
  Logger(Logger &&) = delete;
  Logger &operator=(const Logger &) = delete;
  Logger &operator=(Logger &&) = delete;

 public:
  enum class Level {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
  };

  using Formatter = std::function<std::string(
      Logger::Level, const std::string &, std::thread::id,
      const std::source_location,
      std::chrono::time_point<std::chrono::system_clock>)>;

  static const Formatter default_formatter;

  /**
   * @brief Name of the level, for example "WARN".
   */
  static std::string to_string(Level level);

  /**
   * @brief Parse a case-insensitive level name.
   * @return Return false if the name is unknown, level is left untouched.
   */
  static bool parse(const std::string &name, Level &level);

  /**
   * @brief Set the writer for the logger. This method will stop the writer
   * thread temporarily.
   */
  bool set(std::unique_ptr<std::fstream> writer);

  /**
   * @brief Open path in append mode and use it as the writer.
   * @return Return false if the file can't be opened.
   */
  bool open(const std::string &path);

  /**
   * @brief Set the positive number of logs written by the writer thread at one
   * time. The default value is 8.
   */
  bool set(size_t write_size) {
    if (write_size == 0) return false;
    write_size_ = write_size;
    return true;
  }

  /**
   * @brief Set the log level. The default value is INFO.
   */
  void set(Level level) { level_ = level; }

  Level level() const { return level_; }

  /**
   * @brief Whether a message of this level would be kept.
   */
  bool enabled(Level level) const { return running_ && level >= level_; }

  /**
   * @brief Start the writer thread.
   * @return Return false if one of the conditions is met. 1. The writer thread
   * has been started. 2. Writer is not set.
   */
  bool start();

  /**
   * @brief Stop the writer thread. Buffered logs are written first.
   * @return Return false if the writer thread has not been started.
   */
  bool stop();

  /**
   * @brief Get the instance of the Logger
   */
  static Logger &get_instance() {
    static Logger instance;
    return instance;
  }

  ~Logger();

  bool trace(
      const std::string &content,
      const std::source_location location = std::source_location::current()) {
    return log(Level::TRACE, content, std::this_thread::get_id(), location);
  }

  bool debug(
      const std::string &content,
      const std::source_location location = std::source_location::current()) {
    return log(Level::DEBUG, content, std::this_thread::get_id(), location);
  }

  bool info(
      const std::string &content,
      const std::source_location location = std::source_location::current()) {
    return log(Level::INFO, content, std::this_thread::get_id(), location);
  }

  bool warn(
      const std::string &content,
      const std::source_location location = std::source_location::current()) {
    return log(Level::WARN, content, std::this_thread::get_id(), location);
  }

  bool error(
      const std::string &content,
      const std::source_location location = std::source_location::current()) {
    return log(Level::ERROR, content, std::this_thread::get_id(), location);
  }

  bool fatal(
      const std::string &content,
      const std::source_location location = std::source_location::current()) {
    return log(Level::FATAL, content, std::this_thread::get_id(), location);
  }

  /**
   * @brief Add log.
   * @return Return false if the log is dropped, i.e. its level is below the
   * logger level or the writer thread is not running.
   */
  bool log(
      Level level, const std::string &content,
      std::thread::id id = std::this_thread::get_id(),
      const std::source_location location = std::source_location::current(),
      const Formatter &formatter = default_formatter);

  /**
   * @brief Flush logs.
   * @return Return false if the writer thread is not running.
   */
  bool flush();

 protected:
  void writer_worker();

  /**
   * @brief Write logs with writer_, the caller must not hold logs_mutex_.
   */
  void write(std::list<std::string> &logs);

  std::atomic<Level> level_ = Level::INFO;

  /**
   * @brief mutex for logs_ and writing_
   */
  std::mutex logs_mutex_ = {};

  std::condition_variable logs_avail_cv_ = {};

  /**
   * @brief buffer of logs
   */
  std::list<std::string> logs_ = {};

  WriterPtr writer_ = nullptr;

  std::thread writer_thread_;

  /**
   * @brief The number of logs written by the writer thread at one time.
   */
  std::atomic<size_t> write_size_ = 8;

  /**
   * @brief An atomic variable indicating to the writer to keep running.
   */
  std::atomic<bool> running_ = {false};

  /**
   * @brief Set by flush() to make the writer thread write a partial batch.
   */
  std::atomic<bool> waiting_flush_ = {false};

  /**
   * @brief True while the writer thread writes a batch it took from logs_.
   */
  bool writing_ = false;

  std::condition_variable flush_done_cv_ = {};

  /**
   * @brief Temporary suspension flag, it is used to update the writer
   */
  std::atomic<bool> temporary_stop_ = false;
};

}  // namespace dheap

#endif
