#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>

#include "beright/logging/log_level.hpp"
#include "beright/logging/logger.hpp"

namespace beright::logging
{

  struct AsyncJsonLoggerOptions
  {
    LogLevel level = LogLevel::Info;
    // Bound on events waiting for the writer thread.
    std::size_t queue_size = 10000;
    DropPolicy drop_policy = DropPolicy::DropOldest;
    std::string output_path = "logs/beright.log.json";
    // Events at or above this level are also echoed as plain text; empty disables.
    std::optional<LogLevel> console_level = LogLevel::Warn;
    // Echo target; null means std::cerr.
    std::ostream *console = nullptr;
  };

  /**
   * Logger writing one JSON object per line to output_path from a background
   * thread. log() never blocks on file I/O; when the queue is full events are
   * dropped per drop_policy and a dropped_logs summary is written instead.
   * Falls back to stderr when the file cannot be opened.
   */
  class AsyncJsonLogger : public Logger
  {
  public:
    explicit AsyncJsonLogger(AsyncJsonLoggerOptions options);
    // Drains the queue and joins the writer.
    ~AsyncJsonLogger() override;

    AsyncJsonLogger(const AsyncJsonLogger &) = delete;
    AsyncJsonLogger &operator=(const AsyncJsonLogger &) = delete;
    AsyncJsonLogger(AsyncJsonLogger &&) = delete;
    AsyncJsonLogger &operator=(AsyncJsonLogger &&) = delete;

    using Logger::log;

    void log(LogEvent event) override;
    [[nodiscard]] LogLevel level() const override { return options_.level; }

  private:
    void run();
    void enqueue(LogEvent event);
    void write_batch(const std::deque<LogEvent> &batch);
    void write_event(const LogEvent &event);
    void echo_to_console(const LogEvent &event);
    void write_dropped_summary(std::uint64_t dropped);
    void ensure_output_path();

    AsyncJsonLoggerOptions options_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<LogEvent> queue_;
    bool stop_ = false;
    std::atomic<std::uint64_t> dropped_count_{0};

    std::mutex console_mutex_;
    std::ostream *console_;

    std::ofstream file_;
    std::ostream *out_;
    std::thread worker_;
  };

} // namespace beright::logging
