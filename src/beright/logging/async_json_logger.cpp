#include "beright/logging/async_json_logger.hpp"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>
#include <type_traits>

namespace beright::logging
{

  namespace
  {

    std::uint64_t now_ms()
    {
      return static_cast<std::uint64_t>(
          std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::system_clock::now().time_since_epoch())
              .count());
    }

    void append_json_string(std::string &out, std::string_view text)
    {
      for (char c : text)
      {
        switch (c)
        {
        case '\\':
          out += "\\\\";
          break;
        case '"':
          out += "\\\"";
          break;
        case '\n':
          out += "\\n";
          break;
        case '\r':
          out += "\\r";
          break;
        case '\t':
          out += "\\t";
          break;
        default:
          if (static_cast<unsigned char>(c) < 0x20)
          {
            std::ostringstream escaped;
            escaped << "\\u" << std::hex << std::uppercase << std::setw(4)
                    << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c));
            out += escaped.str();
          }
          else
          {
            out += c;
          }
          break;
        }
      }
    }

    // Doubles keep full precision so Brier scores and probabilities are not
    // flattened to six decimals.
    std::string format_double(double value)
    {
      std::ostringstream out;
      out << std::setprecision(10) << value;
      return out.str();
    }

    std::string plain_value(const LogFieldValue &value)
    {
      return std::visit(
          [](const auto &val) -> std::string
          {
            using T = std::decay_t<decltype(val)>;
            if constexpr (std::is_same_v<T, std::string>)
            {
              return val;
            }
            else if constexpr (std::is_same_v<T, double>)
            {
              return format_double(val);
            }
            else if constexpr (std::is_same_v<T, bool>)
            {
              return val ? "true" : "false";
            }
            else
            {
              return std::to_string(val);
            }
          },
          value);
    }

    void append_field_value(std::string &out, const LogFieldValue &value)
    {
      if (const auto *text = std::get_if<std::string>(&value))
      {
        out += '"';
        append_json_string(out, *text);
        out += '"';
        return;
      }
      out += plain_value(value);
    }

  } // namespace

  AsyncJsonLogger::AsyncJsonLogger(AsyncJsonLoggerOptions options)
      : options_(std::move(options)), console_(nullptr), out_(nullptr)
  {
    console_ = options_.console ? options_.console : &std::cerr;
    ensure_output_path();
    file_.open(options_.output_path, std::ios::out | std::ios::app);
    out_ = file_.is_open() ? static_cast<std::ostream *>(&file_) : &std::cerr;
    worker_ = std::thread(&AsyncJsonLogger::run, this);
  }

  AsyncJsonLogger::~AsyncJsonLogger()
  {
    {
      std::scoped_lock lock(mutex_);
      stop_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable())
    {
      worker_.join();
    }
    if (file_.is_open())
    {
      file_.flush();
    }
  }

  void AsyncJsonLogger::log(LogEvent event)
  {
    if (!should_log(event.level, options_.level))
    {
      return;
    }
    if (event.ts_ms == 0)
    {
      event.ts_ms = now_ms();
    }
    if (options_.console_level && should_log(event.level, *options_.console_level))
    {
      echo_to_console(event);
    }
    enqueue(std::move(event));
  }

  void AsyncJsonLogger::enqueue(LogEvent event)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (queue_.size() >= options_.queue_size)
    {
      dropped_count_.fetch_add(1);
      if (options_.drop_policy == DropPolicy::DropNewest)
      {
        return;
      }
      queue_.pop_front();
    }
    queue_.push_back(std::move(event));
    cv_.notify_one();
  }

  void AsyncJsonLogger::run()
  {
    for (;;)
    {
      std::deque<LogEvent> batch;
      bool stopping = false;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]
                 { return stop_ || !queue_.empty(); });
        stopping = stop_;
        batch.swap(queue_);
      }

      write_batch(batch);

      auto dropped = dropped_count_.exchange(0);
      if (dropped > 0)
      {
        write_dropped_summary(dropped);
      }

      if (out_)
      {
        out_->flush();
      }

      if (stopping)
      {
        break;
      }
    }
  }

  void AsyncJsonLogger::write_batch(const std::deque<LogEvent> &batch)
  {
    for (const auto &event : batch)
    {
      write_event(event);
    }
  }

  void AsyncJsonLogger::write_event(const LogEvent &event)
  {
    if (!out_)
    {
      return;
    }

    std::string line;
    line.reserve(256);
    line += "{\"ts_ms\":";
    line += std::to_string(event.ts_ms);
    line += ",\"level\":\"";
    append_json_string(line, to_string(event.level));
    line += "\",\"component\":\"";
    append_json_string(line, event.component);
    line += "\",\"msg\":\"";
    append_json_string(line, event.message);
    line += "\"";

    if (!event.fields.empty())
    {
      line += ",\"fields\":{";
      const auto &entries = event.fields.entries();
      for (std::size_t i = 0; i < entries.size(); ++i)
      {
        if (i > 0)
        {
          line += ',';
        }
        line += '"';
        append_json_string(line, entries[i].key);
        line += "\":";
        append_field_value(line, entries[i].value);
      }
      line += '}';
    }

    line += "}\n";
    (*out_) << line;
  }

  void AsyncJsonLogger::echo_to_console(const LogEvent &event)
  {
    std::string line;
    line += to_string(event.level);
    line += " [";
    line += event.component;
    line += "] ";
    line += event.message;
    for (const auto &field : event.fields.entries())
    {
      line += ' ';
      line += field.key;
      line += '=';
      line += plain_value(field.value);
    }
    line += '\n';
    std::scoped_lock lock(console_mutex_);
    (*console_) << line;
  }

  void AsyncJsonLogger::write_dropped_summary(std::uint64_t dropped)
  {
    LogFields fields;
    fields.add_uint("dropped", dropped);
    fields.add_string("policy", std::string(to_string(options_.drop_policy)));
    write_event(LogEvent{.ts_ms = now_ms(),
                         .level = LogLevel::Warn,
                         .component = "logging",
                         .message = "dropped_logs",
                         .fields = std::move(fields)});
  }

  void AsyncJsonLogger::ensure_output_path()
  {
    std::filesystem::path path(options_.output_path);
    if (!path.has_parent_path())
    {
      return;
    }
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }

} // namespace beright::logging
