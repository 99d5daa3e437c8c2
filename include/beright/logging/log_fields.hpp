#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace beright::logging
{

  using LogFieldValue = std::variant<std::string, std::int64_t, std::uint64_t, double, bool>;

  struct LogField
  {
    std::string key;
    LogFieldValue value;
  };

  /** Leading characters of an address that reach the log. */
  inline constexpr std::size_t LOGGED_ADDRESS_PREFIX = 8;

  /**
   * Ordered key/value payload of one log event. Keys are written in the
   * order they were added.
   */
  class LogFields
  {
  public:
    void add_string(std::string key, std::string value) { push(std::move(key), std::move(value)); }
    void add_int(std::string key, std::int64_t value) { push(std::move(key), value); }
    void add_uint(std::string key, std::uint64_t value) { push(std::move(key), value); }
    void add_double(std::string key, double value) { push(std::move(key), value); }
    void add_bool(std::string key, bool value) { push(std::move(key), value); }

    // Written as "<key>_ms".
    void add_duration(std::string key, std::chrono::milliseconds value)
    {
      push(std::move(key) + "_ms", static_cast<std::int64_t>(value.count()));
    }

    // Ledger addresses are logged truncated ("7xKXtg2C...").
    void add_address(std::string key, std::string_view address)
    {
      std::string shown(address.substr(0, LOGGED_ADDRESS_PREFIX));
      if (address.size() > LOGGED_ADDRESS_PREFIX)
      {
        shown += "...";
      }
      push(std::move(key), std::move(shown));
    }

    [[nodiscard]] bool empty() const { return fields_.empty(); }
    [[nodiscard]] const std::vector<LogField> &entries() const { return fields_; }

  private:
    void push(std::string key, LogFieldValue value)
    {
      fields_.push_back(LogField{std::move(key), std::move(value)});
    }

    std::vector<LogField> fields_;
  };

} // namespace beright::logging
