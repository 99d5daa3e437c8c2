#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace beright
{

  /** Errors returned while loading config.json. */
  enum class ConfigError
  {
    FileOpenFailed,
    ParseFailed,
    InvalidValue
  };

  /** Ledger endpoint and timing. */
  struct LedgerConfig
  {
    std::string rpc_url;
    std::string cluster;
    std::string explorer_base;
    std::string commitment;
    std::uint64_t rpc_timeout_ms;
    std::uint64_t confirm_timeout_ms;
    std::uint64_t confirm_poll_ms;
    std::size_t recent_memo_limit;
  };

  /** Affordability conversion constants, in lamports. */
  struct CostConfig
  {
    std::uint64_t reserve_lamports;
    std::uint64_t fee_lamports;
    std::uint64_t memo_surcharge_lamports;
  };

  /** Memo size budgets. */
  struct MemoConfig
  {
    std::size_t max_payload_bytes;
    std::size_t max_ticker_bytes;
    std::size_t max_committer_ref_bytes;
    std::size_t committer_ref_length;
  };

  /** Upper-inclusive Brier score band limits. */
  struct ScoringConfig
  {
    double excellent;
    double good;
    double fair;
    double poor;
  };

  /** Caller-side retry of transient commit failures. */
  struct RetryConfig
  {
    std::size_t max_attempts;
    std::uint64_t initial_delay_ms;
    std::uint64_t max_delay_ms;
    double multiplier;
  };

  struct CacheConfig
  {
    // Zero disables the affordability cache.
    std::uint64_t affordability_max_age_ms;
  };

  /** Logging configuration for async logger. */
  struct LoggingConfig
  {
    std::string level;
    std::size_t queue_size;
    std::string drop_policy;
    std::string output_path;
    // Level echoed to stderr, or "off".
    std::string console_level;
  };

  /** Top-level runtime configuration loaded from config.json. */
  struct Config
  {
    LedgerConfig ledger;
    CostConfig costs;
    MemoConfig memo;
    ScoringConfig scoring;
    RetryConfig retry;
    CacheConfig cache;
    LoggingConfig logging;
  };

  /**
   * Load and parse config.json. Only ledger.rpc_url is required; every other
   * section falls back to defaults.
   * @param path Path to config.json.
   * @return Parsed Config or ConfigError.
   */
  [[nodiscard]] std::expected<Config, ConfigError> load_config(const std::string &path);

  /**
   * Parse config from an in-memory JSON document.
   * @param json Document text.
   * @return Parsed Config or ConfigError.
   */
  [[nodiscard]] std::expected<Config, ConfigError> parse_config(std::string_view json);

  /**
   * Convert ConfigError to a string literal.
   * @param error Error to stringify.
   * @return String literal describing the error.
   */
  [[nodiscard]] const char *to_string(ConfigError error);

} // namespace beright
