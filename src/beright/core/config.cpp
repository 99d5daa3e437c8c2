#include "beright/core/config.hpp"

#include <expected>
#include <fstream>
#include <optional>
#include <sstream>

#include <simdjson.h>

#include "beright/logging/log_level.hpp"
#include "beright/scoring/brier.hpp"

namespace beright
{

  namespace
  {

    using Object = simdjson::ondemand::object;

    constexpr std::size_t MAX_RECENT_MEMO_LIMIT = 1000;

    std::expected<std::optional<std::string>, ConfigError>
    get_optional_string(Object &obj, std::string_view key)
    {
      auto field = obj[key];
      if (field.error())
      {
        if (field.error() == simdjson::NO_SUCH_FIELD)
        {
          return std::optional<std::string>{};
        }
        return std::unexpected(ConfigError::ParseFailed);
      }
      auto val = field.get_string();
      if (val.error())
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      return std::optional<std::string>{std::string(val.value())};
    }

    std::expected<std::optional<std::uint64_t>, ConfigError>
    get_optional_uint(Object &obj, std::string_view key)
    {
      auto field = obj[key];
      if (field.error())
      {
        if (field.error() == simdjson::NO_SUCH_FIELD)
        {
          return std::optional<std::uint64_t>{};
        }
        return std::unexpected(ConfigError::ParseFailed);
      }
      auto val = field.get_uint64();
      if (val.error())
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      return std::optional<std::uint64_t>{val.value()};
    }

    std::expected<std::optional<double>, ConfigError>
    get_optional_double(Object &obj, std::string_view key)
    {
      auto field = obj[key];
      if (field.error())
      {
        if (field.error() == simdjson::NO_SUCH_FIELD)
        {
          return std::optional<double>{};
        }
        return std::unexpected(ConfigError::ParseFailed);
      }
      auto val = field.get_double();
      if (val.error())
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      return std::optional<double>{val.value()};
    }

    // Overwrite `target` when the key is present.
    template <typename T, typename Getter>
    std::expected<void, ConfigError> read_into(T &target, Object &obj, std::string_view key,
                                               Getter getter)
    {
      auto value = getter(obj, key);
      if (!value)
      {
        return std::unexpected(value.error());
      }
      if (value->has_value())
      {
        target = static_cast<T>(**value);
      }
      return {};
    }

    // Missing sections keep their defaults.
    template <typename Section, typename Parse>
    std::expected<Section, ConfigError> parse_section(Object &root, std::string_view key,
                                                      Section base, Parse parse)
    {
      auto field = root[key];
      if (field.error())
      {
        if (field.error() == simdjson::NO_SUCH_FIELD)
        {
          return base;
        }
        return std::unexpected(ConfigError::ParseFailed);
      }
      auto obj = field.get_object();
      if (obj.error())
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      return parse(obj.value(), std::move(base));
    }

    std::expected<LedgerConfig, ConfigError> parse_ledger(Object &obj, LedgerConfig base)
    {
      if (!read_into(base.rpc_url, obj, "rpc_url", get_optional_string) ||
          !read_into(base.cluster, obj, "cluster", get_optional_string) ||
          !read_into(base.explorer_base, obj, "explorer_base", get_optional_string) ||
          !read_into(base.commitment, obj, "commitment", get_optional_string) ||
          !read_into(base.rpc_timeout_ms, obj, "rpc_timeout_ms", get_optional_uint) ||
          !read_into(base.confirm_timeout_ms, obj, "confirm_timeout_ms", get_optional_uint) ||
          !read_into(base.confirm_poll_ms, obj, "confirm_poll_ms", get_optional_uint) ||
          !read_into(base.recent_memo_limit, obj, "recent_memo_limit", get_optional_uint))
      {
        return std::unexpected(ConfigError::ParseFailed);
      }

      if (base.rpc_url.empty() || base.cluster.empty() || base.explorer_base.empty() ||
          base.rpc_timeout_ms == 0 || base.confirm_timeout_ms == 0 || base.confirm_poll_ms == 0 ||
          base.recent_memo_limit == 0 || base.recent_memo_limit > MAX_RECENT_MEMO_LIMIT)
      {
        return std::unexpected(ConfigError::InvalidValue);
      }
      if (base.commitment != "confirmed" && base.commitment != "finalized")
      {
        return std::unexpected(ConfigError::InvalidValue);
      }
      return base;
    }

    std::expected<CostConfig, ConfigError> parse_costs(Object &obj, CostConfig base)
    {
      if (!read_into(base.reserve_lamports, obj, "reserve_lamports", get_optional_uint) ||
          !read_into(base.fee_lamports, obj, "fee_lamports", get_optional_uint) ||
          !read_into(base.memo_surcharge_lamports, obj, "memo_surcharge_lamports",
                     get_optional_uint))
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      if (base.fee_lamports + base.memo_surcharge_lamports == 0)
      {
        return std::unexpected(ConfigError::InvalidValue);
      }
      return base;
    }

    std::expected<MemoConfig, ConfigError> parse_memo(Object &obj, MemoConfig base)
    {
      if (!read_into(base.max_payload_bytes, obj, "max_payload_bytes", get_optional_uint) ||
          !read_into(base.max_ticker_bytes, obj, "max_ticker_bytes", get_optional_uint) ||
          !read_into(base.max_committer_ref_bytes, obj, "max_committer_ref_bytes",
                     get_optional_uint) ||
          !read_into(base.committer_ref_length, obj, "committer_ref_length", get_optional_uint))
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      if (base.max_payload_bytes == 0 || base.max_ticker_bytes == 0 ||
          base.max_committer_ref_bytes == 0 || base.committer_ref_length == 0 ||
          base.committer_ref_length > base.max_committer_ref_bytes ||
          base.max_ticker_bytes >= base.max_payload_bytes)
      {
        return std::unexpected(ConfigError::InvalidValue);
      }
      return base;
    }

    std::expected<ScoringConfig, ConfigError> parse_scoring(Object &obj, ScoringConfig base)
    {
      if (!read_into(base.excellent, obj, "excellent", get_optional_double) ||
          !read_into(base.good, obj, "good", get_optional_double) ||
          !read_into(base.fair, obj, "fair", get_optional_double) ||
          !read_into(base.poor, obj, "poor", get_optional_double))
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      const scoring::BandThresholds thresholds{
          .excellent = base.excellent, .good = base.good, .fair = base.fair, .poor = base.poor};
      if (!scoring::is_valid(thresholds))
      {
        return std::unexpected(ConfigError::InvalidValue);
      }
      return base;
    }

    std::expected<RetryConfig, ConfigError> parse_retry(Object &obj, RetryConfig base)
    {
      if (!read_into(base.max_attempts, obj, "max_attempts", get_optional_uint) ||
          !read_into(base.initial_delay_ms, obj, "initial_delay_ms", get_optional_uint) ||
          !read_into(base.max_delay_ms, obj, "max_delay_ms", get_optional_uint) ||
          !read_into(base.multiplier, obj, "multiplier", get_optional_double))
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      if (base.max_attempts == 0 || base.multiplier < 1.0 ||
          base.initial_delay_ms > base.max_delay_ms)
      {
        return std::unexpected(ConfigError::InvalidValue);
      }
      return base;
    }

    std::expected<CacheConfig, ConfigError> parse_cache(Object &obj, CacheConfig base)
    {
      if (!read_into(base.affordability_max_age_ms, obj, "affordability_max_age_ms",
                     get_optional_uint))
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      return base;
    }

    std::expected<LoggingConfig, ConfigError> parse_logging(Object &obj, LoggingConfig base)
    {
      if (!read_into(base.level, obj, "level", get_optional_string) ||
          !read_into(base.queue_size, obj, "queue_size", get_optional_uint) ||
          !read_into(base.drop_policy, obj, "drop_policy", get_optional_string) ||
          !read_into(base.output_path, obj, "output_path", get_optional_string) ||
          !read_into(base.console_level, obj, "console_level", get_optional_string))
      {
        return std::unexpected(ConfigError::ParseFailed);
      }

      if (!logging::parse_log_level(base.level) || !logging::parse_drop_policy(base.drop_policy))
      {
        return std::unexpected(ConfigError::InvalidValue);
      }
      if (!logging::parse_console_echo(base.console_level))
      {
        return std::unexpected(ConfigError::InvalidValue);
      }
      if (base.queue_size == 0 || base.output_path.empty())
      {
        return std::unexpected(ConfigError::InvalidValue);
      }
      return base;
    }

    LedgerConfig default_ledger_config()
    {
      return LedgerConfig{.rpc_url = "",
                          .cluster = "mainnet-beta",
                          .explorer_base = "https://solscan.io",
                          .commitment = "confirmed",
                          .rpc_timeout_ms = 10'000,
                          .confirm_timeout_ms = 60'000,
                          .confirm_poll_ms = 500,
                          .recent_memo_limit = 100};
    }

    LoggingConfig default_logging_config()
    {
      return LoggingConfig{.level = "info",
                           .queue_size = 10000,
                           .drop_policy = "drop_oldest",
                           .output_path = "logs/beright.log.json",
                           .console_level = "warn"};
    }

  } // namespace

  std::expected<Config, ConfigError> parse_config(std::string_view json)
  {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(json.data(), json.size());
    auto doc = parser.iterate(padded);
    if (doc.error())
    {
      return std::unexpected(ConfigError::ParseFailed);
    }

    auto root = doc.get_object();
    if (root.error())
    {
      return std::unexpected(ConfigError::ParseFailed);
    }

    auto ledger = parse_section(root.value(), "ledger", default_ledger_config(), parse_ledger);
    if (!ledger)
    {
      return std::unexpected(ledger.error());
    }
    if (ledger->rpc_url.empty())
    {
      return std::unexpected(ConfigError::InvalidValue);
    }

    auto costs = parse_section(root.value(), "costs",
                               CostConfig{.reserve_lamports = 890'880,
                                          .fee_lamports = 5'000,
                                          .memo_surcharge_lamports = 0},
                               parse_costs);
    auto memo = parse_section(root.value(), "memo",
                              MemoConfig{.max_payload_bytes = 500,
                                         .max_ticker_bytes = 128,
                                         .max_committer_ref_bytes = 44,
                                         .committer_ref_length = 12},
                              parse_memo);
    auto scoring = parse_section(
        root.value(), "scoring",
        ScoringConfig{.excellent = 0.10, .good = 0.20, .fair = 0.30, .poor = 0.40}, parse_scoring);
    auto retry = parse_section(root.value(), "retry",
                               RetryConfig{.max_attempts = 3,
                                           .initial_delay_ms = 1'000,
                                           .max_delay_ms = 10'000,
                                           .multiplier = 2.0},
                               parse_retry);
    auto cache = parse_section(root.value(), "cache", CacheConfig{.affordability_max_age_ms = 0},
                               parse_cache);
    auto logging = parse_section(root.value(), "logging", default_logging_config(), parse_logging);

    if (!costs)
    {
      return std::unexpected(costs.error());
    }
    if (!memo)
    {
      return std::unexpected(memo.error());
    }
    if (!scoring)
    {
      return std::unexpected(scoring.error());
    }
    if (!retry)
    {
      return std::unexpected(retry.error());
    }
    if (!cache)
    {
      return std::unexpected(cache.error());
    }
    if (!logging)
    {
      return std::unexpected(logging.error());
    }

    return Config{.ledger = std::move(*ledger),
                  .costs = *costs,
                  .memo = *memo,
                  .scoring = *scoring,
                  .retry = *retry,
                  .cache = *cache,
                  .logging = std::move(*logging)};
  }

  std::expected<Config, ConfigError> load_config(const std::string &path)
  {
    std::ifstream file(path);
    if (!file.is_open())
    {
      return std::unexpected(ConfigError::FileOpenFailed);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
  }

  const char *to_string(ConfigError error)
  {
    switch (error)
    {
    case ConfigError::FileOpenFailed:
      return "file_open_failed";
    case ConfigError::ParseFailed:
      return "parse_failed";
    case ConfigError::InvalidValue:
      return "invalid_value";
    }
    return "unknown";
  }

} // namespace beright
