#include "beright/app/app_context.hpp"

#include <chrono>
#include <iostream>

namespace beright::app
{

const char* to_string(AppError error)
{
  switch (error)
  {
  case AppError::ConfigLoadFailed:
    return "config_load_failed";
  case AppError::InvalidLogLevel:
    return "invalid_log_level";
  case AppError::InvalidDropPolicy:
    return "invalid_drop_policy";
  case AppError::InvalidRpcUrl:
    return "invalid_rpc_url";
  case AppError::SignerLoadFailed:
    return "signer_load_failed";
  }
  return "unknown";
}

beright::memo::MemoLimits memo_limits(const beright::Config& config)
{
  return beright::memo::MemoLimits{.max_payload_bytes = config.memo.max_payload_bytes,
                                   .max_ticker_bytes = config.memo.max_ticker_bytes,
                                   .max_committer_ref_bytes = config.memo.max_committer_ref_bytes};
}

beright::scoring::BandThresholds band_thresholds(const beright::Config& config)
{
  return beright::scoring::BandThresholds{.excellent = config.scoring.excellent,
                                          .good = config.scoring.good,
                                          .fair = config.scoring.fair,
                                          .poor = config.scoring.poor};
}

std::expected<OfflineSettings, AppError> load_offline_settings(std::string_view config_path,
                                                               bool path_given)
{
  auto config_result = beright::load_config(std::string(config_path));
  if (!config_result)
  {
    if (!path_given && config_result.error() == beright::ConfigError::FileOpenFailed)
    {
      return OfflineSettings{};
    }
    std::cerr << "config load failed: " << beright::to_string(config_result.error()) << std::endl;
    return std::unexpected(AppError::ConfigLoadFailed);
  }
  return OfflineSettings{.limits = memo_limits(*config_result),
                         .bands = band_thresholds(*config_result)};
}

std::expected<AppContext, AppError> AppContext::build(std::string_view config_path)
{
  auto config_result = beright::load_config(std::string(config_path));
  if (!config_result)
  {
    std::cerr << "config load failed: " << beright::to_string(config_result.error()) << std::endl;
    return std::unexpected(AppError::ConfigLoadFailed);
  }

  auto logger_options = build_logger_options(*config_result);
  if (!logger_options)
  {
    return std::unexpected(logger_options.error());
  }

  auto logger = std::make_unique<beright::logging::AsyncJsonLogger>(*logger_options);

  if (!beright::ledger::parse_https_url(config_result->ledger.rpc_url))
  {
    beright::logging::LogFields fields;
    fields.add_string("rpc_url", config_result->ledger.rpc_url);
    logger->log(beright::logging::LogLevel::Error, "core.config", "invalid_rpc_url",
                std::move(fields));
    return std::unexpected(AppError::InvalidRpcUrl);
  }

  auto ssl_ctx =
      std::make_unique<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);
  ssl_ctx->set_default_verify_paths();
  ssl_ctx->set_verify_mode(boost::asio::ssl::verify_peer);

  return AppContext(std::move(*config_result), std::move(logger), std::move(ssl_ctx));
}

AppContext::AppContext(beright::Config config,
                       std::unique_ptr<beright::logging::AsyncJsonLogger> logger,
                       std::unique_ptr<boost::asio::ssl::context> ssl_ctx)
  : config_(std::move(config)), logger_(std::move(logger)), ssl_ctx_(std::move(ssl_ctx))
{
  transport_ = std::make_unique<beright::ledger::HttpsRpcTransport>(config_.ledger.rpc_url,
                                                                      *ssl_ctx_);

  beright::ledger::SolanaGatewayOptions gateway_options{
      .cost = {.reserve_lamports = config_.costs.reserve_lamports,
               .fee_lamports = config_.costs.fee_lamports,
               .memo_surcharge_lamports = config_.costs.memo_surcharge_lamports},
      .cluster = config_.ledger.cluster,
      .explorer_base = config_.ledger.explorer_base,
      .commitment = config_.ledger.commitment,
      .confirm_poll_interval = std::chrono::milliseconds(config_.ledger.confirm_poll_ms)};
  gateway_ = std::make_unique<beright::ledger::SolanaLedgerGateway>(
      *transport_, *logger_, std::move(gateway_options));

  beright::service::ServiceOptions service_options{
      .limits = memo_limits(config_),
      .committer_ref_length = config_.memo.committer_ref_length,
      .query_timeout = std::chrono::milliseconds(config_.ledger.rpc_timeout_ms),
      .submit_timeout = std::chrono::milliseconds(config_.ledger.confirm_timeout_ms),
      .affordability_max_age = std::chrono::milliseconds(config_.cache.affordability_max_age_ms),
      .recent_memo_limit = config_.ledger.recent_memo_limit,
      .bands = band_thresholds(config_)};
  service_ = std::make_unique<beright::service::CommitmentService>(*gateway_, *logger_,
                                                                   std::move(service_options));

  beright::service::RetryOptions retry_options{
      .max_attempts = config_.retry.max_attempts,
      .initial_delay = std::chrono::milliseconds(config_.retry.initial_delay_ms),
      .max_delay = std::chrono::milliseconds(config_.retry.max_delay_ms),
      .multiplier = config_.retry.multiplier};
  committer_ =
      std::make_unique<beright::service::RetryingCommitter>(*service_, *logger_, retry_options);
}

std::expected<Signer, AppError> AppContext::load_signer() const
{
  auto signer = beright::load_signer_from_env();
  if (!signer)
  {
    beright::logging::LogFields fields;
    fields.add_string("error", std::string(beright::to_string(signer.error())));
    fields.add_string("openssl_error", beright::last_sign_error());
    logger_->log(beright::logging::LogLevel::Error, "core.signer", "signer_error",
                 std::move(fields));
    return std::unexpected(AppError::SignerLoadFailed);
  }

  beright::logging::LogFields fields;
  fields.add_address("account", signer->address());
  logger_->log(beright::logging::LogLevel::Info, "core.signer", "signer_loaded", std::move(fields));
  return std::move(*signer);
}

beright::scoring::BandThresholds AppContext::bands() const
{
  return band_thresholds(config_);
}

void AppContext::log_config() const
{
  beright::logging::LogFields ledger_fields;
  ledger_fields.add_string("rpc_url", config_.ledger.rpc_url);
  ledger_fields.add_string("cluster", config_.ledger.cluster);
  ledger_fields.add_string("commitment", config_.ledger.commitment);
  logger_->log(beright::logging::LogLevel::Info, "core.config", "ledger", std::move(ledger_fields));

  beright::logging::LogFields cost_fields;
  cost_fields.add_uint("reserve_lamports", config_.costs.reserve_lamports);
  cost_fields.add_uint("fee_lamports", config_.costs.fee_lamports);
  cost_fields.add_uint("memo_surcharge_lamports", config_.costs.memo_surcharge_lamports);
  cost_fields.add_uint("max_payload_bytes", config_.memo.max_payload_bytes);
  logger_->log(beright::logging::LogLevel::Info, "core.config", "costs", std::move(cost_fields));

  beright::logging::LogFields logging_fields;
  logging_fields.add_string("level", std::string(beright::logging::to_string(logger_->level())));
  logging_fields.add_string("drop_policy", config_.logging.drop_policy);
  logging_fields.add_duration("affordability_max_age",
                              std::chrono::milliseconds(config_.cache.affordability_max_age_ms));
  logger_->log(beright::logging::LogLevel::Info, "core.config", "logging",
               std::move(logging_fields));
}

std::expected<beright::logging::AsyncJsonLoggerOptions, AppError> AppContext::build_logger_options(
    const beright::Config& config)
{
  auto level = beright::logging::parse_log_level(config.logging.level);
  if (!level)
  {
    std::cerr << "invalid log level in config.json" << std::endl;
    return std::unexpected(AppError::InvalidLogLevel);
  }
  auto drop_policy = beright::logging::parse_drop_policy(config.logging.drop_policy);
  if (!drop_policy)
  {
    std::cerr << "invalid drop policy in config.json" << std::endl;
    return std::unexpected(AppError::InvalidDropPolicy);
  }

  auto console = beright::logging::parse_console_echo(config.logging.console_level);
  if (!console)
  {
    std::cerr << "invalid console log level in config.json" << std::endl;
    return std::unexpected(AppError::InvalidLogLevel);
  }

  return beright::logging::AsyncJsonLoggerOptions{.level = *level,
                                                  .queue_size = config.logging.queue_size,
                                                  .drop_policy = *drop_policy,
                                                  .output_path = config.logging.output_path,
                                                  .console_level = console->threshold,
                                                  .console = nullptr};
}

} // namespace beright::app
