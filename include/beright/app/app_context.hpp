#pragma once

#include "beright/core/config.hpp"
#include "beright/core/signer.hpp"
#include "beright/ledger/rpc_transport.hpp"
#include "beright/ledger/solana_gateway.hpp"
#include "beright/logging/async_json_logger.hpp"
#include "beright/logging/log_level.hpp"
#include "beright/memo/memo_codec.hpp"
#include "beright/scoring/brier.hpp"
#include "beright/service/commitment_service.hpp"
#include "beright/service/retry_policy.hpp"

#include <boost/asio/ssl/context.hpp>

#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace beright::app
{

/**
 * Errors encountered while building app context.
 */
enum class AppError
{
  ConfigLoadFailed,
  InvalidLogLevel,
  InvalidDropPolicy,
  InvalidRpcUrl,
  SignerLoadFailed
};

/**
 * Convert AppError to a string literal.
 * @param error Error to stringify.
 * @return String literal describing the error.
 */
[[nodiscard]] const char* to_string(AppError error);

/**
 * Memo budgets from config.
 * @param config Loaded config.
 * @return Memo limits.
 */
[[nodiscard]] beright::memo::MemoLimits memo_limits(const beright::Config& config);

/**
 * Quality band limits from config.
 * @param config Loaded config.
 * @return Band thresholds.
 */
[[nodiscard]] beright::scoring::BandThresholds band_thresholds(const beright::Config& config);

/**
 * What the commands that never reach the ledger (decode, score) read
 * from config.
 */
struct OfflineSettings
{
  beright::memo::MemoLimits limits;
  beright::scoring::BandThresholds bands;
};

/**
 * Load offline settings. A config file that is absent from the default
 * path yields the built-in defaults; one named explicitly must load.
 * @param config_path Path to config file.
 * @param path_given True when the path came from the command line.
 * @return OfflineSettings or AppError.
 */
[[nodiscard]] std::expected<OfflineSettings, AppError> load_offline_settings(
    std::string_view config_path, bool path_given);

/**
 * Application context assembled from config and environment. Owns the
 * logger, TLS context, transport, gateway and service; heap-held so the
 * references between them survive moves.
 */
class AppContext
{
public:
  /**
   * Build application context from a config path.
   * @param config_path Path to config file.
   * @return AppContext or AppError.
   */
  [[nodiscard]] static std::expected<AppContext, AppError> build(std::string_view config_path);

  /**
   * Load the signing account from the environment, logging failures.
   * @return Signer or AppError.
   */
  [[nodiscard]] std::expected<Signer, AppError> load_signer() const;

  [[nodiscard]] beright::logging::Logger& logger() const
  {
    return *logger_;
  }

  [[nodiscard]] const beright::Config& config() const
  {
    return config_;
  }

  [[nodiscard]] beright::ledger::LedgerGateway& gateway() const
  {
    return *gateway_;
  }

  [[nodiscard]] beright::service::CommitmentService& service() const
  {
    return *service_;
  }

  [[nodiscard]] beright::service::RetryingCommitter& committer() const
  {
    return *committer_;
  }

  /**
   * Quality band limits from config.
   * @return Band thresholds.
   */
  [[nodiscard]] beright::scoring::BandThresholds bands() const;

  /**
   * Log config summary to the logger.
   */
  void log_config() const;

private:
  AppContext(beright::Config config,
             std::unique_ptr<beright::logging::AsyncJsonLogger> logger,
             std::unique_ptr<boost::asio::ssl::context> ssl_ctx);

  [[nodiscard]] static std::expected<beright::logging::AsyncJsonLoggerOptions, AppError>
  build_logger_options(const beright::Config& config);

  beright::Config config_;
  std::unique_ptr<beright::logging::AsyncJsonLogger> logger_;
  std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
  std::unique_ptr<beright::ledger::HttpsRpcTransport> transport_;
  std::unique_ptr<beright::ledger::SolanaLedgerGateway> gateway_;
  std::unique_ptr<beright::service::CommitmentService> service_;
  std::unique_ptr<beright::service::RetryingCommitter> committer_;
};

} // namespace beright::app
