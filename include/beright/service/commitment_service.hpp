#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "beright/core/signer.hpp"
#include "beright/ledger/affordability.hpp"
#include "beright/ledger/ledger_gateway.hpp"
#include "beright/logging/logger.hpp"
#include "beright/memo/memo_codec.hpp"
#include "beright/memo/memo_types.hpp"
#include "beright/scoring/brier.hpp"

namespace beright::service
{

  /** Where a commit attempt stopped. */
  enum class CommitStage
  {
    Validating,
    CheckingAffordability,
    Encoding,
    Submitting,
    Succeeded,
    Failed
  };

  /** Categorized reason for a failed commit. */
  enum class CommitError
  {
    InvalidCommitment,
    // Memo, or batch transaction, over its byte ceiling.
    PayloadTooLarge,
    // A field the memo format cannot carry (delimiter, non-ASCII, over budget).
    UnencodableField,
    InsufficientFunds,
    LedgerUnreachable,
    NetworkFailure,
    Rejected,
    Ambiguous,
    Internal
  };

  /** Terminal failure of one commit attempt. */
  struct CommitFailure
  {
    CommitError error;
    // Stage that was running when the attempt failed.
    CommitStage stage;
    std::string message;
    // Signed transaction of an Ambiguous submission, if any.
    std::optional<std::string> signature;
    // Block height after which that transaction can no longer land.
    std::optional<std::uint64_t> last_valid_block_height;
  };

  /** Terminal success of one commit attempt. */
  struct CommitReceipt
  {
    std::string signature;
    std::string explorer_url;
    memo::Memo memo;
  };

  using CommitResult = std::expected<CommitReceipt, CommitFailure>;

  /** One prediction of a batch, made on behalf of `committer_public_key`. */
  struct BatchPrediction
  {
    std::string committer_public_key;
    std::string market_ticker;
    double probability;
    memo::Direction direction;
  };

  /** One transaction carrying every memo of a batch. */
  struct BatchReceipt
  {
    std::string signature;
    std::string explorer_url;
    std::vector<memo::Memo> memos;
  };

  using BatchResult = std::expected<BatchReceipt, CommitFailure>;

  /** A PREDICT memo already on the ledger that matches a commitment. */
  struct PriorCommitment
  {
    std::string signature;
    std::string explorer_url;
    memo::PredictionCommitment commitment;
  };

  struct ServiceOptions
  {
    memo::MemoLimits limits;
    // Characters of the committer's public key carried in each memo.
    std::size_t committer_ref_length = 12;
    std::chrono::milliseconds query_timeout{10'000};
    std::chrono::milliseconds submit_timeout{60'000};
    // Zero disables the affordability cache.
    std::chrono::milliseconds affordability_max_age{0};
    std::size_t recent_memo_limit = 100;
    // Bands reported when a resolution is recorded.
    scoring::BandThresholds bands;
  };

  /**
   * Orchestrates validate, affordability check, encode and submit for one
   * commitment. Not thread-safe; owns its affordability cache.
   */
  class CommitmentService
  {
  public:
    /**
     * Construct over a ledger gateway.
     * @param gateway Ledger boundary; must outlive the service.
     * @param logger Logger for diagnostics.
     * @param options Limits and timeouts.
     */
    CommitmentService(ledger::LedgerGateway &gateway, logging::Logger &logger,
                      ServiceOptions options);

    /**
     * Commit a prediction signed and referenced by `account`.
     * @param account Signing account, also the committer.
     * @param market_ticker Market identifier.
     * @param probability Stated confidence in (0, 1).
     * @param direction Predicted direction.
     * @return CommitReceipt or CommitFailure.
     */
    [[nodiscard]] CommitResult commit(const Signer &account,
                                      std::string_view market_ticker,
                                      double probability,
                                      memo::Direction direction);

    /**
     * Commit a prediction signed by `account` on behalf of another forecaster.
     * @param account Signing (paying) account.
     * @param committer_public_key Base58 key of the forecaster.
     * @param market_ticker Market identifier.
     * @param probability Stated confidence in (0, 1).
     * @param direction Predicted direction.
     * @return CommitReceipt or CommitFailure.
     */
    [[nodiscard]] CommitResult commit_on_behalf(const Signer &account,
                                                std::string_view committer_public_key,
                                                std::string_view market_ticker,
                                                double probability,
                                                memo::Direction direction);

    /**
     * Commit several predictions in one transaction signed by `account`.
     * Every prediction is validated and encoded first; the batch must fit the
     * ledger's transaction size limit. Affordability is checked once.
     * @param account Signing (paying) account.
     * @param predictions Predictions in memo order; at least one.
     * @return BatchReceipt or CommitFailure.
     */
    [[nodiscard]] BatchResult commit_batch(const Signer &account,
                                           std::span<const BatchPrediction> predictions);

    /**
     * Score a commitment against the outcome and record the resolution.
     * @param account Signing account.
     * @param commitment Commitment being resolved.
     * @param direction_occurred True if the predicted direction happened.
     * @return CommitReceipt or CommitFailure.
     */
    [[nodiscard]] CommitResult resolve(const Signer &account,
                                       const memo::PredictionCommitment &commitment,
                                       bool direction_occurred);

    /**
     * Look for a PREDICT memo on the account's recent history matching
     * `commitment` at basis-point precision.
     * @param account Account whose history is scanned.
     * @param commitment Commitment to match.
     * @return Match, std::nullopt when none, or CommitFailure.
     */
    [[nodiscard]] std::expected<std::optional<PriorCommitment>, CommitFailure>
    find_prior_commitment(const Signer &account, const memo::PredictionCommitment &commitment);

    /**
     * Ask the ledger what became of a transaction whose submission was
     * Ambiguous.
     * @param signature Signature carried by the failure.
     * @param last_valid_block_height Expiry height carried by the failure.
     * @return TransactionFate or CommitFailure.
     */
    [[nodiscard]] std::expected<ledger::TransactionFate, CommitFailure> transaction_fate(
        std::string_view signature, std::optional<std::uint64_t> last_valid_block_height);

    [[nodiscard]] std::string transaction_url(std::string_view signature) const
    {
      return gateway_.transaction_url(signature);
    }

    /**
     * Build the commitment `commit` would send for these inputs.
     * @param committer_public_key Base58 key of the forecaster.
     */
    [[nodiscard]] memo::PredictionCommitment make_commitment(std::string_view committer_public_key,
                                                             std::string_view market_ticker,
                                                             double probability,
                                                             memo::Direction direction) const;

    [[nodiscard]] const ServiceOptions &options() const { return options_; }

  private:
    [[nodiscard]] std::expected<void, CommitFailure> check_affordability(const Signer &account);
    [[nodiscard]] CommitResult submit_memo(const Signer &account, memo::Memo memo);
    [[nodiscard]] CommitResult commit_commitment(const Signer &account,
                                                 const memo::PredictionCommitment &commitment);
    [[nodiscard]] CommitFailure submit_failed(const ledger::LedgerFailure &failure);

    CommitFailure fail(CommitError error, CommitStage stage, std::string message,
                       std::optional<std::string> signature = std::nullopt);

    ledger::LedgerGateway &gateway_;
    logging::Logger &logger_;
    ServiceOptions options_;
    ledger::AffordabilityCache cache_;
  };

  /**
   * True for failures that are shown to the end user as their own doing or
   * as an actionable condition. Internal defects are not.
   * @param error Error category.
   */
  [[nodiscard]] bool is_user_facing(CommitError error);

  /**
   * True for transient failures that may be retried with backoff.
   * Ambiguous is not: it must be reconciled first.
   * @param error Error category.
   */
  [[nodiscard]] bool is_retryable(CommitError error);

  /**
   * Map a ledger failure category onto the commit taxonomy.
   * @param error Ledger error.
   * @return Matching CommitError.
   */
  [[nodiscard]] CommitError from_ledger_error(ledger::LedgerError error);

  /**
   * Map a memo validation or encoding failure onto the commit taxonomy.
   * @param error Memo error.
   * @return Matching CommitError.
   */
  [[nodiscard]] CommitError from_memo_error(memo::MemoError error);

  [[nodiscard]] const char *to_string(CommitError error);
  [[nodiscard]] const char *to_string(CommitStage stage);

} // namespace beright::service
