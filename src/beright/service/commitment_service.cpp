#include "beright/service/commitment_service.hpp"

#include <utility>
#include <variant>

#include "beright/ledger/transaction.hpp"
#include "beright/scoring/brier.hpp"

namespace beright::service {

namespace {

constexpr std::string_view COMPONENT = "service.commit";

bool matches(const memo::PredictionCommitment &found, const memo::PredictionCommitment &wanted) {
  return found.market_ticker == wanted.market_ticker && found.direction == wanted.direction &&
         found.committer_ref == wanted.committer_ref &&
         memo::to_basis_points(found.probability) == memo::to_basis_points(wanted.probability);
}

} // namespace

CommitmentService::CommitmentService(ledger::LedgerGateway &gateway, logging::Logger &logger,
                                     ServiceOptions options)
    : gateway_(gateway), logger_(logger), options_(std::move(options)),
      cache_(options_.affordability_max_age) {}

memo::PredictionCommitment CommitmentService::make_commitment(
    std::string_view committer_public_key, std::string_view market_ticker, double probability,
    memo::Direction direction) const {
  return memo::PredictionCommitment{
      .market_ticker = std::string(market_ticker),
      .probability = probability,
      .direction = direction,
      .committer_ref = memo::make_committer_ref(committer_public_key, options_.committer_ref_length)};
}

CommitResult CommitmentService::commit(const Signer &account, std::string_view market_ticker,
                                       double probability, memo::Direction direction) {
  return commit_commitment(account,
                           make_commitment(account.address(), market_ticker, probability, direction));
}

CommitResult CommitmentService::commit_on_behalf(const Signer &account,
                                                 std::string_view committer_public_key,
                                                 std::string_view market_ticker,
                                                 double probability, memo::Direction direction) {
  return commit_commitment(
      account, make_commitment(committer_public_key, market_ticker, probability, direction));
}

CommitResult CommitmentService::commit_commitment(const Signer &account,
                                                  const memo::PredictionCommitment &commitment) {
  if (auto valid = memo::validate_commitment(commitment, options_.limits); !valid) {
    return std::unexpected(fail(from_memo_error(valid.error()), CommitStage::Validating,
                                memo::to_string(valid.error())));
  }

  if (auto affordable = check_affordability(account); !affordable) {
    return std::unexpected(affordable.error());
  }

  auto encoded = memo::encode_prediction(commitment, options_.limits);
  if (!encoded) {
    return std::unexpected(fail(CommitError::Internal, CommitStage::Encoding,
                                std::string("encoder rejected a validated commitment: ") +
                                    memo::to_string(encoded.error())));
  }

  logging::LogFields fields;
  fields.add_string("ticker", commitment.market_ticker);
  fields.add_uint("probability_bps", memo::to_basis_points(commitment.probability));
  fields.add_string("direction", std::string(memo::to_string(commitment.direction)));
  logger_.log(logging::LogLevel::Info, std::string(COMPONENT), "commit_submitting",
              std::move(fields));
  return submit_memo(account, std::move(*encoded));
}

BatchResult CommitmentService::commit_batch(const Signer &account,
                                            std::span<const BatchPrediction> predictions) {
  if (predictions.empty()) {
    return std::unexpected(
        fail(CommitError::InvalidCommitment, CommitStage::Validating, "batch is empty"));
  }

  std::vector<memo::Memo> memos;
  memos.reserve(predictions.size());
  for (std::size_t i = 0; i < predictions.size(); ++i) {
    const auto &prediction = predictions[i];
    const auto commitment = make_commitment(prediction.committer_public_key,
                                            prediction.market_ticker, prediction.probability,
                                            prediction.direction);
    const auto position = "prediction " + std::to_string(i) + ": ";
    if (auto valid = memo::validate_commitment(commitment, options_.limits); !valid) {
      return std::unexpected(fail(from_memo_error(valid.error()), CommitStage::Validating,
                                  position + memo::to_string(valid.error())));
    }
    auto encoded = memo::encode_prediction(commitment, options_.limits);
    if (!encoded) {
      return std::unexpected(fail(CommitError::Internal, CommitStage::Encoding,
                                  position + "encoder rejected a validated commitment: " +
                                      memo::to_string(encoded.error())));
    }
    memos.push_back(std::move(*encoded));
  }

  const auto wire_bytes = ledger::memo_transaction_size(memos);
  if (wire_bytes > ledger::MAX_TRANSACTION_BYTES) {
    return std::unexpected(fail(CommitError::PayloadTooLarge, CommitStage::Validating,
                                std::to_string(predictions.size()) + " memos need " +
                                    std::to_string(wire_bytes) + " bytes, over the " +
                                    std::to_string(ledger::MAX_TRANSACTION_BYTES) +
                                    "-byte transaction limit"));
  }

  if (auto affordable = check_affordability(account); !affordable) {
    return std::unexpected(affordable.error());
  }

  logging::LogFields fields;
  fields.add_uint("predictions", predictions.size());
  fields.add_uint("wire_bytes", wire_bytes);
  logger_.log(logging::LogLevel::Info, std::string(COMPONENT), "batch_submitting",
              std::move(fields));

  auto submitted = gateway_.submit_batch(account, memos, options_.submit_timeout);
  if (!submitted) {
    return std::unexpected(submit_failed(submitted.error()));
  }
  cache_.invalidate();

  logging::LogFields done;
  done.add_string("signature", submitted->signature);
  done.add_uint("predictions", memos.size());
  logger_.log(logging::LogLevel::Info, std::string(COMPONENT), "batch_succeeded",
              std::move(done));
  return BatchReceipt{.signature = std::move(submitted->signature),
                      .explorer_url = std::move(submitted->explorer_url),
                      .memos = std::move(memos)};
}

CommitResult CommitmentService::resolve(const Signer &account,
                                        const memo::PredictionCommitment &commitment,
                                        bool direction_occurred) {
  if (auto valid = memo::validate_commitment(commitment, options_.limits); !valid) {
    return std::unexpected(fail(from_memo_error(valid.error()), CommitStage::Validating,
                                memo::to_string(valid.error())));
  }
  const double score = scoring::brier_score(commitment.probability, direction_occurred);

  if (auto affordable = check_affordability(account); !affordable) {
    return std::unexpected(affordable.error());
  }

  auto encoded = memo::encode_resolution(commitment.market_ticker, direction_occurred, score,
                                         options_.limits);
  if (!encoded) {
    return std::unexpected(fail(CommitError::Internal, CommitStage::Encoding,
                                std::string("encoder rejected a validated resolution: ") +
                                    memo::to_string(encoded.error())));
  }

  logging::LogFields fields;
  fields.add_string("ticker", commitment.market_ticker);
  fields.add_bool("direction_occurred", direction_occurred);
  fields.add_double("brier_score", score);
  fields.add_string("band", std::string(scoring::to_string(
                                scoring::interpret_brier_score(score, options_.bands))));
  logger_.log(logging::LogLevel::Info, std::string(COMPONENT), "resolve_submitting",
              std::move(fields));
  return submit_memo(account, std::move(*encoded));
}

std::expected<void, CommitFailure> CommitmentService::check_affordability(const Signer &account) {
  const auto now = ledger::AffordabilityCache::Clock::now();
  auto snapshot = cache_.get(now);
  if (!snapshot) {
    auto fetched = gateway_.get_affordability(account, options_.query_timeout);
    if (!fetched) {
      return std::unexpected(fail(from_ledger_error(fetched.error().error),
                                  CommitStage::CheckingAffordability, fetched.error().message));
    }
    cache_.store(*fetched, now);
    snapshot = *fetched;
  }

  if (!snapshot->can_commit) {
    return std::unexpected(fail(CommitError::InsufficientFunds, CommitStage::CheckingAffordability,
                                "balance of " + std::to_string(snapshot->spendable_lamports) +
                                    " lamports does not cover one commitment"));
  }
  return {};
}

CommitResult CommitmentService::submit_memo(const Signer &account, memo::Memo memo) {
  auto submitted = gateway_.submit(account, memo, options_.submit_timeout);
  if (!submitted) {
    return std::unexpected(submit_failed(submitted.error()));
  }
  cache_.invalidate();

  logging::LogFields fields;
  fields.add_string("signature", submitted->signature);
  logger_.log(logging::LogLevel::Info, std::string(COMPONENT), "commit_succeeded",
              std::move(fields));
  return CommitReceipt{.signature = std::move(submitted->signature),
                       .explorer_url = std::move(submitted->explorer_url),
                       .memo = std::move(memo)};
}

CommitFailure CommitmentService::submit_failed(const ledger::LedgerFailure &failure) {
  // Funds may have moved whether or not the outcome is known.
  if (failure.error == ledger::LedgerError::Ambiguous || failure.signature) {
    cache_.invalidate();
  }
  auto out = fail(from_ledger_error(failure.error), CommitStage::Submitting, failure.message,
                  failure.signature);
  out.last_valid_block_height = failure.last_valid_block_height;
  return out;
}

std::expected<ledger::TransactionFate, CommitFailure> CommitmentService::transaction_fate(
    std::string_view signature, std::optional<std::uint64_t> last_valid_block_height) {
  auto fate = gateway_.transaction_fate(signature, last_valid_block_height, options_.query_timeout);
  if (!fate) {
    return std::unexpected(fail(from_ledger_error(fate.error().error), CommitStage::Failed,
                                fate.error().message, std::string(signature)));
  }
  return *fate;
}

std::expected<std::optional<PriorCommitment>, CommitFailure>
CommitmentService::find_prior_commitment(const Signer &account,
                                         const memo::PredictionCommitment &commitment) {
  auto memos = gateway_.recent_memos(account, options_.recent_memo_limit, options_.query_timeout);
  if (!memos) {
    return std::unexpected(fail(from_ledger_error(memos.error().error),
                                CommitStage::Failed, memos.error().message));
  }

  std::size_t foreign = 0;
  for (const auto &entry : *memos) {
    auto parsed = memo::decode(entry.memo, options_.limits);
    if (!parsed) {
      ++foreign;
      continue;
    }
    const auto *prediction = std::get_if<memo::PredictionCommitment>(&*parsed);
    if (prediction && matches(*prediction, commitment)) {
      return PriorCommitment{.signature = entry.signature,
                             .explorer_url = gateway_.transaction_url(entry.signature),
                             .commitment = *prediction};
    }
  }

  logging::LogFields fields;
  fields.add_uint("scanned", memos->size());
  fields.add_uint("foreign", foreign);
  logger_.log(logging::LogLevel::Debug, std::string(COMPONENT), "no_prior_commitment",
              std::move(fields));
  return std::optional<PriorCommitment>{};
}

CommitFailure CommitmentService::fail(CommitError error, CommitStage stage, std::string message,
                                      std::optional<std::string> signature) {
  logging::LogFields fields;
  fields.add_string("error", to_string(error));
  fields.add_string("stage", to_string(stage));
  fields.add_string("detail", message);
  logger_.log(is_user_facing(error) ? logging::LogLevel::Warn : logging::LogLevel::Error,
              std::string(COMPONENT), "commit_failed", std::move(fields));
  return CommitFailure{
      .error = error, .stage = stage, .message = std::move(message), .signature = std::move(signature)};
}

bool is_user_facing(CommitError error) { return error != CommitError::Internal; }

CommitError from_memo_error(memo::MemoError error) {
  switch (error) {
  case memo::MemoError::InvalidCommitment:
  case memo::MemoError::InvalidScore:
    return CommitError::InvalidCommitment;
  case memo::MemoError::PayloadTooLarge:
    return CommitError::PayloadTooLarge;
  case memo::MemoError::UnencodableField:
    return CommitError::UnencodableField;
  }
  return CommitError::Internal;
}

bool is_retryable(CommitError error) {
  return error == CommitError::LedgerUnreachable || error == CommitError::NetworkFailure;
}

CommitError from_ledger_error(ledger::LedgerError error) {
  switch (error) {
  case ledger::LedgerError::LedgerUnreachable:
    return CommitError::LedgerUnreachable;
  case ledger::LedgerError::InsufficientFunds:
    return CommitError::InsufficientFunds;
  case ledger::LedgerError::NetworkFailure:
    return CommitError::NetworkFailure;
  case ledger::LedgerError::Rejected:
    return CommitError::Rejected;
  case ledger::LedgerError::Ambiguous:
    return CommitError::Ambiguous;
  case ledger::LedgerError::Internal:
    return CommitError::Internal;
  }
  return CommitError::Internal;
}

const char *to_string(CommitError error) {
  switch (error) {
  case CommitError::InvalidCommitment:
    return "invalid_commitment";
  case CommitError::PayloadTooLarge:
    return "payload_too_large";
  case CommitError::UnencodableField:
    return "unencodable_field";
  case CommitError::InsufficientFunds:
    return "insufficient_funds";
  case CommitError::LedgerUnreachable:
    return "ledger_unreachable";
  case CommitError::NetworkFailure:
    return "network_failure";
  case CommitError::Rejected:
    return "rejected";
  case CommitError::Ambiguous:
    return "ambiguous";
  case CommitError::Internal:
    return "internal";
  }
  return "unknown";
}

const char *to_string(CommitStage stage) {
  switch (stage) {
  case CommitStage::Validating:
    return "validating";
  case CommitStage::CheckingAffordability:
    return "checking_affordability";
  case CommitStage::Encoding:
    return "encoding";
  case CommitStage::Submitting:
    return "submitting";
  case CommitStage::Succeeded:
    return "succeeded";
  case CommitStage::Failed:
    return "failed";
  }
  return "unknown";
}

} // namespace beright::service
