#include "beright/service/retry_policy.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include "beright/memo/memo_codec.hpp"

namespace beright::service {

namespace {

constexpr std::string_view COMPONENT = "service.retry";

} // namespace

RetryingCommitter::RetryingCommitter(CommitmentService &service, logging::Logger &logger,
                                     RetryOptions options, Sleeper sleeper)
    : service_(service), logger_(logger), options_(options), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

CommitResult RetryingCommitter::commit(const Signer &account, std::string_view market_ticker,
                                       double probability, memo::Direction direction) {
  return run(account, account.address(), market_ticker, probability, direction);
}

CommitResult RetryingCommitter::commit_on_behalf(const Signer &account,
                                                 std::string_view committer_public_key,
                                                 std::string_view market_ticker, double probability,
                                                 memo::Direction direction) {
  return run(account, committer_public_key, market_ticker, probability, direction);
}

std::optional<CommitResult> RetryingCommitter::settle(
    const CommitFailure &ambiguous, const memo::PredictionCommitment &commitment) {
  if (!ambiguous.signature) {
    // Nothing to look up: resubmitting could duplicate the commitment.
    return CommitResult(std::unexpected(ambiguous));
  }
  const auto &signature = *ambiguous.signature;
  const auto checks = std::max<std::size_t>(options_.max_attempts, 1);
  Backoff backoff(options_);

  for (std::size_t check = 1;; ++check) {
    auto fate = service_.transaction_fate(signature, ambiguous.last_valid_block_height);
    if (!fate) {
      return CommitResult(std::unexpected(ambiguous));
    }

    logging::LogFields fields;
    fields.add_string("signature", signature);
    fields.add_string("fate", ledger::to_string(*fate));
    fields.add_uint("check", check);

    switch (*fate) {
    case ledger::TransactionFate::Confirmed: {
      logger_.log(logging::LogLevel::Info, std::string(COMPONENT), "reconciled_commit",
                  std::move(fields));
      auto encoded = memo::encode_prediction(commitment, service_.options().limits);
      return CommitResult(CommitReceipt{.signature = signature,
                                        .explorer_url = service_.transaction_url(signature),
                                        .memo = encoded ? std::move(*encoded) : memo::Memo{}});
    }
    case ledger::TransactionFate::Failed:
      logger_.log(logging::LogLevel::Warn, std::string(COMPONENT), "reconciled_failure",
                  std::move(fields));
      return CommitResult(std::unexpected(CommitFailure{.error = CommitError::Rejected,
                                                        .stage = CommitStage::Submitting,
                                                        .message = "transaction landed with an error",
                                                        .signature = signature,
                                                        .last_valid_block_height = std::nullopt}));
    case ledger::TransactionFate::Expired:
      logger_.log(logging::LogLevel::Info, std::string(COMPONENT), "reconciled_expired",
                  std::move(fields));
      return std::nullopt;
    case ledger::TransactionFate::Pending:
      break;
    }

    if (check >= checks) {
      logger_.log(logging::LogLevel::Warn, std::string(COMPONENT), "reconcile_unsettled",
                  std::move(fields));
      return CommitResult(std::unexpected(ambiguous));
    }
    sleeper_(backoff.next_delay());
  }
}

CommitResult RetryingCommitter::run(const Signer &account, std::string_view committer_public_key,
                                    std::string_view market_ticker, double probability,
                                    memo::Direction direction) {
  const auto commitment =
      service_.make_commitment(committer_public_key, market_ticker, probability, direction);
  const auto attempts = std::max<std::size_t>(options_.max_attempts, 1);
  Backoff backoff(options_);

  for (std::size_t attempt = 1;; ++attempt) {
    auto result = committer_public_key == account.address()
                      ? service_.commit(account, market_ticker, probability, direction)
                      : service_.commit_on_behalf(account, committer_public_key, market_ticker,
                                                  probability, direction);
    if (result) {
      return result;
    }

    if (result.error().error == CommitError::Ambiguous) {
      auto settled = settle(result.error(), commitment);
      if (settled) {
        return std::move(*settled);
      }
      result = std::unexpected(CommitFailure{.error = CommitError::NetworkFailure,
                                             .stage = CommitStage::Submitting,
                                             .message = "transaction expired without landing",
                                             .signature = result.error().signature,
                                             .last_valid_block_height = std::nullopt});
    } else if (!is_retryable(result.error().error)) {
      return result;
    }

    if (attempt >= attempts) {
      return result;
    }

    const auto delay = backoff.next_delay();
    logging::LogFields fields;
    fields.add_string("error", to_string(result.error().error));
    fields.add_uint("attempt", attempt);
    fields.add_duration("delay", delay);
    logger_.log(logging::LogLevel::Warn, std::string(COMPONENT), "commit_retry", std::move(fields));
    sleeper_(delay);
  }
}

} // namespace beright::service
