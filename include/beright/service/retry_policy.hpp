#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>

#include "beright/core/signer.hpp"
#include "beright/logging/logger.hpp"
#include "beright/memo/memo_types.hpp"
#include "beright/service/commitment_service.hpp"

namespace beright::service
{

  /** Caller-side retry limits for commits. */
  struct RetryOptions
  {
    std::size_t max_attempts = 3;
    std::chrono::milliseconds initial_delay{1'000};
    std::chrono::milliseconds max_delay{10'000};
    double multiplier = 2.0;
  };

  /** Exponential backoff state for one retried operation. */
  struct Backoff
  {
    std::chrono::milliseconds initial{1'000};
    std::chrono::milliseconds max{10'000};
    double multiplier = 2.0;
    std::chrono::milliseconds current{1'000};

    Backoff() = default;
    explicit Backoff(const RetryOptions &options)
        : initial(options.initial_delay), max(options.max_delay),
          multiplier(options.multiplier), current(options.initial_delay) {}

    void reset() { current = initial; }

    std::chrono::milliseconds next_delay()
    {
      auto delay = current;
      if (current < max)
      {
        auto grown = std::chrono::duration_cast<std::chrono::milliseconds>(current * multiplier);
        current = std::min(grown, max);
      }
      return delay;
    }
  };

  /**
   * Wraps CommitmentService with backoff retries of transient failures.
   * After an Ambiguous outcome the signed transaction itself is looked up:
   * it is resubmitted only once its blockhash has expired without it landing.
   * While its fate stays unknown it is polled with the same backoff, and the
   * Ambiguous failure is returned when the attempts run out.
   */
  class RetryingCommitter
  {
  public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * Construct over a service.
     * @param service Service performing single attempts.
     * @param logger Logger for retry diagnostics.
     * @param options Retry limits.
     * @param sleeper Wait between attempts (defaults to sleeping the thread).
     */
    RetryingCommitter(CommitmentService &service, logging::Logger &logger, RetryOptions options,
                      Sleeper sleeper = {});

    /**
     * Commit with retries; committer is the signing account.
     * @return Receipt of the landed commitment or the last failure.
     */
    [[nodiscard]] CommitResult commit(const Signer &account, std::string_view market_ticker,
                                      double probability, memo::Direction direction);

    /**
     * Commit with retries on behalf of `committer_public_key`.
     * @return Receipt of the landed commitment or the last failure.
     */
    [[nodiscard]] CommitResult commit_on_behalf(const Signer &account,
                                                std::string_view committer_public_key,
                                                std::string_view market_ticker, double probability,
                                                memo::Direction direction);

  private:
    // Result to return for an Ambiguous failure, or std::nullopt when the
    // transaction is known not to have landed.
    [[nodiscard]] std::optional<CommitResult> settle(const CommitFailure &ambiguous,
                                                     const memo::PredictionCommitment &commitment);

    [[nodiscard]] CommitResult run(const Signer &account, std::string_view committer_public_key,
                                   std::string_view market_ticker, double probability,
                                   memo::Direction direction);

    CommitmentService &service_;
    logging::Logger &logger_;
    RetryOptions options_;
    Sleeper sleeper_;
  };

} // namespace beright::service
