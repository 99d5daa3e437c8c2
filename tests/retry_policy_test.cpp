#define BOOST_TEST_MODULE RetryPolicyTests
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <string>
#include <vector>

#include "beright/memo/memo_codec.hpp"
#include "beright/service/retry_policy.hpp"
#include "test_support.hpp"

using namespace beright;
using namespace beright::service;
using namespace std::chrono_literals;
using beright::memo::Direction;
using beright::test::ledger_failure;

namespace
{

  struct RetryFixture
  {
    test::FakeGateway gateway;
    test::RecordingLogger logger;
    Signer signer = test::make_test_signer();
    CommitmentService service{gateway, logger, ServiceOptions{}};
    std::vector<std::chrono::milliseconds> delays;
    RetryingCommitter committer{service, logger, RetryOptions{},
                                [this](std::chrono::milliseconds delay) { delays.push_back(delay); }};
  };

} // namespace

BOOST_AUTO_TEST_SUITE(backoff)

BOOST_AUTO_TEST_CASE(doubles_up_to_cap)
{
  Backoff backoff(RetryOptions{});
  BOOST_CHECK(backoff.next_delay() == 1000ms);
  BOOST_CHECK(backoff.next_delay() == 2000ms);
  BOOST_CHECK(backoff.next_delay() == 4000ms);
  BOOST_CHECK(backoff.next_delay() == 8000ms);
  BOOST_CHECK(backoff.next_delay() == 10000ms);
  BOOST_CHECK(backoff.next_delay() == 10000ms);
  backoff.reset();
  BOOST_CHECK(backoff.next_delay() == 1000ms);
}

BOOST_AUTO_TEST_CASE(fractional_multiplier)
{
  Backoff backoff(RetryOptions{.max_attempts = 5,
                               .initial_delay = 100ms,
                               .max_delay = 1000ms,
                               .multiplier = 1.5});
  BOOST_CHECK(backoff.next_delay() == 100ms);
  BOOST_CHECK(backoff.next_delay() == 150ms);
  BOOST_CHECK(backoff.next_delay() == 225ms);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(retrying, RetryFixture)

BOOST_AUTO_TEST_CASE(transient_failures_are_retried)
{
  gateway.submits.push_back(std::unexpected(ledger_failure(ledger::LedgerError::NetworkFailure)));
  gateway.affordability.push_back(
      std::unexpected(ledger_failure(ledger::LedgerError::LedgerUnreachable)));

  auto result = committer.commit(signer, "KXBTC", 0.6, Direction::Yes);
  // Attempt 1 fails the balance query, attempt 2 fails submitting, attempt 3 lands.
  BOOST_REQUIRE(result.has_value());
  BOOST_CHECK_EQUAL(gateway.submit_calls, 2);
  BOOST_REQUIRE_EQUAL(delays.size(), 2u);
  BOOST_CHECK(delays[0] == 1000ms);
  BOOST_CHECK(delays[1] == 2000ms);
}

BOOST_AUTO_TEST_CASE(gives_up_after_max_attempts)
{
  for (int i = 0; i < 3; ++i)
  {
    gateway.submits.push_back(
        std::unexpected(ledger_failure(ledger::LedgerError::NetworkFailure)));
  }
  auto result = committer.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::NetworkFailure);
  BOOST_CHECK_EQUAL(gateway.submit_calls, 3);
  BOOST_CHECK_EQUAL(delays.size(), 2u);
}

BOOST_AUTO_TEST_CASE(permanent_failures_are_not_retried)
{
  gateway.submits.push_back(std::unexpected(ledger_failure(ledger::LedgerError::Rejected)));
  auto rejected = committer.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_CHECK(rejected.error().error == CommitError::Rejected);

  gateway.affordability.push_back(test::broke());
  auto broke = committer.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_CHECK(broke.error().error == CommitError::InsufficientFunds);

  auto invalid = committer.commit(signer, "KXBTC", 1.0, Direction::Yes);
  BOOST_CHECK(invalid.error().error == CommitError::InvalidCommitment);

  BOOST_CHECK_EQUAL(gateway.submit_calls, 1);
  BOOST_CHECK(delays.empty());
}

BOOST_AUTO_TEST_CASE(ambiguous_outcome_reconciles_by_signature)
{
  gateway.submits.push_back(std::unexpected(
      ledger_failure(ledger::LedgerError::Ambiguous, std::string("sigNew"), 4'200)));
  const auto commitment = service.make_commitment(signer.address(), "KXBTC", 0.6, Direction::Yes);
  // An identical commitment made earlier must not stand in for this one.
  gateway.history = std::vector<ledger::LedgerMemo>{
      {.signature = "sigOld", .memo = *memo::encode_prediction(commitment)}};
  gateway.fates.push_back(ledger::TransactionFate::Confirmed);

  auto result = committer.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_REQUIRE(result.has_value());
  BOOST_CHECK_EQUAL(result->signature, "sigNew");
  BOOST_CHECK_EQUAL(result->explorer_url, "https://explorer.test/tx/sigNew");
  BOOST_CHECK_EQUAL(result->memo, *memo::encode_prediction(commitment));
  BOOST_CHECK_EQUAL(gateway.submit_calls, 1);
  BOOST_CHECK_EQUAL(gateway.history_calls, 0);
  BOOST_REQUIRE_EQUAL(gateway.fate_queries.size(), 1u);
  BOOST_CHECK_EQUAL(gateway.fate_queries.front().first, "sigNew");
  BOOST_CHECK(gateway.fate_queries.front().second == std::uint64_t{4'200});
  BOOST_CHECK(logger.contains("reconciled_commit"));
}

BOOST_AUTO_TEST_CASE(ambiguous_outcome_older_match_does_not_stop_polling)
{
  gateway.submits.push_back(std::unexpected(
      ledger_failure(ledger::LedgerError::Ambiguous, std::string("sigNew"), 4'200)));
  const auto commitment = service.make_commitment(signer.address(), "KXBTC", 0.6, Direction::Yes);
  gateway.history = std::vector<ledger::LedgerMemo>{
      {.signature = "sigOld", .memo = *memo::encode_prediction(commitment)}};
  gateway.fates.push_back(ledger::TransactionFate::Pending);
  gateway.fates.push_back(ledger::TransactionFate::Confirmed);

  auto result = committer.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_REQUIRE(result.has_value());
  BOOST_CHECK_EQUAL(result->signature, "sigNew");
  BOOST_CHECK_EQUAL(gateway.submit_calls, 1);
  BOOST_CHECK_EQUAL(gateway.fate_queries.size(), 2u);
  BOOST_REQUIRE_EQUAL(delays.size(), 1u);
  BOOST_CHECK(delays[0] == 1000ms);
}

BOOST_AUTO_TEST_CASE(in_flight_transaction_is_never_resubmitted)
{
  gateway.submits.push_back(std::unexpected(
      ledger_failure(ledger::LedgerError::Ambiguous, std::string("sigNew"), 4'200)));
  // Not visible yet and the blockhash is still valid: every lookup is Pending.

  auto result = committer.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::Ambiguous);
  BOOST_CHECK(result.error().signature == std::string("sigNew"));
  BOOST_CHECK_EQUAL(gateway.submit_calls, 1);
  BOOST_CHECK_EQUAL(gateway.fate_queries.size(), 3u);
  BOOST_CHECK_EQUAL(delays.size(), 2u);
  BOOST_CHECK(logger.contains("reconcile_unsettled"));
}

BOOST_AUTO_TEST_CASE(expired_transaction_is_resubmitted)
{
  gateway.submits.push_back(std::unexpected(
      ledger_failure(ledger::LedgerError::Ambiguous, std::string("sigLost"), 4'200)));
  gateway.fates.push_back(ledger::TransactionFate::Expired);

  auto result = committer.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_REQUIRE(result.has_value());
  BOOST_CHECK_EQUAL(result->signature, "sig2");
  BOOST_CHECK_EQUAL(gateway.fate_queries.size(), 1u);
  BOOST_CHECK_EQUAL(gateway.submit_calls, 2);
  BOOST_CHECK(logger.contains("reconciled_expired"));
}

BOOST_AUTO_TEST_CASE(expired_on_last_attempt_reports_network_failure)
{
  for (int i = 0; i < 3; ++i)
  {
    gateway.submits.push_back(std::unexpected(
        ledger_failure(ledger::LedgerError::Ambiguous, "sigLost" + std::to_string(i), 4'200)));
    gateway.fates.push_back(ledger::TransactionFate::Expired);
  }

  auto result = committer.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::NetworkFailure);
  BOOST_CHECK(result.error().signature == std::string("sigLost2"));
  BOOST_CHECK_EQUAL(gateway.submit_calls, 3);
}

BOOST_AUTO_TEST_CASE(landed_with_error_is_rejected)
{
  gateway.submits.push_back(std::unexpected(
      ledger_failure(ledger::LedgerError::Ambiguous, std::string("sigNew"), 4'200)));
  gateway.fates.push_back(ledger::TransactionFate::Failed);

  auto result = committer.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::Rejected);
  BOOST_CHECK(result.error().signature == std::string("sigNew"));
  BOOST_CHECK_EQUAL(gateway.submit_calls, 1);
}

BOOST_AUTO_TEST_CASE(ambiguous_outcome_with_ledger_unreachable_stops)
{
  gateway.submits.push_back(
      std::unexpected(ledger_failure(ledger::LedgerError::Ambiguous, std::string("sigX"))));
  gateway.fates.push_back(std::unexpected(ledger_failure(ledger::LedgerError::LedgerUnreachable)));
  auto result = committer.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::Ambiguous);
  BOOST_CHECK_EQUAL(gateway.submit_calls, 1);
  BOOST_CHECK(delays.empty());
}

BOOST_AUTO_TEST_CASE(ambiguous_outcome_without_signature_stops)
{
  gateway.submits.push_back(std::unexpected(ledger_failure(ledger::LedgerError::Ambiguous)));
  auto result = committer.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::Ambiguous);
  BOOST_CHECK(gateway.fate_queries.empty());
  BOOST_CHECK_EQUAL(gateway.submit_calls, 1);
}

BOOST_AUTO_TEST_CASE(on_behalf_receipt_carries_forecaster_ref)
{
  const std::string forecaster = "9WzDXwBbmkg8ZTbNMqUxvQRAyrZzDsGYdLVL9zYtAWWM";
  gateway.submits.push_back(std::unexpected(
      ledger_failure(ledger::LedgerError::Ambiguous, std::string("sigLanded"), 4'200)));
  gateway.fates.push_back(ledger::TransactionFate::Confirmed);

  auto result = committer.commit_on_behalf(signer, forecaster, "KXBTC", 0.6, Direction::Yes);
  BOOST_REQUIRE(result.has_value());
  BOOST_CHECK_EQUAL(result->signature, "sigLanded");
  BOOST_CHECK_EQUAL(result->memo, "BERIGHT|1|PREDICT|KXBTC|6000|YES|9WzDXwBbmkg8");
  BOOST_CHECK_EQUAL(gateway.submit_calls, 1);
}

BOOST_AUTO_TEST_SUITE_END()
