#define BOOST_TEST_MODULE CommitmentServiceTests
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <string>
#include <variant>

#include "beright/memo/memo_codec.hpp"
#include "beright/service/commitment_service.hpp"
#include "test_support.hpp"

using namespace beright;
using namespace beright::service;
using namespace std::chrono_literals;
using beright::memo::Direction;
using beright::test::ledger_failure;

namespace
{

  struct ServiceFixture
  {
    test::FakeGateway gateway;
    test::RecordingLogger logger;
    Signer signer = test::make_test_signer();
    CommitmentService service{gateway, logger, ServiceOptions{}};
  };

  struct CachedServiceFixture
  {
    test::FakeGateway gateway;
    test::RecordingLogger logger;
    Signer signer = test::make_test_signer();
    CommitmentService service{gateway, logger,
                              ServiceOptions{.limits = {},
                                             .committer_ref_length = 12,
                                             .query_timeout = 1s,
                                             .submit_timeout = 1s,
                                             .affordability_max_age = 60s,
                                             .recent_memo_limit = 100,
                                             .bands = {}}};
  };

  // Narrow bands: a score of 0.0784 is already Bad.
  struct StrictBandsFixture
  {
    test::FakeGateway gateway;
    test::RecordingLogger logger;
    Signer signer = test::make_test_signer();
    CommitmentService service{
        gateway, logger,
        ServiceOptions{.limits = {},
                       .committer_ref_length = 12,
                       .query_timeout = 1s,
                       .submit_timeout = 1s,
                       .affordability_max_age = 0s,
                       .recent_memo_limit = 100,
                       .bands = {.excellent = 0.01, .good = 0.02, .fair = 0.03, .poor = 0.04}}};
  };

  const std::string FORECASTER = "9WzDXwBbmkg8ZTbNMqUxvQRAyrZzDsGYdLVL9zYtAWWM";

  BatchPrediction batch_entry(std::string ticker, double probability,
                              Direction direction = Direction::Yes)
  {
    return BatchPrediction{.committer_public_key = FORECASTER,
                           .market_ticker = std::move(ticker),
                           .probability = probability,
                           .direction = direction};
  }

} // namespace

BOOST_FIXTURE_TEST_SUITE(commit, ServiceFixture)

BOOST_AUTO_TEST_CASE(successful_commit_carries_memo_and_link)
{
  auto result = service.commit(signer, "KXBTC-26DEC31-T100K", 0.72, Direction::Yes);
  BOOST_REQUIRE(result.has_value());
  BOOST_CHECK_EQUAL(result->signature, "sig1");
  BOOST_CHECK_EQUAL(result->explorer_url, "https://explorer.test/tx/sig1");
  BOOST_CHECK_EQUAL(result->memo, "BERIGHT|1|PREDICT|KXBTC-26DEC31-T100K|7200|YES|" +
                                      signer.address().substr(0, 12));
  BOOST_CHECK_EQUAL(gateway.affordability_calls, 1);
  BOOST_CHECK_EQUAL(gateway.submit_calls, 1);
  BOOST_CHECK(logger.contains("commit_succeeded"));
}

BOOST_AUTO_TEST_CASE(invalid_probability_never_touches_ledger)
{
  for (double p : {0.0, 1.0, 1.2, -0.1})
  {
    auto result = service.commit(signer, "KXBTC", p, Direction::No);
    BOOST_REQUIRE(!result.has_value());
    BOOST_CHECK(result.error().error == CommitError::InvalidCommitment);
    BOOST_CHECK(result.error().stage == CommitStage::Validating);
  }
  BOOST_CHECK_EQUAL(gateway.affordability_calls, 0);
  BOOST_CHECK_EQUAL(gateway.submit_calls, 0);
}

BOOST_AUTO_TEST_CASE(unencodable_ticker_keeps_its_category)
{
  auto delimiter = service.commit(signer, "KX|BTC", 0.5, Direction::Yes);
  BOOST_REQUIRE(!delimiter.has_value());
  BOOST_CHECK(delimiter.error().error == CommitError::UnencodableField);
  BOOST_CHECK(delimiter.error().stage == CommitStage::Validating);
  BOOST_CHECK(is_user_facing(delimiter.error().error));

  // Over the 128-byte ticker budget, but the memo still fits 500 bytes.
  auto long_ticker = service.commit(signer, std::string(200, 'K'), 0.5, Direction::Yes);
  BOOST_REQUIRE(!long_ticker.has_value());
  BOOST_CHECK(long_ticker.error().error == CommitError::UnencodableField);

  BOOST_CHECK_EQUAL(gateway.affordability_calls, 0);
}

BOOST_AUTO_TEST_CASE(oversized_memo_is_payload_too_large)
{
  auto result = service.commit(signer, std::string(600, 'K'), 0.5, Direction::Yes);
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::PayloadTooLarge);
  BOOST_CHECK(result.error().stage == CommitStage::Validating);
  BOOST_CHECK(!is_retryable(result.error().error));
  BOOST_CHECK_EQUAL(gateway.affordability_calls, 0);
}

BOOST_AUTO_TEST_CASE(insufficient_funds_never_submits)
{
  gateway.affordability.push_back(test::broke());
  auto result = service.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::InsufficientFunds);
  BOOST_CHECK(result.error().stage == CommitStage::CheckingAffordability);
  BOOST_CHECK_EQUAL(gateway.submit_calls, 0);
}

BOOST_AUTO_TEST_CASE(unreachable_ledger_during_affordability)
{
  gateway.affordability.push_back(
      std::unexpected(ledger_failure(ledger::LedgerError::LedgerUnreachable)));
  auto result = service.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::LedgerUnreachable);
  BOOST_CHECK(is_retryable(result.error().error));
  BOOST_CHECK_EQUAL(gateway.submit_calls, 0);
}

BOOST_AUTO_TEST_CASE(submit_failures_propagate_unchanged)
{
  gateway.submits.push_back(std::unexpected(ledger_failure(ledger::LedgerError::Rejected)));
  gateway.submits.push_back(std::unexpected(ledger_failure(ledger::LedgerError::NetworkFailure)));
  gateway.submits.push_back(
      std::unexpected(ledger_failure(ledger::LedgerError::Ambiguous, std::string("sigX"))));

  auto rejected = service.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_CHECK(rejected.error().error == CommitError::Rejected);
  BOOST_CHECK(rejected.error().stage == CommitStage::Submitting);

  auto network = service.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_CHECK(network.error().error == CommitError::NetworkFailure);

  auto ambiguous = service.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_CHECK(ambiguous.error().error == CommitError::Ambiguous);
  BOOST_REQUIRE(ambiguous.error().signature.has_value());
  BOOST_CHECK_EQUAL(*ambiguous.error().signature, "sigX");
  BOOST_CHECK(!is_retryable(CommitError::Ambiguous));
}

BOOST_AUTO_TEST_CASE(commit_on_behalf_references_forecaster)
{
  const std::string forecaster = "9WzDXwBbmkg8ZTbNMqUxvQRAyrZzDsGYdLVL9zYtAWWM";
  auto result = service.commit_on_behalf(signer, forecaster, "KXBTC", 0.35, Direction::No);
  BOOST_REQUIRE(result.has_value());
  BOOST_CHECK_EQUAL(result->memo, "BERIGHT|1|PREDICT|KXBTC|3500|NO|9WzDXwBbmkg8");
}

BOOST_AUTO_TEST_CASE(error_taxonomy)
{
  BOOST_CHECK(!is_user_facing(CommitError::Internal));
  BOOST_CHECK(is_user_facing(CommitError::InsufficientFunds));
  BOOST_CHECK(is_retryable(CommitError::NetworkFailure));
  BOOST_CHECK(!is_retryable(CommitError::Rejected));
  BOOST_CHECK(!is_retryable(CommitError::InvalidCommitment));
  BOOST_CHECK(from_ledger_error(ledger::LedgerError::Internal) == CommitError::Internal);

  BOOST_CHECK(from_memo_error(memo::MemoError::InvalidCommitment) == CommitError::InvalidCommitment);
  BOOST_CHECK(from_memo_error(memo::MemoError::InvalidScore) == CommitError::InvalidCommitment);
  BOOST_CHECK(from_memo_error(memo::MemoError::PayloadTooLarge) == CommitError::PayloadTooLarge);
  BOOST_CHECK(from_memo_error(memo::MemoError::UnencodableField) == CommitError::UnencodableField);
  BOOST_CHECK_EQUAL(to_string(CommitError::PayloadTooLarge), "payload_too_large");
  BOOST_CHECK_EQUAL(to_string(CommitError::UnencodableField), "unencodable_field");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(resolve, ServiceFixture)

BOOST_AUTO_TEST_CASE(resolution_memo_carries_score)
{
  const auto commitment = service.make_commitment(signer.address(), "KXBTC-26DEC31-T100K", 0.72,
                                                  Direction::Yes);
  auto result = service.resolve(signer, commitment, true);
  BOOST_REQUIRE(result.has_value());
  BOOST_CHECK_EQUAL(result->memo, "BERIGHT|1|RESOLVE|KXBTC-26DEC31-T100K|OCCURRED|784");
}

BOOST_AUTO_TEST_CASE(resolution_logs_default_band)
{
  const auto commitment = service.make_commitment(signer.address(), "KXBTC", 0.72, Direction::Yes);
  BOOST_REQUIRE(service.resolve(signer, commitment, true).has_value());
  BOOST_CHECK(logger.string_field("resolve_submitting", "band") == std::string("excellent"));
}

BOOST_AUTO_TEST_CASE(resolution_gated_on_affordability)
{
  gateway.affordability.push_back(test::broke());
  const auto commitment = service.make_commitment(signer.address(), "KXBTC", 0.3, Direction::No);
  auto result = service.resolve(signer, commitment, false);
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::InsufficientFunds);
  BOOST_CHECK_EQUAL(gateway.submit_calls, 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(configured_bands, StrictBandsFixture)

BOOST_AUTO_TEST_CASE(resolution_logs_configured_band)
{
  const auto commitment = service.make_commitment(signer.address(), "KXBTC", 0.72, Direction::Yes);
  auto result = service.resolve(signer, commitment, true);
  BOOST_REQUIRE(result.has_value());
  // The memo carries the score only; bands affect the report.
  BOOST_CHECK_EQUAL(result->memo, "BERIGHT|1|RESOLVE|KXBTC|OCCURRED|784");
  BOOST_CHECK(logger.string_field("resolve_submitting", "band") == std::string("bad"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(batch, ServiceFixture)

BOOST_AUTO_TEST_CASE(batch_lands_in_one_transaction)
{
  const std::vector<BatchPrediction> predictions{batch_entry("KXBTC", 0.72),
                                                 batch_entry("KXETH", 0.35, Direction::No),
                                                 batch_entry("KXSOL", 0.5)};
  auto result = service.commit_batch(signer, predictions);
  BOOST_REQUIRE(result.has_value());
  BOOST_CHECK_EQUAL(result->signature, "sig1");
  BOOST_CHECK_EQUAL(result->explorer_url, "https://explorer.test/tx/sig1");
  BOOST_REQUIRE_EQUAL(result->memos.size(), 3u);
  BOOST_CHECK_EQUAL(result->memos[0], "BERIGHT|1|PREDICT|KXBTC|7200|YES|9WzDXwBbmkg8");
  BOOST_CHECK_EQUAL(result->memos[1], "BERIGHT|1|PREDICT|KXETH|3500|NO|9WzDXwBbmkg8");
  BOOST_CHECK_EQUAL(result->memos[2], "BERIGHT|1|PREDICT|KXSOL|5000|YES|9WzDXwBbmkg8");

  BOOST_CHECK_EQUAL(gateway.affordability_calls, 1);
  BOOST_CHECK_EQUAL(gateway.submit_calls, 1);
  BOOST_REQUIRE_EQUAL(gateway.batches.size(), 1u);
  BOOST_CHECK(gateway.batches.front() == result->memos);
  BOOST_CHECK(gateway.submitted.empty());
  BOOST_CHECK(logger.contains("batch_succeeded"));
}

BOOST_AUTO_TEST_CASE(one_invalid_prediction_rejects_the_batch)
{
  const std::vector<BatchPrediction> predictions{batch_entry("KXBTC", 0.72),
                                                 batch_entry("KX|ETH", 0.35)};
  auto result = service.commit_batch(signer, predictions);
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::UnencodableField);
  BOOST_CHECK(result.error().stage == CommitStage::Validating);
  BOOST_CHECK(result.error().message.starts_with("prediction 1: "));
  BOOST_CHECK_EQUAL(gateway.affordability_calls, 0);
  BOOST_CHECK_EQUAL(gateway.submit_calls, 0);
}

BOOST_AUTO_TEST_CASE(empty_batch_is_invalid)
{
  auto result = service.commit_batch(signer, std::vector<BatchPrediction>{});
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::InvalidCommitment);
  BOOST_CHECK_EQUAL(gateway.submit_calls, 0);
}

BOOST_AUTO_TEST_CASE(batch_over_transaction_limit_never_touches_ledger)
{
  // Each memo is about 140 bytes; ten of them exceed 1232 bytes on the wire.
  std::vector<BatchPrediction> predictions;
  for (int i = 0; i < 10; ++i)
  {
    predictions.push_back(batch_entry("KXBTC-26DEC31-T100K-" + std::string(80, static_cast<char>('A' + i)), 0.6));
  }
  auto result = service.commit_batch(signer, predictions);
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::PayloadTooLarge);
  BOOST_CHECK_EQUAL(gateway.affordability_calls, 0);
  BOOST_CHECK_EQUAL(gateway.submit_calls, 0);
}

BOOST_AUTO_TEST_CASE(batch_gated_once_on_affordability)
{
  gateway.affordability.push_back(test::broke());
  const std::vector<BatchPrediction> predictions{batch_entry("KXBTC", 0.72),
                                                 batch_entry("KXETH", 0.35)};
  auto result = service.commit_batch(signer, predictions);
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::InsufficientFunds);
  BOOST_CHECK_EQUAL(gateway.affordability_calls, 1);
  BOOST_CHECK_EQUAL(gateway.submit_calls, 0);
}

BOOST_AUTO_TEST_CASE(ambiguous_batch_carries_signature_and_expiry)
{
  gateway.submits.push_back(std::unexpected(
      ledger_failure(ledger::LedgerError::Ambiguous, std::string("sigBatch"), 4'200)));
  const std::vector<BatchPrediction> predictions{batch_entry("KXBTC", 0.72)};
  auto result = service.commit_batch(signer, predictions);
  BOOST_REQUIRE(!result.has_value());
  BOOST_CHECK(result.error().error == CommitError::Ambiguous);
  BOOST_CHECK(result.error().signature == std::string("sigBatch"));
  BOOST_CHECK(result.error().last_valid_block_height == std::uint64_t{4'200});
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(reconciliation, ServiceFixture)

BOOST_AUTO_TEST_CASE(finds_matching_prediction)
{
  const auto commitment =
      service.make_commitment(signer.address(), "KXBTC", 0.72, Direction::Yes);
  gateway.history = std::vector<ledger::LedgerMemo>{
      {.signature = "sigForeign", .memo = "gm"},
      {.signature = "sigOther",
       .memo = *memo::encode_prediction(
           service.make_commitment(signer.address(), "KXETH", 0.72, Direction::Yes))},
      {.signature = "sigMatch", .memo = *memo::encode_prediction(commitment)},
  };

  auto prior = service.find_prior_commitment(signer, commitment);
  BOOST_REQUIRE(prior.has_value());
  BOOST_REQUIRE(prior->has_value());
  BOOST_CHECK_EQUAL((*prior)->signature, "sigMatch");
  BOOST_CHECK_EQUAL((*prior)->explorer_url, "https://explorer.test/tx/sigMatch");
}

BOOST_AUTO_TEST_CASE(matches_at_basis_point_precision)
{
  auto commitment = service.make_commitment(signer.address(), "KXBTC", 0.72, Direction::Yes);
  gateway.history = std::vector<ledger::LedgerMemo>{
      {.signature = "sigMatch", .memo = *memo::encode_prediction(commitment)}};

  commitment.probability = 0.72004;
  auto prior = service.find_prior_commitment(signer, commitment);
  BOOST_REQUIRE(prior.has_value());
  BOOST_CHECK(prior->has_value());

  commitment.probability = 0.73;
  prior = service.find_prior_commitment(signer, commitment);
  BOOST_REQUIRE(prior.has_value());
  BOOST_CHECK(!prior->has_value());
}

BOOST_AUTO_TEST_CASE(fate_lookup_passes_signature_and_expiry)
{
  gateway.fates.push_back(ledger::TransactionFate::Expired);
  auto fate = service.transaction_fate("sigNew", 4'200);
  BOOST_REQUIRE(fate.has_value());
  BOOST_CHECK(*fate == ledger::TransactionFate::Expired);
  BOOST_REQUIRE_EQUAL(gateway.fate_queries.size(), 1u);
  BOOST_CHECK_EQUAL(gateway.fate_queries.front().first, "sigNew");
  BOOST_CHECK(gateway.fate_queries.front().second == std::uint64_t{4'200});

  gateway.fates.push_back(std::unexpected(ledger_failure(ledger::LedgerError::LedgerUnreachable)));
  auto unreachable = service.transaction_fate("sigNew", std::nullopt);
  BOOST_REQUIRE(!unreachable.has_value());
  BOOST_CHECK(unreachable.error().error == CommitError::LedgerUnreachable);
  BOOST_CHECK(unreachable.error().signature == std::string("sigNew"));
}

BOOST_AUTO_TEST_CASE(history_unavailable)
{
  gateway.history = std::unexpected(ledger_failure(ledger::LedgerError::LedgerUnreachable));
  const auto commitment =
      service.make_commitment(signer.address(), "KXBTC", 0.72, Direction::Yes);
  auto prior = service.find_prior_commitment(signer, commitment);
  BOOST_REQUIRE(!prior.has_value());
  BOOST_CHECK(prior.error().error == CommitError::LedgerUnreachable);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(affordability_cache, CachedServiceFixture)

BOOST_AUTO_TEST_CASE(fresh_snapshot_is_reused_until_submit)
{
  gateway.affordability.push_back(test::broke());
  auto first = service.commit(signer, "KXBTC", 0.6, Direction::Yes);
  auto second = service.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_CHECK(first.error().error == CommitError::InsufficientFunds);
  BOOST_CHECK(second.error().error == CommitError::InsufficientFunds);
  BOOST_CHECK_EQUAL(gateway.affordability_calls, 1);
}

BOOST_AUTO_TEST_CASE(successful_submit_invalidates_snapshot)
{
  BOOST_REQUIRE(service.commit(signer, "KXBTC", 0.6, Direction::Yes).has_value());
  gateway.affordability.push_back(test::broke());
  auto second = service.commit(signer, "KXBTC", 0.6, Direction::Yes);
  BOOST_REQUIRE(!second.has_value());
  BOOST_CHECK(second.error().error == CommitError::InsufficientFunds);
  BOOST_CHECK_EQUAL(gateway.affordability_calls, 2);
  BOOST_CHECK_EQUAL(gateway.submit_calls, 1);
}

BOOST_AUTO_TEST_CASE(ambiguous_submit_invalidates_snapshot)
{
  gateway.submits.push_back(
      std::unexpected(ledger_failure(ledger::LedgerError::Ambiguous, std::string("sigX"))));
  BOOST_REQUIRE(!service.commit(signer, "KXBTC", 0.6, Direction::Yes).has_value());
  BOOST_REQUIRE(service.commit(signer, "KXBTC", 0.6, Direction::Yes).has_value());
  BOOST_CHECK_EQUAL(gateway.affordability_calls, 2);
}

BOOST_AUTO_TEST_SUITE_END()
