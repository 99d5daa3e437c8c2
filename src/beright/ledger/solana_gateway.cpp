#include "beright/ledger/solana_gateway.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <sstream>
#include <thread>
#include <utility>

#include <simdjson.h>

#include "beright/core/encoding.hpp"
#include "beright/ledger/transaction.hpp"

namespace beright::ledger
{

  namespace
  {

    using Clock = std::chrono::steady_clock;
    using Value = simdjson::ondemand::value;

    constexpr std::string_view COMPONENT = "ledger.solana";
    constexpr std::size_t MAX_SIGNATURE_PAGE = 1000;

    /** Error object of a JSON-RPC reply. */
    struct JsonRpcError
    {
      std::int64_t code = 0;
      std::string message;
      std::string data_err;
    };

    enum class ReplyFault
    {
      Malformed,
      RpcError
    };

    struct ReplyError
    {
      ReplyFault fault;
      JsonRpcError rpc;
    };

    /** One entry of getSignatureStatuses. */
    struct StatusReading
    {
      bool present = false;
      bool failed = false;
      std::string confirmation;
    };

    ReplyError malformed()
    {
      return ReplyError{.fault = ReplyFault::Malformed, .rpc = {}};
    }

    bool is_null(simdjson::simdjson_result<Value> &field)
    {
      auto type = field.type();
      return !type.error() && type.value() == simdjson::ondemand::json_type::null;
    }

    ReplyError read_rpc_error(simdjson::simdjson_result<Value> &field)
    {
      ReplyError out{.fault = ReplyFault::RpcError, .rpc = {}};
      auto obj = field.get_object();
      if (obj.error())
      {
        out.rpc.message = "malformed error object";
        return out;
      }
      auto code = obj.value()["code"].get_int64();
      if (!code.error())
      {
        out.rpc.code = code.value();
      }
      auto message = obj.value()["message"].get_string();
      if (!message.error())
      {
        out.rpc.message = std::string(message.value());
      }
      auto data = obj.value()["data"];
      if (!data.error() && !is_null(data))
      {
        auto data_obj = data.get_object();
        if (!data_obj.error())
        {
          auto err = data_obj.value()["err"];
          if (!err.error())
          {
            auto text = err.get_string();
            if (!text.error())
            {
              out.rpc.data_err = std::string(text.value());
            }
          }
        }
      }
      return out;
    }

    // Parses a JSON-RPC envelope; read_result maps "result" to std::optional<T>.
    template <typename T, typename ReadResult>
    std::expected<T, ReplyError> parse_reply(const std::string &body, ReadResult &&read_result)
    {
      simdjson::ondemand::parser parser;
      simdjson::padded_string padded(body);
      auto doc = parser.iterate(padded);
      if (doc.error())
      {
        return std::unexpected(malformed());
      }
      auto root = doc.get_object();
      if (root.error())
      {
        return std::unexpected(malformed());
      }

      auto err = root.value()["error"];
      if (!err.error())
      {
        return std::unexpected(read_rpc_error(err));
      }
      if (err.error() != simdjson::NO_SUCH_FIELD)
      {
        return std::unexpected(malformed());
      }

      auto result = root.value()["result"];
      if (result.error())
      {
        return std::unexpected(malformed());
      }
      std::optional<T> parsed = read_result(result);
      if (!parsed)
      {
        return std::unexpected(malformed());
      }
      return std::move(*parsed);
    }

    std::optional<std::uint64_t> read_balance(simdjson::simdjson_result<Value> &result)
    {
      auto value = result.get_object()["value"].get_uint64();
      if (value.error())
      {
        return std::nullopt;
      }
      return value.value();
    }

    std::optional<RecentBlockhash> read_blockhash(simdjson::simdjson_result<Value> &result)
    {
      auto value = result.get_object()["value"].get_object();
      if (value.error())
      {
        return std::nullopt;
      }
      auto text = value.value()["blockhash"].get_string();
      if (text.error())
      {
        return std::nullopt;
      }
      auto hash = decode_key(text.value());
      if (!hash)
      {
        return std::nullopt;
      }
      RecentBlockhash out{.hash = *hash, .last_valid_block_height = std::nullopt};
      auto height = value.value()["lastValidBlockHeight"].get_uint64();
      if (!height.error())
      {
        out.last_valid_block_height = height.value();
      }
      return out;
    }

    std::optional<std::uint64_t> read_uint(simdjson::simdjson_result<Value> &result)
    {
      auto value = result.get_uint64();
      if (value.error())
      {
        return std::nullopt;
      }
      return value.value();
    }

    std::optional<std::string> read_string(simdjson::simdjson_result<Value> &result)
    {
      auto text = result.get_string();
      if (text.error())
      {
        return std::nullopt;
      }
      return std::string(text.value());
    }

    std::optional<StatusReading> read_status(simdjson::simdjson_result<Value> &result)
    {
      auto entries = result.get_object()["value"].get_array();
      if (entries.error())
      {
        return std::nullopt;
      }
      StatusReading reading;
      for (auto entry : entries)
      {
        if (is_null(entry))
        {
          return reading;
        }
        auto obj = entry.get_object();
        if (obj.error())
        {
          return std::nullopt;
        }
        reading.present = true;
        auto err = obj.value()["err"];
        reading.failed = !err.error() && !is_null(err);
        auto status = obj.value()["confirmationStatus"].get_string();
        if (!status.error())
        {
          reading.confirmation = std::string(status.value());
        }
        return reading;
      }
      return reading;
    }

    std::optional<std::vector<LedgerMemo>> read_memos(simdjson::simdjson_result<Value> &result)
    {
      auto entries = result.get_array();
      if (entries.error())
      {
        return std::nullopt;
      }
      std::vector<LedgerMemo> memos;
      for (auto entry : entries)
      {
        auto obj = entry.get_object();
        if (obj.error())
        {
          return std::nullopt;
        }
        auto signature = obj.value()["signature"].get_string();
        if (signature.error())
        {
          return std::nullopt;
        }
        std::string sig(signature.value());

        auto err = obj.value()["err"];
        if (!err.error() && !is_null(err))
        {
          continue;
        }
        auto memo = obj.value()["memo"];
        if (memo.error() || is_null(memo))
        {
          continue;
        }
        auto text = memo.get_string();
        if (text.error())
        {
          continue;
        }
        memos.push_back(LedgerMemo{.signature = std::move(sig),
                                   .memo = strip_memo_prefix(text.value())});
      }
      return memos;
    }

    std::string lowercase(std::string_view text)
    {
      std::string out(text);
      std::transform(out.begin(), out.end(), out.begin(),
                     [](unsigned char c)
                     { return static_cast<char>(std::tolower(c)); });
      return out;
    }

    // Node refused the transaction before it could land.
    LedgerError classify_send_error(const JsonRpcError &rpc)
    {
      // -32005: node unhealthy / behind.
      constexpr std::int64_t NODE_UNHEALTHY = -32005;
      const auto text = lowercase(rpc.message + " " + rpc.data_err);
      if (text.find("insufficient") != std::string::npos ||
          text.find("no record of a prior credit") != std::string::npos ||
          text.find("accountnotfound") != std::string::npos)
      {
        return LedgerError::InsufficientFunds;
      }
      if (text.find("blockhash not found") != std::string::npos ||
          text.find("blockhashnotfound") != std::string::npos || rpc.code == NODE_UNHEALTHY)
      {
        return LedgerError::NetworkFailure;
      }
      return LedgerError::Rejected;
    }

    bool is_throttled(unsigned http_status)
    {
      return http_status == 429 || http_status == 502 || http_status == 503 ||
             http_status == 504;
    }

    std::chrono::milliseconds remaining(Clock::time_point deadline)
    {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
      return std::max(left, std::chrono::milliseconds{0});
    }

    // processed < confirmed < finalized; anything else ranks below processed.
    int confirmation_rank(std::string_view level)
    {
      if (level == "finalized")
      {
        return 3;
      }
      if (level == "confirmed")
      {
        return 2;
      }
      if (level == "processed")
      {
        return 1;
      }
      return 0;
    }

    std::string describe(const RpcFailure &failure)
    {
      std::string out = to_string(failure.error);
      if (!failure.detail.empty())
      {
        out += ": ";
        out += failure.detail;
      }
      return out;
    }

    std::string describe(const ReplyError &error)
    {
      if (error.fault == ReplyFault::Malformed)
      {
        return "malformed rpc reply";
      }
      std::string out = "rpc error " + std::to_string(error.rpc.code) + ": " + error.rpc.message;
      if (!error.rpc.data_err.empty())
      {
        out += " (" + error.rpc.data_err + ")";
      }
      return out;
    }

  } // namespace

  std::string explorer_url(std::string_view explorer_base,
                           std::string_view cluster,
                           std::string_view signature)
  {
    std::string url(explorer_base);
    url += "/tx/";
    url += signature;
    if (!cluster.empty() && cluster != "mainnet-beta")
    {
      url += "?cluster=";
      url += cluster;
    }
    return url;
  }

  std::string strip_memo_prefix(std::string_view rpc_memo)
  {
    if (rpc_memo.empty() || rpc_memo.front() != '[')
    {
      return std::string(rpc_memo);
    }
    auto close = rpc_memo.find("] ");
    if (close == std::string_view::npos)
    {
      return std::string(rpc_memo);
    }
    std::size_t declared = 0;
    auto digits = rpc_memo.substr(1, close - 1);
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), declared);
    auto body = rpc_memo.substr(close + 2);
    if (ec != std::errc{} || ptr != digits.data() + digits.size())
    {
      return std::string(body);
    }
    return std::string(body.substr(0, declared));
  }

  SolanaLedgerGateway::SolanaLedgerGateway(RpcTransport &transport,
                                           logging::Logger &logger,
                                           SolanaGatewayOptions options,
                                           Sleeper sleeper)
      : transport_(transport), logger_(logger), options_(std::move(options)),
        sleeper_(std::move(sleeper))
  {
    if (!sleeper_)
    {
      sleeper_ = [](std::chrono::milliseconds delay)
      { std::this_thread::sleep_for(delay); };
    }
  }

  std::expected<std::string, RpcFailure> SolanaLedgerGateway::call(
      std::string_view method, std::string_view params, std::chrono::milliseconds timeout)
  {
    std::ostringstream out;
    out << "{\"jsonrpc\":\"2.0\",\"id\":" << next_id_++ << ",\"method\":\"" << method
        << "\",\"params\":" << params << "}";
    return transport_.post(out.str(), timeout);
  }

  std::expected<WalletAffordability, LedgerFailure> SolanaLedgerGateway::get_affordability(
      const Signer &account, std::chrono::milliseconds timeout)
  {
    std::ostringstream params;
    params << "[\"" << account.address() << "\",{\"commitment\":\"" << options_.commitment
           << "\"}]";

    auto body = call("getBalance", params.str(), timeout);
    if (!body)
    {
      LedgerFailure failure{.error = LedgerError::LedgerUnreachable,
                            .message = describe(body.error()),
                            .signature = std::nullopt};
      log_failure("balance_query_failed", failure);
      return std::unexpected(std::move(failure));
    }

    auto balance = parse_reply<std::uint64_t>(*body, read_balance);
    if (!balance)
    {
      LedgerFailure failure{.error = LedgerError::LedgerUnreachable,
                            .message = describe(balance.error()),
                            .signature = std::nullopt};
      log_failure("balance_query_failed", failure);
      return std::unexpected(std::move(failure));
    }

    auto affordability = compute_affordability(*balance, options_.cost);
    logging::LogFields fields;
    fields.add_address("account", account.address());
    fields.add_uint("lamports", affordability.spendable_lamports);
    fields.add_uint("remaining_commitments", affordability.estimated_remaining_commitments);
    fields.add_bool("can_commit", affordability.can_commit);
    logger_.log(logging::LogLevel::Debug, std::string(COMPONENT), "affordability",
                std::move(fields));
    return affordability;
  }

  std::expected<RecentBlockhash, LedgerFailure> SolanaLedgerGateway::latest_blockhash(
      std::chrono::milliseconds timeout)
  {
    std::ostringstream params;
    params << "[{\"commitment\":\"" << options_.commitment << "\"}]";

    auto body = call("getLatestBlockhash", params.str(), timeout);
    if (!body)
    {
      return std::unexpected(LedgerFailure{.error = LedgerError::NetworkFailure,
                                           .message = describe(body.error()),
                                           .signature = std::nullopt});
    }
    auto blockhash = parse_reply<RecentBlockhash>(*body, read_blockhash);
    if (!blockhash)
    {
      return std::unexpected(LedgerFailure{.error = LedgerError::NetworkFailure,
                                           .message = describe(blockhash.error()),
                                           .signature = std::nullopt});
    }
    return *blockhash;
  }

  std::expected<std::uint64_t, LedgerFailure> SolanaLedgerGateway::block_height(
      std::chrono::milliseconds timeout)
  {
    std::ostringstream params;
    params << "[{\"commitment\":\"" << options_.commitment << "\"}]";

    auto body = call("getBlockHeight", params.str(), timeout);
    if (!body)
    {
      return std::unexpected(LedgerFailure{.error = LedgerError::LedgerUnreachable,
                                           .message = describe(body.error()),
                                           .signature = std::nullopt});
    }
    auto height = parse_reply<std::uint64_t>(*body, read_uint);
    if (!height)
    {
      return std::unexpected(LedgerFailure{.error = LedgerError::LedgerUnreachable,
                                           .message = describe(height.error()),
                                           .signature = std::nullopt});
    }
    return *height;
  }

  std::expected<std::string, LedgerFailure> SolanaLedgerGateway::send_transaction(
      const std::string &wire_base64, const std::string &signature,
      std::chrono::milliseconds timeout)
  {
    std::ostringstream params;
    params << "[\"" << wire_base64 << "\",{\"encoding\":\"base64\",\"preflightCommitment\":\""
           << options_.commitment << "\"}]";

    auto body = call("sendTransaction", params.str(), timeout);
    if (!body)
    {
      const auto &failure = body.error();
      if (!failure.request_sent || is_throttled(failure.http_status))
      {
        return std::unexpected(LedgerFailure{.error = LedgerError::NetworkFailure,
                                             .message = describe(failure),
                                             .signature = std::nullopt});
      }
      return std::unexpected(LedgerFailure{.error = LedgerError::Ambiguous,
                                           .message = describe(failure),
                                           .signature = signature});
    }

    auto returned = parse_reply<std::string>(*body, read_string);
    if (!returned)
    {
      const auto &error = returned.error();
      if (error.fault == ReplyFault::Malformed)
      {
        return std::unexpected(LedgerFailure{.error = LedgerError::Ambiguous,
                                             .message = describe(error),
                                             .signature = signature});
      }
      return std::unexpected(LedgerFailure{.error = classify_send_error(error.rpc),
                                           .message = describe(error),
                                           .signature = std::nullopt});
    }

    if (*returned != signature)
    {
      logging::LogFields fields;
      fields.add_string("expected", signature);
      fields.add_string("returned", *returned);
      logger_.log(logging::LogLevel::Warn, std::string(COMPONENT), "signature_mismatch",
                  std::move(fields));
    }
    return signature;
  }

  SolanaLedgerGateway::StatusPoll SolanaLedgerGateway::poll_status(
      const std::string &signature, std::chrono::milliseconds timeout, std::string &detail)
  {
    std::ostringstream params;
    params << "[[\"" << signature << "\"]]";

    auto body = call("getSignatureStatuses", params.str(), timeout);
    if (!body)
    {
      detail = describe(body.error());
      return StatusPoll::Pending;
    }
    auto reading = parse_reply<StatusReading>(*body, read_status);
    if (!reading)
    {
      detail = describe(reading.error());
      return StatusPoll::Pending;
    }
    if (!reading->present)
    {
      return StatusPoll::Pending;
    }
    if (reading->failed)
    {
      detail = "transaction landed with an error";
      return StatusPoll::Failed;
    }
    if (meets_commitment(reading->confirmation))
    {
      return StatusPoll::Confirmed;
    }
    return StatusPoll::Pending;
  }

  bool SolanaLedgerGateway::meets_commitment(std::string_view confirmation) const
  {
    const auto required = std::max(confirmation_rank(options_.commitment), 1);
    return confirmation_rank(confirmation) >= required;
  }

  std::expected<SubmitReceipt, LedgerFailure> SolanaLedgerGateway::await_confirmation(
      const std::string &signature, Clock::time_point deadline)
  {
    std::string detail;
    for (;;)
    {
      auto left = remaining(deadline);
      if (left.count() <= 0)
      {
        return std::unexpected(LedgerFailure{
            .error = LedgerError::Ambiguous,
            .message = detail.empty() ? "confirmation not observed before deadline" : detail,
            .signature = signature});
      }

      switch (poll_status(signature, left, detail))
      {
      case StatusPoll::Confirmed:
        return SubmitReceipt{
            .signature = signature,
            .explorer_url = transaction_url(signature)};
      case StatusPoll::Failed:
        return std::unexpected(LedgerFailure{.error = LedgerError::Rejected,
                                             .message = detail,
                                             .signature = signature});
      case StatusPoll::Pending:
        break;
      }

      sleeper_(std::min(options_.confirm_poll_interval, remaining(deadline)));
    }
  }

  std::expected<SubmitReceipt, LedgerFailure> SolanaLedgerGateway::submit(
      const Signer &account, const memo::Memo &memo, std::chrono::milliseconds timeout)
  {
    return submit_memos(account, std::span<const memo::Memo>(&memo, 1), timeout);
  }

  std::expected<SubmitReceipt, LedgerFailure> SolanaLedgerGateway::submit_batch(
      const Signer &account, std::span<const memo::Memo> memos, std::chrono::milliseconds timeout)
  {
    if (memos.empty())
    {
      return std::unexpected(LedgerFailure{.error = LedgerError::Internal,
                                           .message = "batch carries no memos",
                                           .signature = std::nullopt});
    }
    return submit_memos(account, memos, timeout);
  }

  std::expected<SubmitReceipt, LedgerFailure> SolanaLedgerGateway::submit_memos(
      const Signer &account, std::span<const memo::Memo> memos, std::chrono::milliseconds timeout)
  {
    const auto deadline = Clock::now() + timeout;

    auto memo_program = decode_key(MEMO_PROGRAM_ID);
    if (!memo_program)
    {
      return std::unexpected(LedgerFailure{.error = LedgerError::Internal,
                                           .message = "memo program id does not decode",
                                           .signature = std::nullopt});
    }

    auto blockhash = latest_blockhash(timeout);
    if (!blockhash)
    {
      log_failure("blockhash_fetch_failed", blockhash.error());
      return std::unexpected(blockhash.error());
    }

    const auto message =
        build_memo_message(account.public_key(), *memo_program, blockhash->hash, memos);
    auto sig = account.sign(message);
    if (!sig)
    {
      LedgerFailure failure{.error = LedgerError::Internal,
                            .message = std::string(to_string(sig.error())) + ": " +
                                       last_sign_error(),
                            .signature = std::nullopt};
      log_failure("signing_failed", failure);
      return std::unexpected(std::move(failure));
    }

    const auto wire = serialize_transaction(*sig, message);
    if (wire.size() > MAX_TRANSACTION_BYTES)
    {
      LedgerFailure failure{.error = LedgerError::Rejected,
                            .message = "transaction exceeds " +
                                       std::to_string(MAX_TRANSACTION_BYTES) + " bytes",
                            .signature = std::nullopt};
      log_failure("transaction_too_large", failure);
      return std::unexpected(std::move(failure));
    }

    const auto signature = base58_encode(*sig);
    auto left = remaining(deadline);
    if (left.count() <= 0)
    {
      LedgerFailure failure{.error = LedgerError::NetworkFailure,
                            .message = "deadline exceeded before broadcast",
                            .signature = std::nullopt};
      log_failure("submit_deadline", failure);
      return std::unexpected(std::move(failure));
    }

    logging::LogFields fields;
    fields.add_address("account", account.address());
    fields.add_string("signature", signature);
    std::size_t memo_bytes = 0;
    for (const auto &memo : memos)
    {
      memo_bytes += memo.size();
    }
    fields.add_uint("memos", memos.size());
    fields.add_uint("memo_bytes", memo_bytes);
    fields.add_duration("budget", left);
    logger_.log(logging::LogLevel::Debug, std::string(COMPONENT), "broadcast",
                std::move(fields));

    auto sent = send_transaction(base64_encode(wire), signature, left);
    if (!sent)
    {
      auto failure = std::move(sent.error());
      if (failure.error == LedgerError::Ambiguous)
      {
        failure.last_valid_block_height = blockhash->last_valid_block_height;
      }
      log_failure("send_failed", failure);
      return std::unexpected(std::move(failure));
    }

    auto receipt = await_confirmation(signature, deadline);
    if (!receipt)
    {
      if (receipt.error().error == LedgerError::Ambiguous)
      {
        receipt.error().last_valid_block_height = blockhash->last_valid_block_height;
      }
      log_failure("confirmation_failed", receipt.error());
      return receipt;
    }

    logging::LogFields done;
    done.add_string("signature", receipt->signature);
    done.add_string("explorer_url", receipt->explorer_url);
    logger_.log(logging::LogLevel::Info, std::string(COMPONENT), "submit_confirmed",
                std::move(done));
    return receipt;
  }

  std::expected<TransactionFate, LedgerFailure> SolanaLedgerGateway::transaction_fate(
      std::string_view signature, std::optional<std::uint64_t> last_valid_block_height,
      std::chrono::milliseconds timeout)
  {
    const auto deadline = Clock::now() + timeout;

    // Height first: a signature still absent once the chain is past its
    // last valid height can no longer land.
    std::optional<std::uint64_t> height;
    if (last_valid_block_height)
    {
      auto current = block_height(timeout);
      if (!current)
      {
        current.error().signature = std::string(signature);
        log_failure("fate_query_failed", current.error());
        return std::unexpected(current.error());
      }
      height = *current;
    }

    std::ostringstream params;
    params << "[[\"" << signature << "\"],{\"searchTransactionHistory\":true}]";
    auto body = call("getSignatureStatuses", params.str(), remaining(deadline));
    if (!body)
    {
      LedgerFailure failure{.error = LedgerError::LedgerUnreachable,
                            .message = describe(body.error()),
                            .signature = std::string(signature)};
      log_failure("fate_query_failed", failure);
      return std::unexpected(std::move(failure));
    }
    auto reading = parse_reply<StatusReading>(*body, read_status);
    if (!reading)
    {
      LedgerFailure failure{.error = LedgerError::LedgerUnreachable,
                            .message = describe(reading.error()),
                            .signature = std::string(signature)};
      log_failure("fate_query_failed", failure);
      return std::unexpected(std::move(failure));
    }

    auto fate = TransactionFate::Pending;
    if (reading->present)
    {
      if (reading->failed)
      {
        fate = TransactionFate::Failed;
      }
      else if (meets_commitment(reading->confirmation))
      {
        fate = TransactionFate::Confirmed;
      }
    }
    else if (height && *height > *last_valid_block_height)
    {
      fate = TransactionFate::Expired;
    }

    logging::LogFields fields;
    fields.add_string("signature", std::string(signature));
    fields.add_string("fate", to_string(fate));
    if (height)
    {
      fields.add_uint("block_height", *height);
      fields.add_uint("last_valid_block_height", *last_valid_block_height);
    }
    logger_.log(logging::LogLevel::Debug, std::string(COMPONENT), "transaction_fate",
                std::move(fields));
    return fate;
  }

  std::expected<std::vector<LedgerMemo>, LedgerFailure> SolanaLedgerGateway::recent_memos(
      const Signer &account, std::size_t limit, std::chrono::milliseconds timeout)
  {
    const auto page = std::clamp<std::size_t>(limit, 1, MAX_SIGNATURE_PAGE);
    std::ostringstream params;
    params << "[\"" << account.address() << "\",{\"limit\":" << page << ",\"commitment\":\""
           << options_.commitment << "\"}]";

    auto body = call("getSignaturesForAddress", params.str(), timeout);
    if (!body)
    {
      LedgerFailure failure{.error = LedgerError::LedgerUnreachable,
                            .message = describe(body.error()),
                            .signature = std::nullopt};
      log_failure("history_query_failed", failure);
      return std::unexpected(std::move(failure));
    }

    auto memos = parse_reply<std::vector<LedgerMemo>>(*body, read_memos);
    if (!memos)
    {
      LedgerFailure failure{.error = LedgerError::LedgerUnreachable,
                            .message = describe(memos.error()),
                            .signature = std::nullopt};
      log_failure("history_query_failed", failure);
      return std::unexpected(std::move(failure));
    }
    return std::move(*memos);
  }

  std::string SolanaLedgerGateway::transaction_url(std::string_view signature) const
  {
    return explorer_url(options_.explorer_base, options_.cluster, signature);
  }

  void SolanaLedgerGateway::log_failure(std::string_view message, const LedgerFailure &failure)
  {
    logging::LogFields fields;
    fields.add_string("error", to_string(failure.error));
    fields.add_string("detail", failure.message);
    if (failure.signature)
    {
      fields.add_string("signature", *failure.signature);
    }
    logger_.log(logging::LogLevel::Warn, std::string(COMPONENT), std::string(message),
                std::move(fields));
  }

} // namespace beright::ledger
