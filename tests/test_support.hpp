#pragma once

#include <cstdint>
#include <chrono>
#include <deque>
#include <expected>
#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "beright/core/signer.hpp"
#include "beright/ledger/ledger_gateway.hpp"
#include "beright/ledger/rpc_transport.hpp"
#include "beright/logging/logger.hpp"

namespace beright::test
{

  // RFC 8032 section 7.1, test 1.
  inline constexpr std::string_view RFC8032_SEED =
      "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
  inline constexpr std::string_view RFC8032_PUBLIC =
      "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";

  inline std::vector<std::uint8_t> from_hex(std::string_view hex)
  {
    auto nibble = [](char c) -> std::uint8_t
    {
      if (c >= '0' && c <= '9')
      {
        return static_cast<std::uint8_t>(c - '0');
      }
      return static_cast<std::uint8_t>(c - 'a' + 10);
    };
    std::vector<std::uint8_t> out;
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2)
    {
      out.push_back(static_cast<std::uint8_t>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
    }
    return out;
  }

  inline Signer make_test_signer()
  {
    const auto seed = from_hex(RFC8032_SEED);
    auto signer = Signer::from_secret(seed);
    if (!signer)
    {
      throw std::runtime_error("test signer construction failed");
    }
    return std::move(*signer);
  }

  /** Logger that keeps every event for inspection. */
  class RecordingLogger : public logging::Logger
  {
  public:
    using Logger::log;

    void log(logging::LogEvent event) override { events.push_back(std::move(event)); }
    [[nodiscard]] logging::LogLevel level() const override { return logging::LogLevel::Trace; }

    [[nodiscard]] bool contains(std::string_view message) const
    {
      for (const auto &event : events)
      {
        if (event.message == message)
        {
          return true;
        }
      }
      return false;
    }

    // String field `key` of the first event named `message`.
    [[nodiscard]] std::optional<std::string> string_field(std::string_view message,
                                                          std::string_view key) const
    {
      for (const auto &event : events)
      {
        if (event.message != message)
        {
          continue;
        }
        for (const auto &field : event.fields.entries())
        {
          if (field.key == key)
          {
            if (const auto *text = std::get_if<std::string>(&field.value))
            {
              return *text;
            }
          }
        }
      }
      return std::nullopt;
    }

    std::vector<logging::LogEvent> events;
  };

  /** JSON-RPC transport answering from per-method scripts. */
  class ScriptedTransport : public ledger::RpcTransport
  {
  public:
    using Reply = std::expected<std::string, ledger::RpcFailure>;

    void script(std::string method, Reply reply)
    {
      replies_[std::move(method)].push_back(std::move(reply));
    }

    // Answer every call of `method` with `reply` once its script runs out.
    void always(std::string method, Reply reply)
    {
      fallback_.insert_or_assign(std::move(method), std::move(reply));
    }

    [[nodiscard]] Reply post(std::string_view body, std::chrono::milliseconds) override
    {
      const auto method = method_of(body);
      calls.push_back(method);
      bodies.emplace_back(body);

      auto queued = replies_.find(method);
      if (queued != replies_.end() && !queued->second.empty())
      {
        auto reply = std::move(queued->second.front());
        queued->second.pop_front();
        return reply;
      }
      auto fallback = fallback_.find(method);
      if (fallback != fallback_.end())
      {
        return fallback->second;
      }
      return std::unexpected(ledger::RpcFailure{.error = ledger::RpcError::ConnectFailed,
                                                .detail = "unscripted " + method,
                                                .request_sent = false,
                                                .http_status = 0});
    }

    [[nodiscard]] std::size_t count(std::string_view method) const
    {
      std::size_t n = 0;
      for (const auto &call : calls)
      {
        if (call == method)
        {
          ++n;
        }
      }
      return n;
    }

    std::vector<std::string> calls;
    std::vector<std::string> bodies;

  private:
    static std::string method_of(std::string_view body)
    {
      constexpr std::string_view KEY = "\"method\":\"";
      auto start = body.find(KEY);
      if (start == std::string_view::npos)
      {
        return {};
      }
      start += KEY.size();
      auto end = body.find('"', start);
      return std::string(body.substr(start, end - start));
    }

    std::map<std::string, std::deque<Reply>> replies_;
    std::map<std::string, Reply> fallback_;
  };

  inline std::string rpc_result(std::string_view result)
  {
    return std::string(R"({"jsonrpc":"2.0","id":1,"result":)") + std::string(result) + "}";
  }

  inline std::string rpc_error(std::int64_t code, std::string_view message)
  {
    return std::string(R"({"jsonrpc":"2.0","id":1,"error":{"code":)") + std::to_string(code) +
           R"(,"message":")" + std::string(message) + "\"}}";
  }

  /** LedgerGateway with scripted outcomes and call counters. */
  class FakeGateway : public ledger::LedgerGateway
  {
  public:
    using Affordability = std::expected<ledger::WalletAffordability, ledger::LedgerFailure>;
    using Submit = std::expected<ledger::SubmitReceipt, ledger::LedgerFailure>;
    using History = std::expected<std::vector<ledger::LedgerMemo>, ledger::LedgerFailure>;
    using Fate = std::expected<ledger::TransactionFate, ledger::LedgerFailure>;

    [[nodiscard]] Affordability get_affordability(const Signer &,
                                                  std::chrono::milliseconds) override
    {
      ++affordability_calls;
      if (affordability.empty())
      {
        return ledger::WalletAffordability{.spendable_lamports = 1'000'000'000,
                                           .can_commit = true,
                                           .estimated_remaining_commitments = 199'821};
      }
      auto next = std::move(affordability.front());
      affordability.pop_front();
      return next;
    }

    [[nodiscard]] Submit submit(const Signer &, const memo::Memo &memo,
                                std::chrono::milliseconds) override
    {
      submitted.push_back(memo);
      return next_submit();
    }

    [[nodiscard]] Submit submit_batch(const Signer &, std::span<const memo::Memo> memos,
                                      std::chrono::milliseconds) override
    {
      batches.emplace_back(memos.begin(), memos.end());
      return next_submit();
    }

    // Unscripted lookups report Pending: nothing known either way.
    [[nodiscard]] Fate transaction_fate(std::string_view signature,
                                        std::optional<std::uint64_t> last_valid_block_height,
                                        std::chrono::milliseconds) override
    {
      fate_queries.emplace_back(std::string(signature), last_valid_block_height);
      if (fates.empty())
      {
        return ledger::TransactionFate::Pending;
      }
      auto next = std::move(fates.front());
      fates.pop_front();
      return next;
    }

    [[nodiscard]] History recent_memos(const Signer &, std::size_t,
                                       std::chrono::milliseconds) override
    {
      ++history_calls;
      return history;
    }

    [[nodiscard]] std::string transaction_url(std::string_view signature) const override
    {
      return "https://explorer.test/tx/" + std::string(signature);
    }

    std::deque<Affordability> affordability;
    std::deque<Submit> submits;
    std::deque<Fate> fates;
    History history = std::vector<ledger::LedgerMemo>{};
    int affordability_calls = 0;
    int submit_calls = 0;
    int history_calls = 0;
    std::vector<memo::Memo> submitted;
    std::vector<std::vector<memo::Memo>> batches;
    std::vector<std::pair<std::string, std::optional<std::uint64_t>>> fate_queries;

  private:
    Submit next_submit()
    {
      ++submit_calls;
      if (submits.empty())
      {
        const auto signature = "sig" + std::to_string(submit_calls);
        return ledger::SubmitReceipt{.signature = signature,
                                     .explorer_url = transaction_url(signature)};
      }
      auto next = std::move(submits.front());
      submits.pop_front();
      return next;
    }
  };

  inline ledger::WalletAffordability broke()
  {
    return ledger::WalletAffordability{.spendable_lamports = 890'880,
                                       .can_commit = false,
                                       .estimated_remaining_commitments = 0};
  }

  inline ledger::LedgerFailure ledger_failure(
      ledger::LedgerError error, std::optional<std::string> signature = std::nullopt,
      std::optional<std::uint64_t> last_valid_block_height = std::nullopt)
  {
    return ledger::LedgerFailure{.error = error,
                                 .message = "scripted failure",
                                 .signature = std::move(signature),
                                 .last_valid_block_height = last_valid_block_height};
  }

} // namespace beright::test
