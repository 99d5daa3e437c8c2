#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "beright/ledger/affordability.hpp"
#include "beright/ledger/ledger_gateway.hpp"
#include "beright/ledger/rpc_transport.hpp"
#include "beright/ledger/transaction.hpp"
#include "beright/logging/logger.hpp"

namespace beright::ledger
{

  /** Runtime options for SolanaLedgerGateway. */
  struct SolanaGatewayOptions
  {
    CostModel cost;
    std::string cluster = "mainnet-beta";
    std::string explorer_base = "https://solscan.io";
    std::string commitment = "confirmed";
    std::chrono::milliseconds confirm_poll_interval{500};
  };

  /** A blockhash and the last block height a transaction using it can land at. */
  struct RecentBlockhash
  {
    Blockhash hash;
    std::optional<std::uint64_t> last_valid_block_height;
  };

  /**
   * Build the explorer link for a transaction.
   * @param explorer_base Explorer root (no trailing slash).
   * @param cluster Cluster name; mainnet-beta adds no query.
   * @param signature Base58 transaction signature.
   * @return URL string.
   */
  [[nodiscard]] std::string explorer_url(std::string_view explorer_base,
                                         std::string_view cluster,
                                         std::string_view signature);

  /**
   * Strip the "[len] " prefix the RPC puts in front of memo text.
   * @param rpc_memo Memo field from getSignaturesForAddress.
   * @return Memo payload.
   */
  [[nodiscard]] std::string strip_memo_prefix(std::string_view rpc_memo);

  /** LedgerGateway over Solana JSON-RPC and the SPL Memo program. */
  class SolanaLedgerGateway : public LedgerGateway
  {
  public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * Construct with a transport and logger.
     * @param transport JSON-RPC transport.
     * @param logger Logger for diagnostics.
     * @param options Gateway options.
     * @param sleeper Wait between confirmation polls.
     */
    SolanaLedgerGateway(RpcTransport &transport,
                        logging::Logger &logger,
                        SolanaGatewayOptions options,
                        Sleeper sleeper = {});

    [[nodiscard]] std::expected<WalletAffordability, LedgerFailure> get_affordability(
        const Signer &account, std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::expected<SubmitReceipt, LedgerFailure> submit(
        const Signer &account, const memo::Memo &memo, std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::expected<SubmitReceipt, LedgerFailure> submit_batch(
        const Signer &account, std::span<const memo::Memo> memos,
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::expected<TransactionFate, LedgerFailure> transaction_fate(
        std::string_view signature, std::optional<std::uint64_t> last_valid_block_height,
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::expected<std::vector<LedgerMemo>, LedgerFailure> recent_memos(
        const Signer &account, std::size_t limit, std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::string transaction_url(std::string_view signature) const override;

  private:
    enum class StatusPoll
    {
      Pending,
      Confirmed,
      Failed
    };

    [[nodiscard]] std::expected<std::string, RpcFailure> call(std::string_view method,
                                                              std::string_view params,
                                                              std::chrono::milliseconds timeout);

    [[nodiscard]] std::expected<SubmitReceipt, LedgerFailure> submit_memos(
        const Signer &account, std::span<const memo::Memo> memos,
        std::chrono::milliseconds timeout);
    [[nodiscard]] std::expected<RecentBlockhash, LedgerFailure> latest_blockhash(
        std::chrono::milliseconds timeout);
    [[nodiscard]] std::expected<std::uint64_t, LedgerFailure> block_height(
        std::chrono::milliseconds timeout);
    [[nodiscard]] std::expected<std::string, LedgerFailure> send_transaction(
        const std::string &wire_base64, const std::string &signature,
        std::chrono::milliseconds timeout);
    [[nodiscard]] std::expected<SubmitReceipt, LedgerFailure> await_confirmation(
        const std::string &signature, std::chrono::steady_clock::time_point deadline);
    [[nodiscard]] StatusPoll poll_status(const std::string &signature,
                                         std::chrono::milliseconds timeout,
                                         std::string &detail);
    // True when `confirmation` is at least the configured commitment level.
    [[nodiscard]] bool meets_commitment(std::string_view confirmation) const;

    void log_failure(std::string_view message, const LedgerFailure &failure);

    RpcTransport &transport_;
    logging::Logger &logger_;
    SolanaGatewayOptions options_;
    Sleeper sleeper_;
    std::uint64_t next_id_ = 1;
  };

} // namespace beright::ledger
