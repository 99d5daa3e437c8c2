#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "beright/core/signer.hpp"
#include "beright/memo/memo_types.hpp"

namespace beright::ledger
{

  /** Lamports per SOL, the ledger's native unit. */
  inline constexpr std::uint64_t LAMPORTS_PER_SOL = 1'000'000'000;

  /** Point-in-time affordability of an account; never persisted. */
  struct WalletAffordability
  {
    std::uint64_t spendable_lamports;
    bool can_commit;
    std::uint64_t estimated_remaining_commitments;
  };

  /** Failure categories reported by the ledger boundary. */
  enum class LedgerError
  {
    LedgerUnreachable,
    InsufficientFunds,
    NetworkFailure,
    Rejected,
    Ambiguous,
    Internal
  };

  /** Categorized ledger failure with detail for the logs. */
  struct LedgerFailure
  {
    LedgerError error;
    std::string message;
    // Set when a transaction was signed before the failure, so an
    // Ambiguous outcome can be reconciled by signature.
    std::optional<std::string> signature;
    // Last block height at which that transaction can still be included.
    std::optional<std::uint64_t> last_valid_block_height;
  };

  /** What the ledger knows about one signed transaction. */
  enum class TransactionFate
  {
    // Landed without error at the configured commitment.
    Confirmed,
    // Landed, but the program returned an error.
    Failed,
    // Not settled yet, or not known to have expired.
    Pending,
    // Absent, and its blockhash is past its last valid height.
    Expired
  };

  /** Confirmed submission. */
  struct SubmitReceipt
  {
    std::string signature;
    std::string explorer_url;
  };

  /** A memo found on one of the account's recent transactions. */
  struct LedgerMemo
  {
    std::string signature;
    memo::Memo memo;
  };

  /**
   * Boundary to the external ledger. Implementations perform blocking I/O
   * and honor the caller-supplied timeout.
   */
  class LedgerGateway
  {
  public:
    virtual ~LedgerGateway() = default;

    /**
     * Query spendable balance and derive how many commitments it covers.
     * Fails only with LedgerUnreachable; zero affordability is a success.
     * @param account Account to query.
     * @param timeout Deadline for the query.
     * @return WalletAffordability or LedgerFailure.
     */
    [[nodiscard]] virtual std::expected<WalletAffordability, LedgerFailure> get_affordability(
        const Signer &account, std::chrono::milliseconds timeout) = 0;

    /**
     * Submit exactly one transaction carrying `memo`, signed by `account`.
     * Not idempotent: a timed-out call reports Ambiguous.
     * @param account Signing account.
     * @param memo Finalized memo payload.
     * @param timeout Deadline covering broadcast and confirmation.
     * @return SubmitReceipt or LedgerFailure.
     */
    [[nodiscard]] virtual std::expected<SubmitReceipt, LedgerFailure> submit(
        const Signer &account, const memo::Memo &memo, std::chrono::milliseconds timeout) = 0;

    /**
     * Submit one transaction carrying every memo in `memos`, in order, each as
     * its own memo instruction. Either all memos land or none do.
     * @param account Signing account.
     * @param memos Finalized memo payloads; at least one.
     * @param timeout Deadline covering broadcast and confirmation.
     * @return SubmitReceipt or LedgerFailure (Rejected when the transaction
     *         would exceed the ledger's size limit).
     */
    [[nodiscard]] virtual std::expected<SubmitReceipt, LedgerFailure> submit_batch(
        const Signer &account, std::span<const memo::Memo> memos,
        std::chrono::milliseconds timeout) = 0;

    /**
     * Look up a signed transaction by signature, searching full history.
     * Expired is only reported when `last_valid_block_height` is known and the
     * chain has moved past it without the signature appearing.
     * @param signature Base58 transaction signature.
     * @param last_valid_block_height Expiry height of the transaction's blockhash.
     * @param timeout Deadline for the query.
     * @return TransactionFate, or LedgerFailure (LedgerUnreachable).
     */
    [[nodiscard]] virtual std::expected<TransactionFate, LedgerFailure> transaction_fate(
        std::string_view signature, std::optional<std::uint64_t> last_valid_block_height,
        std::chrono::milliseconds timeout) = 0;

    /**
     * Memos attached to the account's most recent successful transactions,
     * newest first.
     * @param account Account whose history is scanned.
     * @param limit Maximum transactions to inspect.
     * @param timeout Deadline for the query.
     * @return Memos or LedgerFailure.
     */
    [[nodiscard]] virtual std::expected<std::vector<LedgerMemo>, LedgerFailure> recent_memos(
        const Signer &account, std::size_t limit, std::chrono::milliseconds timeout) = 0;

    /**
     * Human-viewable link for a transaction signature.
     * @param signature Transaction signature.
     * @return Explorer URL.
     */
    [[nodiscard]] virtual std::string transaction_url(std::string_view signature) const = 0;
  };

  /**
   * Convert LedgerError to a string literal.
   * @param error Error to stringify.
   * @return String literal describing the error.
   */
  [[nodiscard]] const char *to_string(LedgerError error);

  /**
   * Convert TransactionFate to a string literal.
   * @param fate Fate to stringify.
   * @return String literal describing the fate.
   */
  [[nodiscard]] const char *to_string(TransactionFate fate);

} // namespace beright::ledger
