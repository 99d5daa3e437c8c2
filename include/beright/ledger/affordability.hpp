#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "beright/ledger/ledger_gateway.hpp"

namespace beright::ledger
{

  /**
   * Conversion constants for affordability. Configuration inputs, not owned
   * by the ledger.
   */
  struct CostModel
  {
    // Balance that must stay untouched (rent-exempt floor for a system account).
    std::uint64_t reserve_lamports = 890'880;
    // Signature fee of one memo transaction.
    std::uint64_t fee_lamports = 5'000;
    // Fixed surcharge per memo (priority fee budget).
    std::uint64_t memo_surcharge_lamports = 0;

    [[nodiscard]] std::uint64_t per_commitment_lamports() const
    {
      return fee_lamports + memo_surcharge_lamports;
    }
  };

  /**
   * Derive affordability from a balance.
   * @param balance_lamports Spendable balance reported by the ledger.
   * @param cost Cost model; per-commitment cost must be non-zero.
   * @return WalletAffordability with can_commit == (estimate >= 1).
   */
  [[nodiscard]] WalletAffordability compute_affordability(std::uint64_t balance_lamports,
                                                          const CostModel &cost);

  /**
   * Time-stamped affordability snapshot. Owned by its user, never shared;
   * must be invalidated after every submission that may have spent funds.
   */
  class AffordabilityCache
  {
  public:
    using Clock = std::chrono::steady_clock;

    /**
     * Construct with a maximum snapshot age (zero disables caching).
     * @param max_age Maximum age of a usable snapshot.
     */
    explicit AffordabilityCache(std::chrono::milliseconds max_age) : max_age_(max_age) {}

    /**
     * Return the snapshot if it is younger than max_age at `now`.
     * @param now Current time.
     * @return Snapshot or std::nullopt.
     */
    [[nodiscard]] std::optional<WalletAffordability> get(Clock::time_point now) const;

    /**
     * Store a fresh snapshot.
     * @param snapshot Affordability read from the ledger.
     * @param fetched_at Time of the read.
     */
    void store(WalletAffordability snapshot, Clock::time_point fetched_at);

    /** Drop the snapshot. */
    void invalidate() { entry_.reset(); }

  private:
    struct Entry
    {
      WalletAffordability snapshot;
      Clock::time_point fetched_at;
    };

    std::chrono::milliseconds max_age_;
    std::optional<Entry> entry_;
  };

} // namespace beright::ledger
