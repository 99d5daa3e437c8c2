#include "beright/ledger/affordability.hpp"

namespace beright::ledger
{

WalletAffordability compute_affordability(std::uint64_t balance_lamports, const CostModel& cost)
{
  const auto per_commitment = cost.per_commitment_lamports();
  std::uint64_t remaining = 0;
  if (per_commitment > 0 && balance_lamports > cost.reserve_lamports)
  {
    remaining = (balance_lamports - cost.reserve_lamports) / per_commitment;
  }
  return WalletAffordability{.spendable_lamports = balance_lamports,
                             .can_commit = remaining >= 1,
                             .estimated_remaining_commitments = remaining};
}

std::optional<WalletAffordability> AffordabilityCache::get(Clock::time_point now) const
{
  if (!entry_ || max_age_.count() <= 0)
  {
    return std::nullopt;
  }
  if (now - entry_->fetched_at >= max_age_)
  {
    return std::nullopt;
  }
  return entry_->snapshot;
}

void AffordabilityCache::store(WalletAffordability snapshot, Clock::time_point fetched_at)
{
  if (max_age_.count() <= 0)
  {
    return;
  }
  entry_ = Entry{.snapshot = snapshot, .fetched_at = fetched_at};
}

const char* to_string(LedgerError error)
{
  switch (error)
  {
  case LedgerError::LedgerUnreachable:
    return "ledger unreachable";
  case LedgerError::InsufficientFunds:
    return "insufficient funds";
  case LedgerError::NetworkFailure:
    return "network failure";
  case LedgerError::Rejected:
    return "transaction rejected";
  case LedgerError::Ambiguous:
    return "outcome unknown";
  case LedgerError::Internal:
    return "internal ledger error";
  }
  return "unknown ledger error";
}

const char* to_string(TransactionFate fate)
{
  switch (fate)
  {
  case TransactionFate::Confirmed:
    return "confirmed";
  case TransactionFate::Failed:
    return "failed";
  case TransactionFate::Pending:
    return "pending";
  case TransactionFate::Expired:
    return "expired";
  }
  return "unknown";
}

} // namespace beright::ledger
