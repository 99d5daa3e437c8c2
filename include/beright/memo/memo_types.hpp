#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace beright::memo
{

  /** Market ticker identifier (e.g., KXBTC-26DEC31-T100K). */
  using MarketTicker = std::string;
  /** Finalized memo payload as attached to a ledger transaction. */
  using Memo = std::string;

  /** Side of a binary market a forecaster backs. */
  enum class Direction
  {
    Yes,
    No
  };

  /**
   * A forecaster's stated confidence that `direction` will be the resolved
   * outcome. The probability is always relative to the chosen direction.
   */
  struct PredictionCommitment
  {
    MarketTicker market_ticker;
    double probability;
    Direction direction;
    std::string committer_ref;

    friend bool operator==(const PredictionCommitment &, const PredictionCommitment &) = default;
  };

  /**
   * Outcome of a committed forecast. direction_occurred is true when the
   * committed direction is the one that happened (not "did YES happen").
   */
  struct ResolutionRecord
  {
    MarketTicker market_ticker;
    bool direction_occurred;
    double brier_score;

    friend bool operator==(const ResolutionRecord &, const ResolutionRecord &) = default;
  };

  /** Memo kinds carried after the tag and version. */
  enum class MemoKind
  {
    Predict,
    Resolve
  };

  /** Decoded memo, discriminated by kind. */
  using ParsedRecord = std::variant<PredictionCommitment, ResolutionRecord>;

  /**
   * Kind of a decoded record.
   * @param record Decoded record.
   * @return MemoKind::Predict or MemoKind::Resolve.
   */
  [[nodiscard]] inline MemoKind kind_of(const ParsedRecord &record)
  {
    return std::holds_alternative<PredictionCommitment>(record) ? MemoKind::Predict
                                                                 : MemoKind::Resolve;
  }

  /**
   * Wire token for a direction ("YES" / "NO").
   * @param direction Direction to stringify.
   * @return Uppercase token.
   */
  [[nodiscard]] std::string_view to_string(Direction direction);
  /**
   * Parse a direction token. Accepts the wire tokens and their lowercase forms.
   * @param text Input token.
   * @return Direction or std::nullopt.
   */
  [[nodiscard]] std::optional<Direction> parse_direction(std::string_view text);
  /**
   * Wire token for a memo kind ("PREDICT" / "RESOLVE").
   * @param kind Kind to stringify.
   * @return Uppercase token.
   */
  [[nodiscard]] std::string_view to_string(MemoKind kind);

} // namespace beright::memo
