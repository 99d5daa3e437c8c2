#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "beright/memo/memo_types.hpp"

namespace beright::memo
{

  /** Errors returned by the memo encoders. */
  enum class MemoError
  {
    InvalidCommitment,
    InvalidScore,
    UnencodableField,
    PayloadTooLarge
  };

  /**
   * Size budgets for memo payloads. The payload ceiling follows the target
   * ledger's memo limit; the per-field budgets keep one field from crowding
   * out the others.
   */
  struct MemoLimits
  {
    std::size_t max_payload_bytes = 500;
    std::size_t max_ticker_bytes = 128;
    std::size_t max_committer_ref_bytes = 44;
  };

  /**
   * Convert MemoError to a string literal.
   * @param error Error to stringify.
   * @return String literal describing the error.
   */
  [[nodiscard]] const char *to_string(MemoError error);

  /**
   * Quantize a probability or score to basis points (round half away from zero).
   * @param value Real value in [0, 1].
   * @return Basis points in [0, 10000].
   */
  [[nodiscard]] std::uint32_t to_basis_points(double value);
  /**
   * Convert basis points back to a real value.
   * @param bps Basis points.
   * @return bps / 10000.
   */
  [[nodiscard]] double from_basis_points(std::uint32_t bps);

  /**
   * Check a commitment against the record invariants and the field rules.
   * @param commitment Commitment to check.
   * @param limits Size budgets.
   * @return void or the first MemoError found.
   */
  [[nodiscard]] std::expected<void, MemoError> validate_commitment(
      const PredictionCommitment &commitment, const MemoLimits &limits = {});

  /**
   * Encode a PREDICT memo. Identical input always yields identical bytes.
   * @param commitment Commitment to encode.
   * @param limits Size budgets.
   * @return Memo or MemoError.
   */
  [[nodiscard]] std::expected<Memo, MemoError> encode_prediction(
      const PredictionCommitment &commitment, const MemoLimits &limits = {});

  /**
   * Encode a RESOLVE memo carrying the outcome and its score.
   * @param market_ticker Ticker of the resolved commitment.
   * @param direction_occurred True if the committed direction happened.
   * @param brier_score Score in [0, 1].
   * @param limits Size budgets.
   * @return Memo or MemoError.
   */
  [[nodiscard]] std::expected<Memo, MemoError> encode_resolution(
      std::string_view market_ticker,
      bool direction_occurred,
      double brier_score,
      const MemoLimits &limits = {});

  /**
   * Parse a memo. Never throws; anything that is not a well-formed memo of
   * this application (foreign notes included) yields std::nullopt.
   * @param memo Raw memo text.
   * @param limits Size budgets applied to the decoded fields.
   * @return ParsedRecord or std::nullopt.
   */
  [[nodiscard]] std::optional<ParsedRecord> decode(std::string_view memo,
                                                   const MemoLimits &limits = {});

  /**
   * Derive the short display reference for a committing account.
   * @param public_key Base58 account address.
   * @param length Characters to keep.
   * @return Truncated reference.
   */
  [[nodiscard]] std::string make_committer_ref(std::string_view public_key, std::size_t length);

} // namespace beright::memo
