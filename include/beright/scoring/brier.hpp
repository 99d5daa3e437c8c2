#pragma once

#include <expected>
#include <optional>
#include <span>
#include <string_view>

#include "beright/memo/memo_types.hpp"

namespace beright::scoring
{

  /** Qualitative calibration bands, best first. */
  enum class QualityBand
  {
    Excellent,
    Good,
    Fair,
    Poor,
    Bad
  };

  /**
   * Upper-inclusive score limits for the first four bands; anything above
   * `poor` is Bad. Must be strictly ascending.
   */
  struct BandThresholds
  {
    double excellent = 0.10;
    double good = 0.20;
    double fair = 0.30;
    double poor = 0.40;
  };

  /** Disagreement between a RESOLVE record and the commitment it scores. */
  enum class VerifyError
  {
    TickerMismatch,
    ScoreMismatch
  };

  /**
   * Brier score of a direction-relative forecast, rounded to basis points.
   * @param probability Confidence in the committed direction, in (0, 1).
   * @param direction_occurred True if the committed direction happened.
   * @return (probability - indicator)^2 in [0, 1]; 0 is a perfect forecast.
   */
  [[nodiscard]] double brier_score(double probability, bool direction_occurred);

  /**
   * Map a score to its quality band.
   * @param score Brier score in [0, 1].
   * @param thresholds Band limits.
   * @return QualityBand.
   */
  [[nodiscard]] QualityBand interpret_brier_score(double score,
                                                  const BandThresholds &thresholds = {});

  /**
   * True when the thresholds are finite, inside [0, 1] and strictly ascending.
   * @param thresholds Band limits to check.
   * @return Validity.
   */
  [[nodiscard]] bool is_valid(const BandThresholds &thresholds);

  /**
   * Lowercase band name ("excellent" ... "bad").
   * @param band Band to stringify.
   * @return Band name.
   */
  [[nodiscard]] std::string_view to_string(QualityBand band);
  /**
   * Human-readable description of a band.
   * @param band Band to describe.
   * @return Description.
   */
  [[nodiscard]] std::string_view describe(QualityBand band);

  /**
   * Mean of several scores.
   * @param scores Scores to average.
   * @return Mean, or std::nullopt when empty.
   */
  [[nodiscard]] std::optional<double> mean_brier_score(std::span<const double> scores);

  /**
   * Check that a resolution carries the score its commitment implies.
   * @param commitment Original PREDICT record.
   * @param resolution RESOLVE record for the same market.
   * @return void or VerifyError.
   */
  [[nodiscard]] std::expected<void, VerifyError> verify_resolution(
      const memo::PredictionCommitment &commitment, const memo::ResolutionRecord &resolution);

  [[nodiscard]] const char *to_string(VerifyError error);

} // namespace beright::scoring
