#include "beright/scoring/brier.hpp"

#include <cmath>
#include <numeric>

#include "beright/memo/memo_fields.hpp"

namespace beright::scoring
{

  namespace
  {

    // One basis point, the resolution of scores on the wire.
    constexpr double SCORE_TOLERANCE = 1.0 / memo::BASIS_POINTS;

  } // namespace

  double brier_score(double probability, bool direction_occurred)
  {
    const double indicator = direction_occurred ? 1.0 : 0.0;
    const double diff = probability - indicator;
    return std::round(diff * diff * memo::BASIS_POINTS) / memo::BASIS_POINTS;
  }

  QualityBand interpret_brier_score(double score, const BandThresholds &thresholds)
  {
    if (score <= thresholds.excellent)
    {
      return QualityBand::Excellent;
    }
    if (score <= thresholds.good)
    {
      return QualityBand::Good;
    }
    if (score <= thresholds.fair)
    {
      return QualityBand::Fair;
    }
    if (score <= thresholds.poor)
    {
      return QualityBand::Poor;
    }
    return QualityBand::Bad;
  }

  bool is_valid(const BandThresholds &thresholds)
  {
    const double limits[] = {thresholds.excellent, thresholds.good, thresholds.fair,
                             thresholds.poor};
    double previous = 0.0;
    bool first = true;
    for (double limit : limits)
    {
      if (!std::isfinite(limit) || limit < 0.0 || limit > 1.0)
      {
        return false;
      }
      if (!first && limit <= previous)
      {
        return false;
      }
      previous = limit;
      first = false;
    }
    return true;
  }

  std::string_view to_string(QualityBand band)
  {
    switch (band)
    {
    case QualityBand::Excellent:
      return "excellent";
    case QualityBand::Good:
      return "good";
    case QualityBand::Fair:
      return "fair";
    case QualityBand::Poor:
      return "poor";
    case QualityBand::Bad:
      return "bad";
    }
    return "bad";
  }

  std::string_view describe(QualityBand band)
  {
    switch (band)
    {
    case QualityBand::Excellent:
      return "Superforecaster level";
    case QualityBand::Good:
      return "Well-calibrated";
    case QualityBand::Fair:
      return "Average forecaster";
    case QualityBand::Poor:
      return "Needs improvement";
    case QualityBand::Bad:
      return "Worse than random";
    }
    return "Worse than random";
  }

  std::optional<double> mean_brier_score(std::span<const double> scores)
  {
    if (scores.empty())
    {
      return std::nullopt;
    }
    const double sum = std::accumulate(scores.begin(), scores.end(), 0.0);
    return sum / static_cast<double>(scores.size());
  }

  std::expected<void, VerifyError> verify_resolution(const memo::PredictionCommitment &commitment,
                                                     const memo::ResolutionRecord &resolution)
  {
    if (commitment.market_ticker != resolution.market_ticker)
    {
      return std::unexpected(VerifyError::TickerMismatch);
    }
    const double expected = brier_score(commitment.probability, resolution.direction_occurred);
    if (std::abs(expected - resolution.brier_score) > SCORE_TOLERANCE + 1e-12)
    {
      return std::unexpected(VerifyError::ScoreMismatch);
    }
    return {};
  }

  const char *to_string(VerifyError error)
  {
    switch (error)
    {
    case VerifyError::TickerMismatch:
      return "resolution references a different market";
    case VerifyError::ScoreMismatch:
      return "brier score does not match the commitment";
    }
    return "unknown verification error";
  }

} // namespace beright::scoring
