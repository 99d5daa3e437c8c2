#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace beright::memo
{

  inline constexpr char DELIMITER = '|';

  inline constexpr std::string_view TAG = "BERIGHT";
  inline constexpr std::string_view VERSION = "1";

  inline constexpr std::string_view KIND_PREDICT = "PREDICT";
  inline constexpr std::string_view KIND_RESOLVE = "RESOLVE";

  inline constexpr std::string_view DIRECTION_YES = "YES";
  inline constexpr std::string_view DIRECTION_NO = "NO";

  inline constexpr std::string_view OUTCOME_OCCURRED = "OCCURRED";
  inline constexpr std::string_view OUTCOME_DID_NOT_OCCUR = "DID_NOT_OCCUR";

  // tag|version|PREDICT|ticker|bps|direction|committer_ref
  inline constexpr std::size_t PREDICT_FIELD_COUNT = 7;
  // tag|version|RESOLVE|ticker|outcome|bps
  inline constexpr std::size_t RESOLVE_FIELD_COUNT = 6;

  /** Fixed-point scale: probabilities and scores travel as basis points. */
  inline constexpr std::uint32_t BASIS_POINTS = 10000;
  inline constexpr std::uint32_t PROBABILITY_BPS_MIN = 1;
  inline constexpr std::uint32_t PROBABILITY_BPS_MAX = 9999;
  inline constexpr std::uint32_t SCORE_BPS_MAX = 10000;

} // namespace beright::memo
