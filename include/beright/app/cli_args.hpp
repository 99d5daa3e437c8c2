#pragma once

#include "beright/memo/memo_types.hpp"

#include <expected>
#include <string_view>

namespace beright::app
{

/**
 * Reasons a positional CLI argument is refused.
 */
enum class ArgError
{
  NotANumber,
  OutOfRange,
  UnknownOutcome,
  UnknownDirection
};

/**
 * Convert ArgError to a string literal.
 * @param error Error to stringify.
 * @return String literal describing the error.
 */
[[nodiscard]] const char* to_string(ArgError error);

/**
 * Parse a stated probability. Only values strictly inside (0, 1) are
 * accepted, the range every commitment and score is defined on.
 * @param text Decimal text, e.g. "0.72".
 * @return Probability or ArgError.
 */
[[nodiscard]] std::expected<double, ArgError> parse_probability(std::string_view text);

/**
 * Parse OCCURRED / DID_NOT_OCCUR.
 * @param text Outcome token.
 * @return True when the committed direction occurred, or ArgError.
 */
[[nodiscard]] std::expected<bool, ArgError> parse_outcome(std::string_view text);

/**
 * Parse YES / NO.
 * @param text Direction token.
 * @return Direction or ArgError.
 */
[[nodiscard]] std::expected<beright::memo::Direction, ArgError> parse_direction(
    std::string_view text);

} // namespace beright::app
