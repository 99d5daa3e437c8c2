#include "beright/app/cli_args.hpp"

#include "beright/memo/memo_fields.hpp"

#include <charconv>
#include <cmath>

namespace beright::app
{

const char* to_string(ArgError error)
{
  switch (error)
  {
  case ArgError::NotANumber:
    return "not a number";
  case ArgError::OutOfRange:
    return "probability must lie strictly between 0 and 1";
  case ArgError::UnknownOutcome:
    return "outcome must be OCCURRED or DID_NOT_OCCUR";
  case ArgError::UnknownDirection:
    return "direction must be YES or NO";
  }
  return "unknown";
}

std::expected<double, ArgError> parse_probability(std::string_view text)
{
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
  {
    return std::unexpected(ArgError::NotANumber);
  }
  if (!std::isfinite(value) || value <= 0.0 || value >= 1.0)
  {
    return std::unexpected(ArgError::OutOfRange);
  }
  return value;
}

std::expected<bool, ArgError> parse_outcome(std::string_view text)
{
  if (text == beright::memo::OUTCOME_OCCURRED)
  {
    return true;
  }
  if (text == beright::memo::OUTCOME_DID_NOT_OCCUR)
  {
    return false;
  }
  return std::unexpected(ArgError::UnknownOutcome);
}

std::expected<beright::memo::Direction, ArgError> parse_direction(std::string_view text)
{
  auto direction = beright::memo::parse_direction(text);
  if (!direction)
  {
    return std::unexpected(ArgError::UnknownDirection);
  }
  return *direction;
}

} // namespace beright::app
