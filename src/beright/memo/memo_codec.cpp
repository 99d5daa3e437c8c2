#include "beright/memo/memo_codec.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <system_error>

#include "beright/memo/memo_fields.hpp"

namespace beright::memo
{

  namespace
  {

    // Large enough to notice one field too many without allocating.
    using FieldList = std::array<std::string_view, PREDICT_FIELD_COUNT + 1>;

    std::size_t split_fields(std::string_view memo, FieldList &fields)
    {
      std::size_t count = 0;
      std::size_t start = 0;
      while (count < fields.size())
      {
        auto pos = memo.find(DELIMITER, start);
        if (pos == std::string_view::npos)
        {
          fields[count++] = memo.substr(start);
          return count;
        }
        fields[count++] = memo.substr(start, pos - start);
        start = pos + 1;
      }
      return count + 1;
    }

    // Printable ASCII without space or the delimiter.
    bool is_field_char(char c)
    {
      return c > 0x20 && c < 0x7F && c != DELIMITER;
    }

    bool is_encodable_field(std::string_view field)
    {
      if (field.empty())
      {
        return false;
      }
      for (char c : field)
      {
        if (!is_field_char(c))
        {
          return false;
        }
      }
      return true;
    }

    // Canonical unsigned decimal: digits only, no sign, no leading zero.
    std::optional<std::uint32_t> parse_basis_points(std::string_view text)
    {
      if (text.empty() || text.size() > 5)
      {
        return std::nullopt;
      }
      if (text.size() > 1 && text.front() == '0')
      {
        return std::nullopt;
      }
      std::uint32_t value = 0;
      auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
      if (ec != std::errc{} || ptr != text.data() + text.size())
      {
        return std::nullopt;
      }
      return value;
    }

    bool is_valid_direction(Direction direction)
    {
      return direction == Direction::Yes || direction == Direction::No;
    }

    void append_field(std::string &out, std::string_view field)
    {
      out += DELIMITER;
      out += field;
    }

    std::string header(std::string_view kind)
    {
      std::string out(TAG);
      append_field(out, VERSION);
      append_field(out, kind);
      return out;
    }

    std::expected<Memo, MemoError> build_prediction(const PredictionCommitment &commitment,
                                                    const MemoLimits &limits)
    {
      const double p = commitment.probability;
      if (!std::isfinite(p) || p <= 0.0 || p >= 1.0 || !is_valid_direction(commitment.direction) ||
          commitment.market_ticker.empty() || commitment.committer_ref.empty())
      {
        return std::unexpected(MemoError::InvalidCommitment);
      }

      const auto bps = to_basis_points(p);
      if (bps < PROBABILITY_BPS_MIN || bps > PROBABILITY_BPS_MAX)
      {
        return std::unexpected(MemoError::InvalidCommitment);
      }

      if (!is_encodable_field(commitment.market_ticker) ||
          !is_encodable_field(commitment.committer_ref))
      {
        return std::unexpected(MemoError::UnencodableField);
      }

      Memo memo = header(KIND_PREDICT);
      append_field(memo, commitment.market_ticker);
      append_field(memo, std::to_string(bps));
      append_field(memo, to_string(commitment.direction));
      append_field(memo, commitment.committer_ref);

      if (memo.size() > limits.max_payload_bytes)
      {
        return std::unexpected(MemoError::PayloadTooLarge);
      }
      if (commitment.market_ticker.size() > limits.max_ticker_bytes ||
          commitment.committer_ref.size() > limits.max_committer_ref_bytes)
      {
        return std::unexpected(MemoError::UnencodableField);
      }
      return memo;
    }

    std::optional<ParsedRecord> decode_prediction(const FieldList &fields, const MemoLimits &limits)
    {
      const auto ticker = fields[3];
      const auto committer = fields[6];
      if (!is_encodable_field(ticker) || ticker.size() > limits.max_ticker_bytes)
      {
        return std::nullopt;
      }
      if (!is_encodable_field(committer) || committer.size() > limits.max_committer_ref_bytes)
      {
        return std::nullopt;
      }

      auto bps = parse_basis_points(fields[4]);
      if (!bps || *bps < PROBABILITY_BPS_MIN || *bps > PROBABILITY_BPS_MAX)
      {
        return std::nullopt;
      }

      Direction direction;
      if (fields[5] == DIRECTION_YES)
      {
        direction = Direction::Yes;
      }
      else if (fields[5] == DIRECTION_NO)
      {
        direction = Direction::No;
      }
      else
      {
        return std::nullopt;
      }

      return PredictionCommitment{.market_ticker = std::string(ticker),
                                  .probability = from_basis_points(*bps),
                                  .direction = direction,
                                  .committer_ref = std::string(committer)};
    }

    std::optional<ParsedRecord> decode_resolution(const FieldList &fields, const MemoLimits &limits)
    {
      const auto ticker = fields[3];
      if (!is_encodable_field(ticker) || ticker.size() > limits.max_ticker_bytes)
      {
        return std::nullopt;
      }

      bool occurred;
      if (fields[4] == OUTCOME_OCCURRED)
      {
        occurred = true;
      }
      else if (fields[4] == OUTCOME_DID_NOT_OCCUR)
      {
        occurred = false;
      }
      else
      {
        return std::nullopt;
      }

      auto bps = parse_basis_points(fields[5]);
      if (!bps || *bps > SCORE_BPS_MAX)
      {
        return std::nullopt;
      }

      return ResolutionRecord{.market_ticker = std::string(ticker),
                              .direction_occurred = occurred,
                              .brier_score = from_basis_points(*bps)};
    }

  } // namespace

  std::string_view to_string(Direction direction)
  {
    return direction == Direction::Yes ? DIRECTION_YES : DIRECTION_NO;
  }

  std::optional<Direction> parse_direction(std::string_view text)
  {
    if (text == DIRECTION_YES || text == "yes")
    {
      return Direction::Yes;
    }
    if (text == DIRECTION_NO || text == "no")
    {
      return Direction::No;
    }
    return std::nullopt;
  }

  std::string_view to_string(MemoKind kind)
  {
    return kind == MemoKind::Predict ? KIND_PREDICT : KIND_RESOLVE;
  }

  const char *to_string(MemoError error)
  {
    switch (error)
    {
    case MemoError::InvalidCommitment:
      return "invalid commitment";
    case MemoError::InvalidScore:
      return "invalid score";
    case MemoError::UnencodableField:
      return "unencodable field";
    case MemoError::PayloadTooLarge:
      return "payload too large";
    }
    return "unknown memo error";
  }

  std::uint32_t to_basis_points(double value)
  {
    return static_cast<std::uint32_t>(std::lround(value * BASIS_POINTS));
  }

  double from_basis_points(std::uint32_t bps)
  {
    return static_cast<double>(bps) / BASIS_POINTS;
  }

  std::expected<void, MemoError> validate_commitment(const PredictionCommitment &commitment,
                                                     const MemoLimits &limits)
  {
    auto built = build_prediction(commitment, limits);
    if (!built)
    {
      return std::unexpected(built.error());
    }
    return {};
  }

  std::expected<Memo, MemoError> encode_prediction(const PredictionCommitment &commitment,
                                                   const MemoLimits &limits)
  {
    return build_prediction(commitment, limits);
  }

  std::expected<Memo, MemoError> encode_resolution(std::string_view market_ticker,
                                                   bool direction_occurred,
                                                   double brier_score,
                                                   const MemoLimits &limits)
  {
    if (!std::isfinite(brier_score) || brier_score < 0.0 || brier_score > 1.0)
    {
      return std::unexpected(MemoError::InvalidScore);
    }
    if (!is_encodable_field(market_ticker))
    {
      return std::unexpected(MemoError::UnencodableField);
    }

    Memo memo = header(KIND_RESOLVE);
    append_field(memo, market_ticker);
    append_field(memo, direction_occurred ? OUTCOME_OCCURRED : OUTCOME_DID_NOT_OCCUR);
    append_field(memo, std::to_string(to_basis_points(brier_score)));

    if (memo.size() > limits.max_payload_bytes)
    {
      return std::unexpected(MemoError::PayloadTooLarge);
    }
    if (market_ticker.size() > limits.max_ticker_bytes)
    {
      return std::unexpected(MemoError::UnencodableField);
    }
    return memo;
  }

  std::optional<ParsedRecord> decode(std::string_view memo, const MemoLimits &limits)
  {
    if (memo.empty() || memo.size() > limits.max_payload_bytes)
    {
      return std::nullopt;
    }

    FieldList fields;
    const auto count = split_fields(memo, fields);
    if (count < RESOLVE_FIELD_COUNT || fields[0] != TAG || fields[1] != VERSION)
    {
      return std::nullopt;
    }

    if (fields[2] == KIND_PREDICT && count == PREDICT_FIELD_COUNT)
    {
      return decode_prediction(fields, limits);
    }
    if (fields[2] == KIND_RESOLVE && count == RESOLVE_FIELD_COUNT)
    {
      return decode_resolution(fields, limits);
    }
    return std::nullopt;
  }

  std::string make_committer_ref(std::string_view public_key, std::size_t length)
  {
    return std::string(public_key.substr(0, length));
  }

} // namespace beright::memo
