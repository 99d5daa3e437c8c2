#include "beright/ledger/transaction.hpp"

#include <algorithm>

#include "beright/core/encoding.hpp"

namespace beright::ledger
{

namespace
{

// Message header: one required signature, no read-only signers, one
// read-only unsigned account (the memo program).
constexpr std::uint8_t NUM_REQUIRED_SIGNATURES = 1;
constexpr std::uint8_t NUM_READONLY_SIGNED = 0;
constexpr std::uint8_t NUM_READONLY_UNSIGNED = 1;

constexpr std::uint8_t FEE_PAYER_INDEX = 0;
constexpr std::uint8_t MEMO_PROGRAM_INDEX = 1;

template <std::size_t N>
void append_bytes(std::vector<std::uint8_t>& out, const std::array<std::uint8_t, N>& bytes)
{
  out.insert(out.end(), bytes.begin(), bytes.end());
}

} // namespace

std::optional<PublicKey> decode_key(std::string_view text)
{
  auto bytes = base58_decode(text);
  if (!bytes || bytes->size() != PublicKey{}.size())
  {
    return std::nullopt;
  }
  PublicKey key{};
  std::copy(bytes->begin(), bytes->end(), key.begin());
  return key;
}

void append_compact_u16(std::vector<std::uint8_t>& out, std::uint16_t value)
{
  std::uint32_t rem = value;
  for (;;)
  {
    auto byte = static_cast<std::uint8_t>(rem & 0x7F);
    rem >>= 7;
    if (rem == 0)
    {
      out.push_back(byte);
      return;
    }
    out.push_back(byte | 0x80);
  }
}

std::vector<std::uint8_t> build_memo_message(const PublicKey& fee_payer,
                                             const PublicKey& memo_program,
                                             const Blockhash& recent_blockhash,
                                             std::span<const std::string> memos)
{
  std::size_t payload = 0;
  for (const auto& memo : memos)
  {
    payload += 3 + 1 + 3 + memo.size();
  }

  std::vector<std::uint8_t> out;
  out.reserve(3 + 1 + 64 + 32 + 3 + payload);

  out.push_back(NUM_REQUIRED_SIGNATURES);
  out.push_back(NUM_READONLY_SIGNED);
  out.push_back(NUM_READONLY_UNSIGNED);

  append_compact_u16(out, 2);
  append_bytes(out, fee_payer);
  append_bytes(out, memo_program);

  append_bytes(out, recent_blockhash);

  append_compact_u16(out, static_cast<std::uint16_t>(memos.size()));
  for (const auto& memo : memos)
  {
    out.push_back(MEMO_PROGRAM_INDEX);
    append_compact_u16(out, 1);
    out.push_back(FEE_PAYER_INDEX);
    append_compact_u16(out, static_cast<std::uint16_t>(memo.size()));
    out.insert(out.end(), memo.begin(), memo.end());
  }
  return out;
}

std::vector<std::uint8_t> build_memo_message(const PublicKey& fee_payer,
                                             const PublicKey& memo_program,
                                             const Blockhash& recent_blockhash,
                                             std::string_view memo)
{
  const std::string single(memo);
  return build_memo_message(fee_payer, memo_program, recent_blockhash,
                            std::span<const std::string>(&single, 1));
}

std::size_t memo_transaction_size(std::span<const std::string> memos)
{
  // Keys and blockhash do not change the length; zeroed ones will do.
  const auto message = build_memo_message(PublicKey{}, PublicKey{}, Blockhash{}, memos);
  std::vector<std::uint8_t> prefix;
  append_compact_u16(prefix, 1);
  return prefix.size() + Signature{}.size() + message.size();
}

std::vector<std::uint8_t> serialize_transaction(const Signature& signature,
                                                std::span<const std::uint8_t> message)
{
  std::vector<std::uint8_t> out;
  out.reserve(1 + signature.size() + message.size());
  append_compact_u16(out, 1);
  append_bytes(out, signature);
  out.insert(out.end(), message.begin(), message.end());
  return out;
}

} // namespace beright::ledger
