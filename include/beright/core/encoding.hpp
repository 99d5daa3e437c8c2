#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace beright
{

  /**
   * Encode bytes with the Bitcoin base58 alphabet (Solana addresses,
   * blockhashes and signatures).
   * @param bytes Input bytes.
   * @return Base58 text; each leading zero byte becomes '1'.
   */
  [[nodiscard]] std::string base58_encode(std::span<const std::uint8_t> bytes);
  /**
   * Decode base58 text.
   * @param text Base58 text.
   * @return Decoded bytes, or std::nullopt on a character outside the alphabet.
   */
  [[nodiscard]] std::optional<std::vector<std::uint8_t>> base58_decode(std::string_view text);

  /**
   * Standard base64 with padding (transaction wire encoding for sendTransaction).
   * @param bytes Input bytes.
   * @return Base64 text.
   */
  [[nodiscard]] std::string base64_encode(std::span<const std::uint8_t> bytes);
  /**
   * Decode padded base64.
   * @param text Base64 text.
   * @return Decoded bytes, or std::nullopt when malformed.
   */
  [[nodiscard]] std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view text);

} // namespace beright
