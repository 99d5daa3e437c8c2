#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "beright/core/signer.hpp"

namespace beright::ledger
{

  /** SPL Memo program (v2). */
  inline constexpr std::string_view MEMO_PROGRAM_ID = "MemoSq4gqABAXKb96qnH8TysNcWxMyWCqXgDLGmfcHr";
  /** Maximum serialized size of a Solana transaction. */
  inline constexpr std::size_t MAX_TRANSACTION_BYTES = 1232;

  using Blockhash = std::array<std::uint8_t, 32>;

  /**
   * Decode a base58 string into a 32-byte key or blockhash.
   * @param text Base58 text.
   * @return Key bytes, or std::nullopt when malformed or not 32 bytes.
   */
  [[nodiscard]] std::optional<PublicKey> decode_key(std::string_view text);

  /**
   * Append a Solana compact-u16 length prefix.
   * @param out Output buffer.
   * @param value Length to encode.
   */
  void append_compact_u16(std::vector<std::uint8_t> &out, std::uint16_t value);

  /**
   * Serialize a legacy transaction message with one memo instruction.
   * The fee payer is the only signer and is listed as the memo's signer.
   * @param fee_payer Signing account.
   * @param memo_program Memo program id.
   * @param recent_blockhash Blockhash the transaction is valid against.
   * @param memo Memo bytes.
   * @return Message bytes to sign.
   */
  [[nodiscard]] std::vector<std::uint8_t> build_memo_message(const PublicKey &fee_payer,
                                                             const PublicKey &memo_program,
                                                             const Blockhash &recent_blockhash,
                                                             std::string_view memo);

  /**
   * Serialize a legacy transaction message with one memo instruction per
   * entry of `memos`, in order. Every instruction lists the fee payer as
   * its signer.
   * @param fee_payer Signing account.
   * @param memo_program Memo program id.
   * @param recent_blockhash Blockhash the transaction is valid against.
   * @param memos Memo payloads.
   * @return Message bytes to sign.
   */
  [[nodiscard]] std::vector<std::uint8_t> build_memo_message(const PublicKey &fee_payer,
                                                             const PublicKey &memo_program,
                                                             const Blockhash &recent_blockhash,
                                                             std::span<const std::string> memos);

  /**
   * Size of the wire transaction carrying `memos` (one signature).
   * @param memos Memo payloads.
   * @return Serialized byte count.
   */
  [[nodiscard]] std::size_t memo_transaction_size(std::span<const std::string> memos);

  /**
   * Prefix a message with its single signature.
   * @param signature Fee payer signature over `message`.
   * @param message Serialized message.
   * @return Wire transaction bytes.
   */
  [[nodiscard]] std::vector<std::uint8_t> serialize_transaction(
      const Signature &signature, std::span<const std::uint8_t> message);

} // namespace beright::ledger
