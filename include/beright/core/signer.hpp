#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include <openssl/evp.h>

namespace beright
{

  using PublicKey = std::array<std::uint8_t, 32>;
  using Signature = std::array<std::uint8_t, 64>;

  /** Errors returned by key loading and signing. */
  enum class SignerError
  {
    MissingKey,
    KeyFileUnreadable,
    MalformedKey,
    SigningFailed
  };

  /**
   * Ed25519 account key. Holds the private key inside an OpenSSL EVP_PKEY and
   * never exposes the raw secret again after construction.
   */
  class Signer
  {
  public:
    /**
     * Build from a 32-byte seed or a 64-byte Solana secret (seed || public key).
     * @param secret Secret bytes.
     * @return Signer or SignerError.
     */
    [[nodiscard]] static std::expected<Signer, SignerError> from_secret(
        std::span<const std::uint8_t> secret);
    /**
     * Load a Solana CLI keypair file (JSON array of 64 integers).
     * @param path Path to the keypair file.
     * @return Signer or SignerError.
     */
    [[nodiscard]] static std::expected<Signer, SignerError> from_keypair_file(
        const std::string &path);

    /**
     * Raw public key bytes.
     * @return 32-byte public key.
     */
    [[nodiscard]] const PublicKey &public_key() const { return public_key_; }
    /**
     * Base58 account address.
     * @return Address string.
     */
    [[nodiscard]] const std::string &address() const { return address_; }

    /**
     * Sign a message.
     * @param message Bytes to sign (a serialized transaction message).
     * @return 64-byte signature or SignerError.
     */
    [[nodiscard]] std::expected<Signature, SignerError> sign(
        std::span<const std::uint8_t> message) const;

  private:
    using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

    Signer(PkeyPtr key, PublicKey public_key);

    PkeyPtr key_;
    PublicKey public_key_;
    std::string address_;
  };

  /**
   * Load the signing key named by BERIGHT_KEYPAIR_PATH (keypair file) or
   * BERIGHT_PRIVATE_KEY (base58 secret).
   * @return Signer or SignerError.
   */
  [[nodiscard]] std::expected<Signer, SignerError> load_signer_from_env();
  /**
   * Convert SignerError to a string literal.
   * @param error Error to stringify.
   * @return String literal describing the error.
   */
  [[nodiscard]] const char *to_string(SignerError error);
  /**
   * Return the last OpenSSL error string from key loading or signing.
   * @return Null-terminated error message.
   */
  [[nodiscard]] const char *last_sign_error();

} // namespace beright
