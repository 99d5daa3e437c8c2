#include "beright/core/signer.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

#include <openssl/err.h>

#include <simdjson.h>

#include "beright/core/encoding.hpp"

namespace beright {

namespace {

constexpr std::size_t SEED_SIZE = 32;
constexpr std::size_t KEYPAIR_SIZE = 64;

thread_local std::string g_last_sign_error;

void set_last_sign_error_from_openssl() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    g_last_sign_error = "unknown OpenSSL error";
    return;
  }
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  g_last_sign_error = buffer;
}

std::expected<std::string, SignerError> read_file(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return std::unexpected(SignerError::KeyFileUnreadable);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::expected<std::vector<std::uint8_t>, SignerError> parse_keypair_json(const std::string& text) {
  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(text);
  auto doc = parser.iterate(padded);
  if (doc.error()) {
    return std::unexpected(SignerError::MalformedKey);
  }
  auto arr = doc.get_array();
  if (arr.error()) {
    return std::unexpected(SignerError::MalformedKey);
  }

  std::vector<std::uint8_t> bytes;
  bytes.reserve(KEYPAIR_SIZE);
  for (auto item : arr) {
    auto val = item.get_uint64();
    if (val.error() || val.value() > 255) {
      return std::unexpected(SignerError::MalformedKey);
    }
    bytes.push_back(static_cast<std::uint8_t>(val.value()));
  }
  return bytes;
}

} // namespace

Signer::Signer(PkeyPtr key, PublicKey public_key)
  : key_(std::move(key)),
    public_key_(public_key),
    address_(base58_encode(public_key_)) {}

std::expected<Signer, SignerError> Signer::from_secret(std::span<const std::uint8_t> secret) {
  if (secret.size() != SEED_SIZE && secret.size() != KEYPAIR_SIZE) {
    g_last_sign_error = "secret must be 32 or 64 bytes";
    return std::unexpected(SignerError::MalformedKey);
  }

  EVP_PKEY* raw = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, secret.data(), SEED_SIZE);
  if (!raw) {
    set_last_sign_error_from_openssl();
    return std::unexpected(SignerError::MalformedKey);
  }
  PkeyPtr key(raw, &EVP_PKEY_free);

  PublicKey public_key{};
  std::size_t len = public_key.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &len) <= 0 ||
      len != public_key.size()) {
    set_last_sign_error_from_openssl();
    return std::unexpected(SignerError::MalformedKey);
  }

  // A 64-byte secret carries its public half; it must match the derived key.
  if (secret.size() == KEYPAIR_SIZE &&
      !std::equal(public_key.begin(), public_key.end(), secret.begin() + SEED_SIZE)) {
    g_last_sign_error = "keypair public half does not match its seed";
    return std::unexpected(SignerError::MalformedKey);
  }

  return Signer(std::move(key), public_key);
}

std::expected<Signer, SignerError> Signer::from_keypair_file(const std::string& path) {
  auto text = read_file(path);
  if (!text) {
    return std::unexpected(text.error());
  }
  auto bytes = parse_keypair_json(*text);
  if (!bytes) {
    return std::unexpected(bytes.error());
  }
  auto signer = from_secret(*bytes);
  std::fill(bytes->begin(), bytes->end(), 0);
  return signer;
}

std::expected<Signature, SignerError> Signer::sign(std::span<const std::uint8_t> message) const {
  using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    set_last_sign_error_from_openssl();
    return std::unexpected(SignerError::SigningFailed);
  }

  // Ed25519 is a one-shot scheme: no digest, no update calls.
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) <= 0) {
    set_last_sign_error_from_openssl();
    return std::unexpected(SignerError::SigningFailed);
  }

  Signature signature{};
  std::size_t sig_len = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &sig_len, message.data(), message.size()) <= 0 ||
      sig_len != signature.size()) {
    set_last_sign_error_from_openssl();
    return std::unexpected(SignerError::SigningFailed);
  }
  return signature;
}

std::expected<Signer, SignerError> load_signer_from_env() {
  const char* key_path = std::getenv("BERIGHT_KEYPAIR_PATH");
  const char* key_b58 = std::getenv("BERIGHT_PRIVATE_KEY");

  if (key_path && *key_path) {
    return Signer::from_keypair_file(key_path);
  }
  if (key_b58 && *key_b58) {
    auto bytes = base58_decode(key_b58);
    if (!bytes) {
      g_last_sign_error = "BERIGHT_PRIVATE_KEY is not valid base58";
      return std::unexpected(SignerError::MalformedKey);
    }
    auto signer = Signer::from_secret(*bytes);
    std::fill(bytes->begin(), bytes->end(), 0);
    return signer;
  }
  return std::unexpected(SignerError::MissingKey);
}

const char* to_string(SignerError error) {
  switch (error) {
    case SignerError::MissingKey:
      return "missing signing key";
    case SignerError::KeyFileUnreadable:
      return "keypair file unreadable";
    case SignerError::MalformedKey:
      return "malformed signing key";
    case SignerError::SigningFailed:
      return "signing failed";
  }
  return "unknown signer error";
}

const char* last_sign_error() {
  return g_last_sign_error.empty() ? "no error detail" : g_last_sign_error.c_str();
}

} // namespace beright
