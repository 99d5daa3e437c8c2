#include "beright/core/encoding.hpp"

#include <openssl/evp.h>

#include <libbase58.h>

namespace beright {

std::string base58_encode(std::span<const std::uint8_t> bytes) {
  if (bytes.empty()) {
    return {};
  }
  // Every input byte yields at most two digits; one more for the terminator.
  std::string out(bytes.size() * 2 + 1, '\0');
  std::size_t size = out.size();
  if (!b58enc(out.data(), &size, bytes.data(), bytes.size())) {
    return {};
  }
  // size counts the terminator.
  out.resize(size - 1);
  return out;
}

std::optional<std::vector<std::uint8_t>> base58_decode(std::string_view text) {
  if (text.empty()) {
    return std::vector<std::uint8_t>{};
  }
  // b58tobin right-aligns the result in the buffer and reports its length.
  std::vector<std::uint8_t> buffer(text.size(), 0);
  std::size_t size = buffer.size();
  if (!b58tobin(buffer.data(), &size, text.data(), text.size())) {
    return std::nullopt;
  }
  if (size > buffer.size()) {
    return std::nullopt;
  }
  return std::vector<std::uint8_t>(buffer.end() - static_cast<std::ptrdiff_t>(size),
                                   buffer.end());
}

std::string base64_encode(std::span<const std::uint8_t> bytes) {
  std::string b64;
  b64.resize(4 * ((bytes.size() + 2) / 3));
  if (bytes.empty()) {
    return b64;
  }
  int out_len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(b64.data()),
                                bytes.data(),
                                static_cast<int>(bytes.size()));
  b64.resize(out_len > 0 ? static_cast<std::size_t>(out_len) : 0);
  return b64;
}

std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view text) {
  if (text.size() % 4 != 0) {
    return std::nullopt;
  }
  if (text.empty()) {
    return std::vector<std::uint8_t>{};
  }
  std::vector<std::uint8_t> out(text.size() / 4 * 3);
  int out_len = EVP_DecodeBlock(out.data(),
                                reinterpret_cast<const unsigned char*>(text.data()),
                                static_cast<int>(text.size()));
  if (out_len < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock counts padding as zero bytes.
  std::size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
    if (text[text.size() - 2] == '=') {
      ++padding;
    }
  }
  out.resize(static_cast<std::size_t>(out_len) - padding);
  return out;
}

} // namespace beright
