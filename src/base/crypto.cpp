// sconnect
// Copyright (C) 2022  Tim Hughey
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
// https://www.wisslanding.com

#include "base/crypto.hpp"

#include <array>
#include <exception>
#include <fmt/format.h>
#include <gcrypt.h>
#include <iterator>
#include <openssl/evp.h>
#include <stdexcept>

namespace sconnect {

void crypto::init() { // static

  if (gcry_check_version(vsn) == nullptr) {

    const string msg = fmt::format("outdated libgcrypt, need {}", vsn);
    throw(std::runtime_error(msg));
  }

  gcry_control(GCRYCTL_DISABLE_SECMEM, 0);
  gcry_control(GCRYCTL_INITIALIZATION_FINISHED, 0);
}

string crypto::md5_hex(csv text) noexcept { // static
  std::array<unsigned char, 16> digest{};

  // gcry_md_hash_buffer initializes the library on first use when init() was skipped
  gcry_md_hash_buffer(GCRY_MD_MD5, digest.data(), text.data(), text.size());

  string hex;
  auto w = std::back_inserter(hex);

  for (const auto b : digest) {
    fmt::format_to(w, "{:02x}", b);
  }

  return hex;
}

uint8v crypto::sha1(const void *data, size_t len) noexcept { // static
  uint8v digest(gcry_md_get_algo_dlen(GCRY_MD_SHA1));

  gcry_md_hash_buffer(GCRY_MD_SHA1, digest.data(), data, len);

  return digest;
}

string crypto::hex(const uint8v &data) noexcept { // static
  string hex;
  auto w = std::back_inserter(hex);

  for (const auto b : data) {
    fmt::format_to(w, "{:02x}", b);
  }

  return hex;
}

uint8v crypto::hmac_sha1(const uint8v &key, const void *data, size_t len) { // static
  gcry_md_hd_t hd{nullptr};

  if (auto rc = gcry_md_open(&hd, GCRY_MD_SHA1, GCRY_MD_FLAG_HMAC); rc != 0) {
    throw(std::runtime_error(fmt::format("hmac open failed: {}", gcry_strerror(rc))));
  }

  if (auto rc = gcry_md_setkey(hd, key.data(), key.size()); rc != 0) {
    gcry_md_close(hd);
    throw(std::runtime_error(fmt::format("hmac key rejected: {}", gcry_strerror(rc))));
  }

  gcry_md_write(hd, data, len);

  const auto *mac = gcry_md_read(hd, GCRY_MD_SHA1);
  uint8v digest(mac, mac + gcry_md_get_algo_dlen(GCRY_MD_SHA1));

  gcry_md_close(hd);

  return digest;
}

string crypto::base64_encode(const void *data, size_t len) noexcept { // static
  string out(4 * ((len + 2) / 3), '\0');

  const auto n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                                 static_cast<const unsigned char *>(data), static_cast<int>(len));

  out.resize(n);

  return out;
}

uint8v crypto::base64_decode(csv text) { // static
  if (text.empty()) return uint8v();

  if ((text.size() % 4) != 0) {
    throw(std::runtime_error(fmt::format("base64 length {} invalid", text.size())));
  }

  uint8v out(3 * (text.size() / 4));

  const auto n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char *>(text.data()),
                                 static_cast<int>(text.size()));

  if (n < 0) throw(std::runtime_error("base64 text invalid"));

  // EVP_DecodeBlock counts padding as decoded zeros
  size_t pad{0};
  if (text.ends_with("==")) {
    pad = 2;
  } else if (text.ends_with("=")) {
    pad = 1;
  }

  out.resize(static_cast<size_t>(n) - pad);

  return out;
}

} // namespace sconnect
