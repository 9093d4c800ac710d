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

#include "zc/blob.hpp"
#include "base/crypto.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <fmt/format.h>
#include <gcrypt.h>
#include <iterator>
#include <utility>

namespace sconnect {
namespace zc {

namespace {

// RFC 2409 group 1
constexpr std::array<uint8_t, 96> dh_prime{
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xc9, 0x0f, 0xda, 0xa2, 0x21, 0x68, 0xc2, 0x34,
    0xc4, 0xc6, 0x62, 0x8b, 0x80, 0xdc, 0x1c, 0xd1, 0x29, 0x02, 0x4e, 0x08, 0x8a, 0x67, 0xcc, 0x74,
    0x02, 0x0b, 0xbe, 0xa6, 0x3b, 0x13, 0x9b, 0x22, 0x51, 0x4a, 0x08, 0x79, 0x8e, 0x34, 0x04, 0xdd,
    0xef, 0x95, 0x19, 0xb3, 0xcd, 0x3a, 0x43, 0x1b, 0x30, 0x2b, 0x0a, 0x6d, 0xf2, 0x5f, 0x14, 0x37,
    0x4f, 0xe1, 0x35, 0x6d, 0x6d, 0x51, 0xc2, 0x45, 0xe4, 0x85, 0xb5, 0x76, 0x62, 0x5e, 0x7e, 0xc6,
    0xf4, 0x4c, 0x42, 0xe9, 0xa6, 0x3a, 0x36, 0x20, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff};

void check(gcry_error_t rc, csv what) {
  if (rc != 0) throw ActivationError(fmt::format("{} failed: {}", what, gcry_strerror(rc)));
}

struct Mpi {
  Mpi(const uint8_t *data, size_t len) {
    check(gcry_mpi_scan(&m, GCRYMPI_FMT_USG, data, len, nullptr), "mpi scan");
  }

  explicit Mpi(const uint8v &bytes) : Mpi(bytes.data(), bytes.size()) {}
  Mpi() : m(gcry_mpi_new(0)) {}
  ~Mpi() noexcept { gcry_mpi_release(m); }

  Mpi(const Mpi &) = delete;
  Mpi &operator=(const Mpi &) = delete;

  // minimal unsigned big endian, zero is a single byte
  uint8v bytes() const {
    size_t n{0};
    check(gcry_mpi_print(GCRYMPI_FMT_USG, nullptr, 0, &n, m), "mpi size");

    uint8v out(n);
    check(gcry_mpi_print(GCRYMPI_FMT_USG, out.data(), out.size(), &n, m), "mpi print");
    out.resize(n);

    if (out.empty()) out.emplace_back(0);

    return out;
  }

  gcry_mpi_t m{nullptr};
};

uint8v powm(const uint8v &base, const uint8v &exponent) {
  Mpi b(base), e(exponent), p(dh_prime.data(), dh_prime.size());
  Mpi r;

  gcry_mpi_powm(r.m, b.m, e.m, p.m);

  return r.bytes();
}

uint8v encrypt(int algo, int mode, const uint8v &key, const uint8v &data,
               const uint8_t *ctr = nullptr) {
  gcry_cipher_hd_t hd{nullptr};
  check(gcry_cipher_open(&hd, algo, mode, 0), "cipher open");

  uint8v out(data.size());

  try {
    check(gcry_cipher_setkey(hd, key.data(), key.size()), "cipher key");
    if (ctr != nullptr) check(gcry_cipher_setctr(hd, ctr, BlobBuilder::iv.size()), "cipher ctr");
    check(gcry_cipher_encrypt(hd, out.data(), out.size(), data.data(), data.size()), "encrypt");
  } catch (const ActivationError &) {
    gcry_cipher_close(hd);
    throw;
  }

  gcry_cipher_close(hd);

  return out;
}

uint8v random_key(size_t len) {
  uint8v key(len);
  gcry_randomize(key.data(), key.size(), GCRY_STRONG_RANDOM);

  return key;
}

} // namespace

DhKeys::DhKeys() : DhKeys(random_key(private_key_len)) {}

DhKeys::DhKeys(uint8v private_key)
    : priv(std::move(private_key)), //
      pub(powm(uint8v{generator}, priv)) {}

string DhKeys::public_key_b64() const noexcept { return crypto::base64_encode(pub); }

uint8v DhKeys::shared_secret(const uint8v &remote_public) const {
  if (remote_public.empty()) throw ActivationError("receiver public key is empty");

  return powm(remote_public, priv);
}

BlobBuilder::BlobBuilder(Credentials creds, csv device_id, csv remote_public_b64, DhKeys keys)
    : creds(std::move(creds)), //
      device_id(device_id),    //
      keys(std::move(keys)) {
  try {
    remote_public = crypto::base64_decode(remote_public_b64);
  } catch (const std::runtime_error &e) {
    throw ActivationError(fmt::format("receiver public key unusable: {}", e.what()));
  }
}

string BlobBuilder::origin_device_id() noexcept { // static
  return crypto::hex(crypto::sha1(origin_device_name));
}

string BlobBuilder::inner_blob() const {
  uint8v blob;

  auto write_int = [&blob](size_t i) {
    if (i < 0x80) {
      blob.emplace_back(static_cast<uint8_t>(i));
    } else {
      blob.emplace_back(static_cast<uint8_t>(0x80 | (i & 0x7f)));
      blob.emplace_back(static_cast<uint8_t>(i >> 7));
    }
  };

  auto write_bytes = [&](const uint8_t *data, size_t len) {
    write_int(len);
    blob.insert(blob.end(), data, data + len);
  };

  const auto *user = reinterpret_cast<const uint8_t *>(creds.user_name.data());

  write_int(0x49); // I
  write_bytes(user, creds.user_name.size());
  write_int(0x50); // P
  write_int(creds.auth_type);
  write_int(0x51); // Q
  write_bytes(creds.password.data(), creds.password.size());

  // pad to the block size, the last byte is the pad length
  const size_t zeros = 16 - (blob.size() % 16) - 1;
  blob.insert(blob.end(), zeros, 0);
  blob.emplace_back(static_cast<uint8_t>(zeros + 1));

  for (size_t i = 16; i < blob.size(); ++i) {
    blob[i] ^= blob[i - 16];
  }

  const auto secret = crypto::sha1(device_id);

  uint8v derived(20);
  check(gcry_kdf_derive(secret.data(), secret.size(), GCRY_KDF_PBKDF2, GCRY_MD_SHA1, user,
                        creds.user_name.size(), 0x100, derived.size(), derived.data()),
        "pbkdf2");

  // sha1 of the derived key plus its length, 24 bytes selects AES-192
  auto key = crypto::sha1(derived);
  key.insert(key.end(), {0x00, 0x00, 0x00, 0x14});

  return crypto::base64_encode(encrypt(GCRY_CIPHER_AES192, GCRY_CIPHER_MODE_ECB, key, blob));
}

string BlobBuilder::build() const {
  INFO_AUTO_CAT("build");

  const auto inner = inner_blob();
  const auto shared = keys.shared_secret(remote_public);

  auto base_key = crypto::sha1(shared);
  base_key.resize(16);

  static constexpr csv encryption{"encryption"};
  static constexpr csv checksum{"checksum"};

  auto enc_key = crypto::hmac_sha1(base_key, encryption.data(), encryption.size());
  enc_key.resize(16);

  const auto encrypted = encrypt(GCRY_CIPHER_AES128, GCRY_CIPHER_MODE_CTR, enc_key,
                                 uint8v(inner.begin(), inner.end()), iv.data());

  const auto sum_key = crypto::hmac_sha1(base_key, checksum.data(), checksum.size());
  const auto sum = crypto::hmac_sha1(sum_key, encrypted.data(), encrypted.size());

  uint8v signed_blob(iv.begin(), iv.end());
  signed_blob.insert(signed_blob.end(), encrypted.begin(), encrypted.end());
  signed_blob.insert(signed_blob.end(), sum.begin(), sum.end());

  INFO_AUTO("user={} device_id={} len={}\n", creds.user_name, device_id, signed_blob.size());

  return crypto::base64_encode(signed_blob);
}

} // namespace zc
} // namespace sconnect
