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
/*
 * Unit tests for the addUser blob: src/zc/blob.cpp and the crypto helpers
 */

#include "base/crypto.hpp"
#include "base/error.hpp"
#include "zc/blob.hpp"

#include <gtest/gtest.h>
#include <numeric>

using namespace sconnect;

namespace {

constexpr csv device_id{"0123456789abcdef0123456789abcdef01234567"};
constexpr csv remote_key{"mj+YDuyUCnRYlWDXrgqID1DpvRpCNbwbbiWvmFIIUqotnEJfd6Pkhzq0X91aDI5ZLKPJdkTKJMg1Y4EUFP76wX3LckByqdQvGPUnXm1273LAsoI8uLsRON1q0PzUu3DA"};

uint8v local_private() {
  uint8v key(zc::DhKeys::private_key_len);
  std::iota(key.begin(), key.end(), uint8_t{1});

  return key;
}

uint8v remote_private() { return uint8v(zc::DhKeys::private_key_len, 0xa5); }

zc::Credentials listener() {
  const string pw{"device-password"};

  return zc::Credentials{.user_name = "listener", .password = uint8v(pw.begin(), pw.end())};
}

class BlobFixture : public testing::Test {
protected:
  static void SetUpTestSuite() { crypto::init(); }
};

} // namespace

TEST_F(BlobFixture, Base64) {
  const string text{"sconnect"};

  EXPECT_EQ(crypto::base64_encode(text.data(), text.size()), "c2Nvbm5lY3Q=");
  EXPECT_EQ(crypto::base64_decode("c2Nvbm5lY3Q="), uint8v(text.begin(), text.end()));
  EXPECT_EQ(crypto::base64_decode("SU5WQUxJRA=="), uint8v({'I', 'N', 'V', 'A', 'L', 'I', 'D'}));
  EXPECT_THROW(crypto::base64_decode("abc"), std::runtime_error);
}

TEST_F(BlobFixture, Digests) {
  EXPECT_EQ(crypto::hex(crypto::sha1("abc")), "a9993e364706816aba3e25717850c26c9cd0d89d");
  EXPECT_EQ(zc::BlobBuilder::origin_device_id(), "790b562ef8c2e053b7c7b4ca88fe149eeef9ae6c");

  // RFC 2202 test case 2
  const string key{"Jefe"};
  const string data{"what do ya want for nothing?"};
  EXPECT_EQ(crypto::hex(crypto::hmac_sha1(uint8v(key.begin(), key.end()), data.data(), data.size())),
            "effcdf6ae5eb2fa2d27416d5f184df9c259a7c79");
}

TEST_F(BlobFixture, KeyExchangeAgrees) {
  zc::DhKeys local(local_private());
  zc::DhKeys remote(remote_private());

  EXPECT_EQ(remote.public_key_b64(), remote_key);

  const auto secret = local.shared_secret(remote.public_key());
  EXPECT_EQ(secret, remote.shared_secret(local.public_key()));
  EXPECT_EQ(crypto::hex(crypto::sha1(secret)), "749acd019647798e6014d58bb8862b976f1a57b3");

  EXPECT_THROW(local.shared_secret(uint8v{}), ActivationError);
}

TEST_F(BlobFixture, KnownBlob) {
  zc::BlobBuilder builder(listener(), device_id, remote_key, zc::DhKeys(local_private()));

  EXPECT_EQ(builder.client_key(),
            "Z/wP8msIkAhfQc5anoW2C9khA0uh8mx1K1x7WCtBqmgENlVxKolcfSswXGuE3/G1BgBWq0O4mTSlYkHooomi7U6lyPyUGFDLNmdbELaJ5oJ81s3II3xrcsOBMZ7Log9A");
  EXPECT_EQ(builder.inner_blob(), "spcElFMKyzxyCFQY1z+hj078eThbYyEiIpVP5b2ycoc=");
  EXPECT_EQ(builder.build(), "/VHeE0bLLVmNRNLwXRRMHoe/5lfPNqfloNeGPpA5zZZAo5cCokY9uLVNqZT6zNOoTDMDTX8utxkhEV5LgY7x1t5b0oTvHBzGqLsC/lUhGvQ=");
}

TEST_F(BlobFixture, RandomKeysDiffer) {
  zc::BlobBuilder a(listener(), device_id, remote_key);
  zc::BlobBuilder b(listener(), device_id, remote_key);

  EXPECT_NE(a.client_key(), b.client_key());
  EXPECT_EQ(a.inner_blob(), b.inner_blob());

  // iv, encrypted base64 inner blob and checksum
  EXPECT_EQ(crypto::base64_decode(a.build()).size(), 16u + a.inner_blob().size() + 20u);
}

TEST_F(BlobFixture, RejectsBadPublicKey) {
  EXPECT_THROW(zc::BlobBuilder(listener(), device_id, "not base64!"), ActivationError);
}
