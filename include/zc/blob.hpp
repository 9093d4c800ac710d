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

#pragma once

#include "base/types.hpp"

#include <array>
#include <cstdint>

namespace sconnect {
namespace zc {

/// @brief Diffie-Hellman keys over the 768 bit MODP group shared with
///        zeroconf receivers.  Keys are unsigned big endian byte strings.
class DhKeys {
public:
  /// @brief Random 95 byte private key
  DhKeys();

  /// @brief Fixed private key
  explicit DhKeys(uint8v private_key);

  const uint8v &public_key() const noexcept { return pub; }

  /// @brief Public key in the form sent as the addUser clientKey
  string public_key_b64() const noexcept;

  /// @throws ActivationError when the remote key can not be used
  uint8v shared_secret(const uint8v &remote_public) const;

private:
  // order dependent
  uint8v priv;
  uint8v pub;

public:
  static constexpr size_t private_key_len{95};
  static constexpr uint8_t generator{2};
};

/// @brief Account credentials carried inside the addUser blob
struct Credentials {
  enum auth_t : uint8_t { UserPass = 0, StoredSpotifyCredentials = 1, SpotifyToken = 3 };

  // order independent
  string user_name;
  uint8v password;
  auth_t auth_type{UserPass};
};

/// @brief Builds the encrypted and signed addUser blob for a native receiver
class BlobBuilder {
public:
  /// @param device_id receiver deviceID from getInfo
  /// @param remote_public_b64 receiver publicKey from getInfo
  /// @throws ActivationError when the public key is not base64
  BlobBuilder(Credentials creds, csv device_id, csv remote_public_b64, DhKeys keys = DhKeys());

  /// @brief Credentials encrypted with a key derived from the receiver device id (base64)
  string inner_blob() const;

  /// @brief Inner blob encrypted with the shared secret and signed (base64)
  /// @throws ActivationError when the key exchange fails
  string build() const;

  /// @brief Our public key, sent as the addUser clientKey
  string client_key() const noexcept { return keys.public_key_b64(); }

  /// @brief Origin device id sent alongside a blob a receiver can not decrypt
  static string origin_device_id() noexcept;

private:
  // order dependent
  Credentials creds;
  const string device_id;
  uint8v remote_public;
  DhKeys keys;

public:
  static constexpr csv origin_device_name{"sconnect"};
  static constexpr std::array<uint8_t, 16> iv{253, 81,  222, 19, 70, 203, 45, 89,
                                              141, 68, 210, 240, 93, 20, 76,  30};

  MOD_ID("connect.blob");
};

} // namespace zc
} // namespace sconnect
