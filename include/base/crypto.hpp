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

namespace sconnect {

struct crypto {
  static constexpr auto vsn{"1.8.0"};

  /// @brief Initialize libgcrypt, must be called before any thread is started.
  ///        Throws std::runtime_error when the installed library is too old.
  static void init();

  /// @brief Lowercase hex md5 digest of the provided text
  static string md5_hex(csv text) noexcept;

  static uint8v sha1(const void *data, size_t len) noexcept;
  static uint8v sha1(csv text) noexcept { return sha1(text.data(), text.size()); }
  static uint8v sha1(const uint8v &data) noexcept { return sha1(data.data(), data.size()); }
  static string hex(const uint8v &data) noexcept;

  /// @brief HMAC-SHA1 of data keyed by key
  /// @throws std::runtime_error when libgcrypt refuses the key
  static uint8v hmac_sha1(const uint8v &key, const void *data, size_t len);

  static string base64_encode(const void *data, size_t len) noexcept;
  static string base64_encode(const uint8v &data) noexcept {
    return base64_encode(data.data(), data.size());
  }

  /// @throws std::runtime_error when the text is not valid base64
  static uint8v base64_decode(csv text);
};

} // namespace sconnect
