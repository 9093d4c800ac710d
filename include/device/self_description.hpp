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

#include <ArduinoJson.h>
#include <cstdint>
#include <vector>

namespace sconnect {

/// @brief Logical player multiplexed by a single receiver
struct Alias {
  // order independent
  string id;
  bool is_group{false};
  string name;

  bool operator==(const Alias &) const = default;
};

using Aliases = std::vector<Alias>;

/// @brief A receiver's own account of itself, from the getInfo endpoint
///        or embedded in a cast getInfoResponse
struct SelfDescription {
  static constexpr int64_t STATUS_OK{101};
  static constexpr int64_t STATUS_GET_INFO_FAILED{9999};
  static constexpr size_t doc_capacity{4 * 1024};

  // order independent
  string account_req;
  string active_user;
  string availability;
  string brand_display_name;
  string client_id;
  string device_id;
  string device_type;
  string group_status;
  bool is_group{false};
  string library_version;
  string model_display_name;
  string product_id;
  string public_key;
  string remote_name;
  string resolver_version;
  string scope;
  int64_t supported_capabilities{0};
  string token_type;
  string version;
  string voice_support;
  Aliases aliases;

  // status of the getInfo call itself
  int64_t spotify_error{0};
  int64_t status{0};
  string status_string;
  string response_source;

  /// @brief Display name, the first alias when the receiver reports no name
  string display_name() const noexcept {
    if (remote_name.empty() && !aliases.empty()) return aliases.front().name;

    return remote_name;
  }

  bool has_aliases() const noexcept { return !aliases.empty(); }
  bool is_ok() const noexcept { return status == STATUS_OK; }
  bool is_sonos() const noexcept { return brand_display_name == csv{"Sonos"}; }

  bool operator==(const SelfDescription &) const = default;

  /// @brief Populate from a getInfo json object
  static SelfDescription from_json(JsonObjectConst obj) noexcept;

  /// @brief Parse a getInfo json document
  /// @throws Error when the text is not a json object
  static SelfDescription parse(csv text);

  string inspect() const noexcept;

  MOD_ID("device.self_desc");
};

} // namespace sconnect
