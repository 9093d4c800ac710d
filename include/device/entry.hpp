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
#include "device/discovery_record.hpp"
#include "device/outcome.hpp"
#include "device/self_description.hpp"

#include <optional>
#include <vector>

namespace sconnect {

/// @brief The merged, queryable unit of the device directory
struct DirectoryEntry {
  // order independent
  string id;
  string name;
  DiscoveryRecord discovery;
  SelfDescription info;
  ProtocolOutcome outcome;

  bool is_active{false};
  bool is_listed{false};
  bool is_restricted{false};

  const string &key() const noexcept { return discovery.key; }
  bool is_cast() const noexcept { return discovery.is_cast; }
  bool is_dynamic() const noexcept { return discovery.is_dynamic(); }

  bool operator==(const DirectoryEntry &) const = default;

  string inspect() const noexcept;

  MOD_ID("device.entry");
};

using DirectoryEntries = std::vector<DirectoryEntry>;
using OptEntry = std::optional<DirectoryEntry>;

} // namespace sconnect
