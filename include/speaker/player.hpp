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

#include <memory>

namespace sconnect {
namespace speaker {

class Player;
using shPlayer = std::shared_ptr<Player>;

/// @brief A speaker of the one supported third-party family, reachable by address
class Player {
public:
  virtual ~Player() = default;

  virtual string name() const = 0;
  virtual string address() const = 0;

  /// @brief Is this player the coordinator of its group
  virtual bool is_coordinator() const = 0;

  /// @brief Coordinator of the group this player belongs to
  /// @return coordinator or nullptr for an orphaned group
  virtual shPlayer coordinator() = 0;
};

/// @brief Creates players for speakers found by discovery
class Factory {
public:
  virtual ~Factory() = default;

  virtual shPlayer create(csv address) = 0;
};

/// @brief Choose the player to control
/// @param player player found for the directory entry
/// @param return_coordinator prefer the group coordinator
/// @return the coordinator when requested and available, otherwise the player
/// @throws ResolutionError when player is nullptr
shPlayer select(shPlayer player, bool return_coordinator, csv device_name);

} // namespace speaker
} // namespace sconnect
