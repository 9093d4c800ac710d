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
#include "speaker/player.hpp"

#include <map>
#include <mutex>

namespace sconnect {
namespace speaker {

/// @brief Players created for discovered speakers, keyed by host address
class Players {
public:
  /// @param factory nullptr disables player creation
  explicit Players(Factory *factory = nullptr) noexcept : factory(factory) {}

  Players(const Players &) = delete;
  Players &operator=(const Players &) = delete;

  /// @brief Create (or replace) the player for the address
  /// @return true when a player was created
  bool add(csv address) noexcept;

  shPlayer find(csv address) const noexcept;
  void remove(csv address) noexcept;
  size_t size() const noexcept;

private:
  // order dependent
  Factory *factory;

  // order independent
  mutable std::mutex mtx;
  std::map<string, shPlayer, std::less<>> players;

public:
  MOD_ID("speaker.players");
};

} // namespace speaker
} // namespace sconnect
