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

#include "speaker/player.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <fmt/format.h>

namespace sconnect {
namespace speaker {

static constexpr csv module_id{"speaker"};

shPlayer select(shPlayer player, bool return_coordinator, csv device_name) {
  INFO_AUTO_CAT("select");

  if (!player) {
    throw ResolutionError(fmt::format("no speaker player found for device \"{}\"", device_name));
  }

  if (!return_coordinator || player->is_coordinator()) return player;

  if (auto coord = player->coordinator(); coord) {
    INFO_AUTO("{} coordinator={} {}\n", player->name(), coord->name(), coord->address());
    return coord;
  }

  // orphaned group, continue with the member itself
  INFO_AUTO("{} has no coordinator, using member {}\n", player->name(), player->address());

  return player;
}

} // namespace speaker
} // namespace sconnect
