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

#include "speaker/players.hpp"
#include "base/logger.hpp"

#include <exception>

namespace sconnect {
namespace speaker {

bool Players::add(csv address) noexcept {
  INFO_AUTO_CAT("add");

  if (!factory || address.empty()) return false;

  try {
    auto player = factory->create(address);
    if (!player) return false;

    INFO_AUTO("{} {}\n", player->name(), address);

    std::scoped_lock lck(mtx);
    players.insert_or_assign(string(address), std::move(player));

    return true;
  } catch (const std::exception &e) {
    INFO_AUTO("{} failed: {}\n", address, e.what());
  }

  return false;
}

shPlayer Players::find(csv address) const noexcept {
  std::scoped_lock lck(mtx);

  if (auto it = players.find(address); it != players.end()) return it->second;

  return nullptr;
}

void Players::remove(csv address) noexcept {
  std::scoped_lock lck(mtx);

  if (auto it = players.find(address); it != players.end()) players.erase(it);
}

size_t Players::size() const noexcept {
  std::scoped_lock lck(mtx);

  return players.size();
}

} // namespace speaker
} // namespace sconnect
