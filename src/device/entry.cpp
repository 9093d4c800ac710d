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

#include "device/entry.hpp"

#include <fmt/format.h>
#include <iterator>

namespace sconnect {

string DirectoryEntry::inspect() const noexcept {
  string msg;
  auto w = std::back_inserter(msg);

  fmt::format_to(w, "{:<30} id={} ", name, id);

  if (is_active) fmt::format_to(w, "ACTIVE ");
  if (is_listed) fmt::format_to(w, "LISTED ");
  if (is_restricted) fmt::format_to(w, "RESTRICTED ");

  if (is_dynamic()) {
    fmt::format_to(w, "dynamic");
  } else {
    fmt::format_to(w, "{} {}:{}", is_cast() ? "cast" : "native", discovery.host_address(),
                   discovery.port);
  }

  if (outcome.kind != ProtocolOutcome::None) fmt::format_to(w, " outcome=[{}]", outcome);

  return msg;
}

} // namespace sconnect
