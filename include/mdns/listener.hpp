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

#include "mdns/record.hpp"

namespace sconnect {
namespace mdns {

/// @brief Receives service notifications for one service type.
///        Invoked on the Avahi poll thread.
class Listener {
public:
  virtual ~Listener() = default;

  /// @brief The service type this listener is interested in (e.g. _googlecast._tcp)
  virtual csv service_type() const noexcept = 0;

  virtual void service_added(const Record &rec) = 0;
  virtual void service_updated(const Record &rec) = 0;

  /// @brief Service instance left the network
  /// @param rec only name, type and domain are populated
  virtual void service_removed(const Record &rec) = 0;
};

} // namespace mdns
} // namespace sconnect
