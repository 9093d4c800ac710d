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

#include "device/entry.hpp"

namespace sconnect {

/// @brief Receives directory change notifications.  Invoked while the
///        directory lock is held so the directory is already consistent
///        with the notification.  Implementations must not block.
class Observer {
public:
  virtual ~Observer() = default;

  virtual void device_added(const DirectoryEntry &entry) = 0;
  virtual void device_removed(const DirectoryEntry &entry) = 0;
  virtual void device_updated(const DirectoryEntry &entry) = 0;
};

} // namespace sconnect
