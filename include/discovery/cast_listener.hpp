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
#include "device/entry.hpp"
#include "directory/directory.hpp"
#include "mdns/listener.hpp"

#include <mutex>

namespace sconnect {
namespace discovery {

/// @brief Casting receivers (_googlecast._tcp).  Identity is a placeholder
///        derived from the friendly name and refined during activation.
class CastListener : public mdns::Listener {
public:
  CastListener(Directory &directory, std::mutex &discovery_mtx) noexcept
      : directory(directory), discovery_mtx(discovery_mtx) {}

  csv service_type() const noexcept override { return SERVICE_TYPE; }

  void service_added(const mdns::Record &rec) override;
  void service_updated(const mdns::Record &rec) override;
  void service_removed(const mdns::Record &rec) override;

  /// @brief Placeholder entry for a cast discovery record, the id is the md5 of
  ///        the friendly name so renaming the receiver changes its id
  static DirectoryEntry make_entry(const DiscoveryRecord &drec) noexcept;

private:
  void upsert(const mdns::Record &rec) noexcept;

private:
  // order dependent
  Directory &directory;
  std::mutex &discovery_mtx;

public:
  static constexpr csv SERVICE_TYPE{"_googlecast._tcp"};
  static constexpr csv DEVICE_TYPE{"CastAudio"};
  static constexpr csv BRAND{"ChromeCast"};

  MOD_ID("disc.cast");
};

} // namespace discovery
} // namespace sconnect
