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

#include "discovery/cast_listener.hpp"
#include "base/crypto.hpp"
#include "base/logger.hpp"

namespace sconnect {
namespace discovery {

void CastListener::service_added(const mdns::Record &rec) { upsert(rec); }
void CastListener::service_updated(const mdns::Record &rec) { upsert(rec); }

void CastListener::service_removed(const mdns::Record &rec) {
  INFO_AUTO_CAT("removed");

  std::scoped_lock lck(discovery_mtx);

  // group members share the group key, the instance name is stable
  if (!directory.remove_by_service_name(rec.full_name()).has_value()) {
    INFO_AUTO("unknown service={}\n", rec.full_name());
  }
}

DirectoryEntry CastListener::make_entry(const DiscoveryRecord &drec) noexcept { // static
  DirectoryEntry entry;

  auto &info = entry.info;
  info.device_id = crypto::md5_hex(drec.device_name);
  info.remote_name = drec.device_name;
  info.device_type = string(DEVICE_TYPE);
  info.brand_display_name = string(BRAND);
  info.is_group = drec.cast_type == DiscoveryRecord::CAST_GROUP;

  if (auto it = drec.properties.find("md"); it != drec.properties.end()) {
    info.model_display_name = it->second;
  }

  entry.discovery = drec;
  entry.id = info.device_id;
  entry.name = info.remote_name;

  return entry;
}

void CastListener::upsert(const mdns::Record &rec) noexcept {
  INFO_AUTO_CAT("upsert");

  std::scoped_lock lck(discovery_mtx);

  const auto drec = DiscoveryRecord::from_cast(rec);

  if (!drec.has_value()) {
    INFO_AUTO("ignoring {}\n", rec.inspect());
    return;
  }

  if (directory.find_by_service_name(drec->service_name).has_value()) {
    directory.update_discovery(drec->service_name, drec.value());
    return;
  }

  // every member of a group advertises the group, keep the first
  if ((drec->cast_type == DiscoveryRecord::CAST_GROUP) &&
      directory.find_by_key(drec->key).has_value()) {
    INFO_AUTO("group {} already known, ignoring {}\n", drec->device_name, drec->service_name);
    return;
  }

  directory.add_discovered(make_entry(drec.value()));
}

} // namespace discovery
} // namespace sconnect
