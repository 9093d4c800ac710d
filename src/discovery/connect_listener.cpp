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

#include "discovery/connect_listener.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "http/client.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <exception>
#include <fmt/format.h>

namespace sconnect {
namespace discovery {

ConnectListener::ConnectListener(Directory &directory, std::mutex &discovery_mtx, zc::Api &api,
                                 speaker::Players &players) noexcept
    : tokc("connect"),                                     //
      directory(directory),                                //
      discovery_mtx(discovery_mtx),                        //
      api(api),                                            //
      players(players),                                    //
      resolve_timeout(tokc.timeout_val("resolve", 3s)) {}

void ConnectListener::service_added(const mdns::Record &rec) { upsert(rec); }
void ConnectListener::service_updated(const mdns::Record &rec) { upsert(rec); }

void ConnectListener::service_removed(const mdns::Record &rec) {
  INFO_AUTO_CAT("removed");

  std::scoped_lock lck(discovery_mtx);

  const auto key = boost::algorithm::to_lower_copy(rec.full_name());

  if (auto removed = directory.remove_by_key(key); removed.has_value()) {
    if (removed->info.is_sonos()) players.remove(removed->discovery.host_address());
  } else {
    INFO_AUTO("unknown key={}\n", key);
  }
}

DirectoryEntry ConnectListener::describe(DiscoveryRecord drec) noexcept {
  INFO_AUTO_CAT("describe");

  DirectoryEntry entry;
  string failure;

  try {
    entry.info = api.get_info(zc::Endpoint::make(drec, drec.host_address()));
  } catch (const std::exception &e) {
    failure = e.what();
    INFO_AUTO("{} by address failed: {}\n", drec.device_name, failure);
  }

  // some receivers only answer on the advertised host name
  if (!failure.empty() && !drec.server.empty()) {
    try {
      entry.info = api.get_info(zc::Endpoint::make(drec, drec.server));
      failure.clear();

      try {
        drec.addresses.emplace_back(http::Client::resolve_address(drec.server, resolve_timeout));
      } catch (const std::exception &e) {
        INFO_AUTO("{} address of {} unknown: {}\n", drec.device_name, drec.server, e.what());
      }
    } catch (const std::exception &e) {
      failure = e.what();
      INFO_AUTO("{} by host name failed: {}\n", drec.device_name, failure);
    }
  }

  if (!failure.empty()) {
    // keep the receiver visible with a diagnostic self description
    auto &info = entry.info;
    info.device_id = string(Directory::GET_INFO_ERROR);
    info.remote_name = drec.device_name;
    info.response_source = string(RESPONSE_SOURCE);
    info.status = SelfDescription::STATUS_GET_INFO_FAILED;
    info.status_string = failure;
  }

  entry.discovery = std::move(drec);
  entry.name = entry.info.display_name();
  entry.id = entry.info.device_id;

  return entry;
}

void ConnectListener::upsert(const mdns::Record &rec) noexcept {
  INFO_AUTO_CAT("upsert");

  std::scoped_lock lck(discovery_mtx);

  auto drec = DiscoveryRecord::from_native(rec);

  if (directory.find_by_service_name(drec.service_name).has_value()) {
    if (directory.update_discovery(drec.service_name, drec)) {
      INFO_AUTO("updated {}\n", drec.inspect());
    }

    return;
  }

  auto entry = describe(std::move(drec));

  if (entry.info.is_sonos()) players.add(entry.discovery.host_address());

  INFO_AUTO("{}\n", entry.inspect());

  directory.add_discovered(std::move(entry));
}

} // namespace discovery
} // namespace sconnect
