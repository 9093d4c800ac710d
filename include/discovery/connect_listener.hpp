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

#include "base/conf/token.hpp"
#include "base/dura_t.hpp"
#include "base/types.hpp"
#include "device/entry.hpp"
#include "directory/directory.hpp"
#include "mdns/listener.hpp"
#include "speaker/players.hpp"
#include "zc/api.hpp"

#include <mutex>

namespace sconnect {
namespace discovery {

/// @brief Native receivers (_spotify-connect._tcp): identity comes from the
///        receiver's getInfo endpoint
class ConnectListener : public mdns::Listener {
public:
  ConnectListener(Directory &directory, std::mutex &discovery_mtx, zc::Api &api,
                  speaker::Players &players) noexcept;

  csv service_type() const noexcept override { return SERVICE_TYPE; }

  void service_added(const mdns::Record &rec) override;
  void service_updated(const mdns::Record &rec) override;
  void service_removed(const mdns::Record &rec) override;

  /// @brief Build the entry for a discovery record, contacting the receiver.
  ///        getInfo is attempted by address then by host name; when both fail
  ///        the entry carries a diagnostic self description.
  DirectoryEntry describe(DiscoveryRecord drec) noexcept;

private:
  void upsert(const mdns::Record &rec) noexcept;

private:
  // order dependent
  conf::token tokc;
  Directory &directory;
  std::mutex &discovery_mtx;
  zc::Api &api;
  speaker::Players &players;
  const Millis resolve_timeout;

public:
  static constexpr csv SERVICE_TYPE{"_spotify-connect._tcp"};
  static constexpr csv RESPONSE_SOURCE{"sconnect"};

  MOD_ID("disc.connect");
};

} // namespace discovery
} // namespace sconnect
