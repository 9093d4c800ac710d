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

#include "device/outcome.hpp"

#include <algorithm>

namespace sconnect {

const std::map<ProtocolOutcome::kind_t, string> ProtocolOutcome::names{
    {None, "none"},                       //
    {GetInfoError, "getInfoError"},       //
    {AddUserResponse, "addUserResponse"}, //
    {AddUserError, "addUserError"},       //
    {TransferSuccess, "transferSuccess"}, //
    {TransferError, "transferError"},     //
    {LaunchError, "launchError"}          //
};

ProtocolOutcome ProtocolOutcome::from_json(kind_t kind, JsonObjectConst payload) noexcept {
  ProtocolOutcome o;

  o.kind = kind;
  o.spotify_error = payload["spotifyError"] | 0;
  o.status = payload["status"] | 0;
  o.status_string = payload["statusString"] | "";
  o.response_source = string(kind_name(kind));

  return o;
}

ProtocolOutcome::kind_t ProtocolOutcome::kind_of(csv type) noexcept {
  auto it = std::find_if(names.begin(), names.end(),
                         [&](const auto &kv) { return kv.second == type; });

  return it != names.end() ? it->first : None;
}

csv ProtocolOutcome::kind_name(kind_t kind) noexcept {
  if (auto it = names.find(kind); it != names.end()) return it->second;

  return names.at(None);
}

} // namespace sconnect
