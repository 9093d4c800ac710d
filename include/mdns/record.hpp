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

#include <algorithm>
#include <optional>
#include <vector>

namespace sconnect {
namespace mdns {

class Txt;
using TxtList = std::vector<Txt>;

/// @brief One key/value pair from a resolved service TXT record
class Txt {
public:
  Txt(csv key, csv val) : key_string(key), val_string(val) {}

  const string &key() const noexcept { return key_string; }
  const string &val() const noexcept { return val_string; }

  bool operator==(const Txt &) const = default;

private:
  string key_string;
  string val_string;
};

/// @brief A resolved (or removed) multicast-DNS service instance
class Record {
public:
  struct Details {
    string name;     // service instance name (e.g. Office)
    string type;     // service type (e.g. _spotify-connect._tcp)
    string domain;   // e.g. local
    string hostname; // e.g. office-speaker.local
    string address;  // IPv4 address as text
    Port port{0};
    string protocol; // e.g. IPv4
    TxtList txt_list;
  };

public:
  Record() = default;
  Record(Details d) noexcept : d(std::move(d)) {}

  const string &address() const noexcept { return d.address; }
  const string &domain() const noexcept { return d.domain; }
  const string &hostname() const noexcept { return d.hostname; }
  const string &name() const noexcept { return d.name; }
  Port port() const noexcept { return d.port; }
  const string &protocol() const noexcept { return d.protocol; }
  const string &type() const noexcept { return d.type; }
  const TxtList &txt_list() const noexcept { return d.txt_list; }

  /// @brief Full service name (e.g. Office._spotify-connect._tcp.local.)
  string full_name() const noexcept;

  /// @brief Find a TXT value, keys are compared without regard to case
  /// @param key TXT key to find
  /// @return value or std::nullopt
  std::optional<string> txt_val(csv key) const noexcept;

  // misc debug
  string inspect() const noexcept;

private:
  Details d;

public:
  MOD_ID("mdns.record");
};

} // namespace mdns
} // namespace sconnect
