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

#include "device/discovery_record.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <charconv>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iterator>

namespace sconnect {

static bool is_supported_cast_type(csv cast_type) noexcept {
  return (cast_type == DiscoveryRecord::CAST_AUDIO) || (cast_type == DiscoveryRecord::CAST_GROUP) ||
         (cast_type == DiscoveryRecord::CAST_CAST) || (cast_type == DiscoveryRecord::CAST_NONE);
}

static DiscoveryRecord::Properties make_properties(const mdns::Record &rec) noexcept {
  DiscoveryRecord::Properties props;

  for (const auto &txt : rec.txt_list()) {
    props.insert_or_assign(txt.key(), txt.val());
  }

  return props;
}

DiscoveryRecord DiscoveryRecord::from_native(const mdns::Record &rec) noexcept {
  DiscoveryRecord dr;

  dr.device_name = rec.name();
  dr.service_name = rec.full_name();
  dr.key = boost::algorithm::to_lower_copy(dr.service_name);
  dr.server = rec.hostname();
  if (!rec.address().empty()) dr.addresses.emplace_back(rec.address());
  dr.port = rec.port();
  dr.service_type = rec.type();
  dr.cpath = rec.txt_val("CPath").value_or(string());
  dr.version = rec.txt_val("VERSION").value_or(string());
  dr.properties = make_properties(rec);

  return dr;
}

std::optional<DiscoveryRecord> DiscoveryRecord::from_cast(const mdns::Record &rec) noexcept {
  DiscoveryRecord dr;

  dr.cast_type = make_cast_type(rec.txt_val("md").value_or(string()),  //
                                rec.txt_val("ca").value_or(string())); //

  if (!is_supported_cast_type(dr.cast_type)) return std::nullopt;

  dr.key = rec.txt_val("id").value_or(string());
  if (dr.key.empty()) return std::nullopt;

  dr.device_name = rec.txt_val("fn").value_or(rec.name());
  dr.service_name = rec.full_name();
  dr.server = rec.hostname();
  if (!rec.address().empty()) dr.addresses.emplace_back(rec.address());
  dr.port = rec.port();
  dr.service_type = rec.type();
  dr.cpath = "/na";
  dr.version = "1.0";
  dr.properties = make_properties(rec);
  dr.properties.insert_or_assign("cast_type", dr.cast_type);
  dr.is_cast = true;

  return dr;
}

string DiscoveryRecord::make_cast_type(csv model, csv capabilities) noexcept {
  if (model == CAST_GROUP_MODEL) return string(CAST_GROUP);

  // ca is a capability bitmask, bit 0 is video out
  int64_t ca{0};
  auto [p, ec] = std::from_chars(capabilities.data(), capabilities.data() + capabilities.size(), ca);

  // unknown capabilities, treated as audio capable downstream
  if (capabilities.empty() || (ec != std::errc())) return string(CAST_NONE);

  return string((ca & 0x01) ? CAST_CAST : CAST_AUDIO);
}

string DiscoveryRecord::inspect() const noexcept {
  string msg;
  auto w = std::back_inserter(msg);

  fmt::format_to(w, "name={} key={} server={} port={} ", device_name, key, server, port);

  if (is_cast) {
    fmt::format_to(w, "cast_type={} ", cast_type);
  } else if (is_dynamic()) {
    fmt::format_to(w, "dynamic ");
  } else {
    fmt::format_to(w, "cpath={} version={} ", cpath, version);
  }

  fmt::format_to(w, "addrs={}", fmt::join(addresses, ","));

  return msg;
}

} // namespace sconnect
