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

#include "mdns/record.hpp"

#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>
#include <iterator>

namespace sconnect {
namespace mdns {

string Record::full_name() const noexcept {
  return fmt::format("{}.{}.{}.", d.name, d.type, d.domain.empty() ? "local" : d.domain);
}

std::optional<string> Record::txt_val(csv key) const noexcept {
  auto it = std::find_if(d.txt_list.begin(), d.txt_list.end(),
                         [=](const Txt &txt) { return boost::iequals(txt.key(), key); });

  if (it != d.txt_list.end()) return it->val();

  return std::nullopt;
}

string Record::inspect() const noexcept {
  string msg;
  auto w = std::back_inserter(msg);

  fmt::format_to(w, "{} {} {} {} {}:{} TXT: ", d.type, d.hostname, d.name, d.protocol, d.address,
                 d.port);

  std::for_each(d.txt_list.begin(), d.txt_list.end(),
                [&w](const Txt &txt) { fmt::format_to(w, "{}={} ", txt.key(), txt.val()); });

  return msg;
}

} // namespace mdns
} // namespace sconnect
