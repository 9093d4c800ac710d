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

#include "webapi/token.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include <fmt/std.h>
#include <fstream>
#include <iterator>

namespace sconnect {
namespace webapi {

FileToken::FileToken() noexcept
    : tokc("webapi"), //
      path(tokc.val<string>("token_file", "/var/lib/sconnect/access_token")) {}

string FileToken::current_access_token() {
  INFO_AUTO_CAT("access_token");

  std::scoped_lock lck(mtx);

  if (!cached.empty()) return cached;

  std::ifstream ifs(path);
  if (!ifs.is_open()) throw Error(fmt::format("unable to open token file {}", path));

  string text{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
  boost::algorithm::trim(text);

  if (text.empty()) throw Error(fmt::format("token file {} is empty", path));

  INFO_AUTO("loaded token from {} len={}\n", path, text.size());

  cached = std::move(text);
  return cached;
}

void FileToken::refresh() {
  std::scoped_lock lck(mtx);

  cached.clear();
}

} // namespace webapi
} // namespace sconnect
