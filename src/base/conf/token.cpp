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

#define TOML_IMPLEMENTATION

#include "base/conf/token.hpp"

#include <fmt/format.h>
#include <mutex>

namespace sconnect {
namespace conf {

// class static data
toml::table token::master;
std::shared_mutex token::master_mtx;

token::token(csv mid) noexcept {
  std::shared_lock lck(master_mtx);

  if (const auto *t = master[mid].as_table(); t != nullptr) {
    ttable = *t;
  }
}

bool token::parse_file(const string &file, string &err_msg) noexcept { // static
  err_msg.clear();

  try {
    auto parsed = toml::parse_file(file);

    std::unique_lock lck(master_mtx);
    master = std::move(parsed);

  } catch (const toml::parse_error &err) {
    err_msg = fmt::format("{} parse failed: {}", file, err.description());
  }

  return err_msg.empty();
}

bool token::parse_text(csv text) noexcept { // static
  try {
    auto parsed = toml::parse(text);

    std::unique_lock lck(master_mtx);
    master = std::move(parsed);

    return true;
  } catch (const toml::parse_error &) {
    return false;
  }
}

} // namespace conf
} // namespace sconnect
