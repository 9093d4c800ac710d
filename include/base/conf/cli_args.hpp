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

#include "base/conf/keys.hpp"
#include "base/conf/toml.hpp"
#include "base/types.hpp"

#include <sstream>

namespace sconnect {
namespace conf {

/// @brief Command line arguments of sconnectd, parsed once into a toml table
///        and read back through conf::fixed
struct cli_args {
  friend struct fixed;

  cli_args(int argc, char **argv) noexcept;

  static bool error() noexcept { return !error_str.empty(); }
  static const string &error_msg() noexcept { return error_str; }

  /// @brief --help was requested, the usage has already been printed
  static bool help() noexcept { return help_requested; }

  /// @brief Arguments parsed, help not requested and the config file exists
  static bool nominal_start() noexcept { return !help_requested && error_str.empty(); }

protected:
  static toml::table ttable;

private:
  static string error_str;
  static bool help_requested;
  static std::ostringstream help_ss;
};

} // namespace conf
} // namespace sconnect
