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

#include "base/conf/fixed.hpp"
#include "base/conf/cli_args.hpp"
#include "base/conf/keys.hpp"
#include "build_inject.hpp"

#include <filesystem>

namespace sconnect {
namespace conf {

using fs_path = std::filesystem::path;

string fixed::activate() noexcept { return cli_args::ttable[key::activate].value_or(string()); }

Millis fixed::activation_timeout() noexcept {
  return Millis(cli_args::ttable[key::activation_timeout].value_or(int64_t{0}));
}

csv fixed::app_name() noexcept { return build::info.project; }

string fixed::cfg_file() noexcept { return cli_args::ttable[key::cfg_file].value_or(string()); }

string fixed::connect() noexcept { return cli_args::ttable[key::connect].value_or(string()); }

bool fixed::daemon() noexcept { return cli_args::ttable[key::daemon].value_or(false); }

string fixed::disconnect() noexcept {
  return cli_args::ttable[key::disconnect].value_or(string());
}

bool fixed::force_restart() noexcept {
  return cli_args::ttable[key::force_restart].value_or(false);
}

string fixed::git() noexcept { return build::info.git; }

bool fixed::list() noexcept { return cli_args::ttable[key::list].value_or(false); }

fs_path fixed::log_file() noexcept {
  return cli_args::ttable[key::log_file].value_or(string("/dev/stdout"));
}

fs_path fixed::pid_file() noexcept { return cli_args::ttable[key::pid_file].value_or(string()); }

bool fixed::transfer() noexcept { return cli_args::ttable[key::transfer].value_or(false); }

Millis fixed::transfer_timeout() noexcept {
  return Millis(cli_args::ttable[key::transfer_timeout].value_or(int64_t{0}));
}

} // namespace conf
} // namespace sconnect
