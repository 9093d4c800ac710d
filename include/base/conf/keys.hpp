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

namespace sconnect {
namespace conf {

struct key {
  static constexpr auto activate{"activate"};
  static constexpr auto activation_timeout{"activation-timeout"};
  static constexpr auto app_name{"app-name"};
  static constexpr auto cfg_file{"cfg-file"};
  static constexpr auto connect{"connect"};
  static constexpr auto daemon{"daemon"};
  static constexpr auto disconnect{"disconnect"};
  static constexpr auto force_restart{"force-restart"};
  static constexpr auto help{"help"};
  static constexpr auto list{"list"};
  static constexpr auto log_file{"log-file"};
  static constexpr auto pid_file{"pid-file"};
  static constexpr auto transfer{"transfer"};
  static constexpr auto transfer_timeout{"transfer-timeout"};
};

} // namespace conf
} // namespace sconnect
