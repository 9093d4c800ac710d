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

#include "base/dura_t.hpp"
#include "base/types.hpp"

#include <filesystem>

namespace sconnect {
namespace conf {

/// @brief Helper class for access to global cli args, build and
///        runtime configuration.
///
///        **NOTE** Information only available after creation of cli_args static class
struct fixed {

  using fs_path = std::filesystem::path;

  /// @brief Device name to activate once discovery settles (empty when not requested)
  static string activate() noexcept;

  /// @brief Requested activation timeout, zero when not specified
  static Millis activation_timeout() noexcept;

  /// @brief Application name from CMakeList project definition (e.g. sconnect)
  /// @return constant string view
  static csv app_name() noexcept;

  /// @brief Full path and filename of the configuration file as determined
  ///        based on cli args (or default).
  /// @return modifiable string copy
  static string cfg_file() noexcept;

  /// @brief Native receiver to log the configured account into (empty when not requested)
  static string connect() noexcept;

  /// @brief Should this invocation of the application run as a daemon
  static bool daemon() noexcept;

  /// @brief Native receiver to sign every account out of (empty when not requested)
  static string disconnect() noexcept;

  /// @brief Should a running application be forcibly restarted?
  static bool force_restart() noexcept;

  /// @brief Git describe as determined at build time
  static string git() noexcept;

  /// @brief Should the directory be logged once discovery settles
  static bool list() noexcept;

  /// @brief A one shot request (--list, --activate, --connect or --disconnect) was made
  static bool one_shot() noexcept {
    return list() || !activate().empty() || !connect().empty() || !disconnect().empty();
  }

  /// @brief Log file path detemined using cli args or build default
  static fs_path log_file() noexcept;

  /// @brief Full path of pid file (e.g. /run/sconnect/sconnect.pid)
  static fs_path pid_file() noexcept;

  /// @brief Transfer playback after activation
  static bool transfer() noexcept;

  /// @brief Requested transfer timeout, zero when not specified
  static Millis transfer_timeout() noexcept;
};

} // namespace conf
} // namespace sconnect
