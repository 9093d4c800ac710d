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

#include <filesystem>
#include <sys/types.h>

namespace sconnect {

/// @brief Detaches sconnectd from the controlling terminal and owns the pid file
class Daemon {
public:
  using fs_path = std::filesystem::path;

public:
  Daemon(fs_path pid_file, bool force_restart) noexcept
      : pid_file(std::move(pid_file)), force_restart(force_restart) {}

  /// @brief Claim the pid file, fork twice and record the daemon pid.
  ///        Must be called before any thread is created.
  /// @return false when another instance owns the pid file or fork failed
  bool detach() noexcept;

  /// @brief Remove the pid file when it still holds our pid
  void release() noexcept;

  const string &error_msg() const noexcept { return err; }

private:
  bool claim() noexcept;
  bool stop_running(pid_t pid) noexcept;
  pid_t stored_pid() const noexcept;
  bool unlink_file() noexcept;

private:
  // order dependent
  const fs_path pid_file;
  const bool force_restart;

  // order independent
  pid_t own_pid{0};
  string err;

public:
  MOD_ID("daemon");
};

} // namespace sconnect
