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

#include "daemon.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fmt/format.h>
#include <fmt/os.h>
#include <fmt/std.h>
#include <fstream>
#include <system_error>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace sconnect {

bool Daemon::detach() noexcept {
  if (!claim()) return false;

  sigset_t block;
  sigemptyset(&block);
  sigaddset(&block, SIGHUP);
  sigprocmask(SIG_BLOCK, &block, nullptr);

  if (syscall(SYS_close_range, 3, ~0U, 0) == -1) {
    err = fmt::format("close_range: {}", std::strerror(errno));
    return false;
  }

  // parent exits, child continues
  auto fork_child = [this](csv stage) {
    const auto pid = fork();

    if (pid > 0) std::exit(EXIT_SUCCESS);
    if (pid < 0) err = fmt::format("{} fork: {}", stage, std::strerror(errno));

    return pid == 0;
  };

  // the session leader forks again so the daemon never reacquires a terminal
  if (!fork_child("first")) return false;
  setsid();
  if (!fork_child("second")) return false;

  stdin = std::freopen("/dev/null", "r", stdin);
  stdout = std::freopen("/dev/null", "a+", stdout);
  stderr = std::freopen("/dev/null", "a+", stderr);

  umask(0);
  std::error_code ec;
  std::filesystem::current_path("/", ec);

  own_pid = getpid();

  try {
    auto os = fmt::output_file(pid_file.c_str(),
                               fmt::file::WRONLY | fmt::file::CREATE | fmt::file::TRUNC);
    os.print("{}", own_pid);
    os.close();
  } catch (const std::system_error &e) {
    err = fmt::format("{}: {}", pid_file, e.what());
    return false;
  }

  return true;
}

void Daemon::release() noexcept {
  if (own_pid == 0) return;

  if (stored_pid() == own_pid) unlink_file();
}

bool Daemon::claim() noexcept {
  if (!std::filesystem::exists(pid_file)) return true;

  const auto pid = stored_pid();

  if ((pid > 0) && (kill(pid, 0) == 0)) {
    if (!force_restart) {
      err = fmt::format("{} contains live pid {}, use --force-restart to restart", pid_file, pid);
      return false;
    }

    if (!stop_running(pid)) return false;
  }

  // stale (or just stopped) pid file
  return unlink_file();
}

bool Daemon::stop_running(pid_t pid) noexcept {
  for (auto attempt = 0; attempt < 3; attempt++) {
    kill(pid, SIGINT);

    if (kill(pid, 0) != 0) return true;

    sleep(1);
  }

  err = fmt::format("pid {} did not stop", pid);

  return false;
}

pid_t Daemon::stored_pid() const noexcept {
  pid_t pid{0};

  std::ifstream ifs(pid_file);
  if (ifs.is_open()) ifs >> pid;

  return pid;
}

bool Daemon::unlink_file() noexcept {
  std::error_code ec;

  if (!std::filesystem::remove(pid_file, ec) && ec) {
    err = fmt::format("failed to remove {}: {}", pid_file, ec.message());
    return false;
  }

  return true;
}

} // namespace sconnect
