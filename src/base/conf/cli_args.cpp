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

#include "base/conf/cli_args.hpp"
#include "base/conf/fixed.hpp"
#include "base/conf/keys.hpp"
#include "base/conf/toml.hpp"
#include "base/types.hpp"
#include "build_inject.hpp"

#include <boost/program_options.hpp>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/std.h>
#include <iostream>
#include <sstream>

namespace sconnect {
namespace conf {

namespace po = boost::program_options;
namespace fs = std::filesystem;

using fs_path = fs::path;

// there will only ever be a single collection of cli args per invocation
static po::options_description desc("sconnectd");
static po::variables_map args;

constexpr auto def_cfg_toml_file{"live.toml"};
constexpr auto def_daemon{false};
static const string def_log_file{"/var/log/sconnect/sconnect.log"};
constexpr auto def_pid_file{"/run/sconnect/sconnect.pid"};
constexpr auto def_restart{false};

constexpr auto desc_activate{"activate the spotify cast app on this device"};
constexpr auto desc_activation_timeout{"activation timeout in ms (15000-30000)"};
constexpr auto desc_cfg_file{"toml configuration file"};
constexpr auto desc_connect{"log the configured account into this native receiver"};
constexpr auto desc_daemon{"detach and run in background"};
constexpr auto desc_disconnect{"sign every account out of this native receiver"};
constexpr auto desc_help{"command line help"};
constexpr auto desc_list{"log the device directory once discovery settles"};
constexpr auto desc_log_file{"full path to log file"};
constexpr auto desc_pid_file{"full path to pid file"};
constexpr auto desc_restart{"force restart (if running)"};
constexpr auto desc_transfer{"transfer playback to the activated device"};
constexpr auto desc_transfer_timeout{"transfer timeout in ms (10000-20000)"};
constexpr auto opt_help{"help"};

// class static data
toml::table cli_args::ttable;
string cli_args::error_str;
bool cli_args::help_requested{false};
std::ostringstream cli_args::help_ss;

cli_args::cli_args(int argc, char **argv) noexcept {
  ttable.insert_or_assign(key::app_name, fs_path(argv[0]).filename().string());

  fs_path def_cfg_fs_file(build::info.sysconf_dir);
  def_cfg_fs_file /= def_cfg_toml_file;

  auto cfg_file_v = po::value<string>()
                        ->notifier([](const string p) {
                          fs_path p_fs(p);

                          if (p_fs.is_absolute()) {
                            ttable.insert_or_assign(key::cfg_file, p);
                          } else {
                            p_fs = fs_path(build::info.sysconf_dir).append(p);

                            ttable.insert_or_assign(key::cfg_file, p_fs.string());
                          }
                        })
                        ->default_value(def_cfg_fs_file.string());

  auto daemon_v = po::bool_switch()
                      ->notifier([](bool e) { ttable.insert_or_assign(key::daemon, e); })
                      ->default_value(def_daemon);

  auto restart_v = po::bool_switch()
                       ->notifier([](bool e) { ttable.insert_or_assign(key::force_restart, e); })
                       ->default_value(def_restart);

  auto pid_file_v = po::value<string>()
                        ->notifier([](const string f) { ttable.insert_or_assign(key::pid_file, f); })
                        ->default_value(def_pid_file);

  auto log_file_v = po::value<string>()
                        ->notifier([](const string f) { ttable.insert_or_assign(key::log_file, f); })
                        ->default_value(def_log_file);

  auto activate_v = po::value<string>()
                        ->notifier([](const string d) { ttable.insert_or_assign(key::activate, d); })
                        ->default_value(string());

  auto connect_v = po::value<string>()
                       ->notifier([](const string d) { ttable.insert_or_assign(key::connect, d); })
                       ->default_value(string());

  auto disconnect_v =
      po::value<string>()
          ->notifier([](const string d) { ttable.insert_or_assign(key::disconnect, d); })
          ->default_value(string());

  auto transfer_v = po::bool_switch()
                        ->notifier([](bool e) { ttable.insert_or_assign(key::transfer, e); })
                        ->default_value(false);

  // zero selects the value from the configuration file
  auto activation_ms_v =
      po::value<int64_t>()
          ->notifier([](int64_t ms) { ttable.insert_or_assign(key::activation_timeout, ms); })
          ->default_value(0);

  auto transfer_ms_v =
      po::value<int64_t>()
          ->notifier([](int64_t ms) { ttable.insert_or_assign(key::transfer_timeout, ms); })
          ->default_value(0);

  auto list_v = po::bool_switch()
                    ->notifier([](bool e) { ttable.insert_or_assign(key::list, e); })
                    ->default_value(false);

  auto help_v = po::bool_switch()
                    ->notifier([](bool e) { ttable.insert_or_assign(key::help, e); })
                    ->default_value(false);

  desc.add_options()                                                      //
      (key::cfg_file, cfg_file_v, desc_cfg_file)                          //
      (key::daemon, daemon_v, desc_daemon)                                //
      (key::force_restart, restart_v, desc_restart)                       //
      (key::pid_file, pid_file_v, desc_pid_file)                          //
      (key::log_file, log_file_v, desc_log_file)                          //
      (key::activate, activate_v, desc_activate)                          //
      (key::activation_timeout, activation_ms_v, desc_activation_timeout) //
      (key::transfer, transfer_v, desc_transfer)                          //
      (key::transfer_timeout, transfer_ms_v, desc_transfer_timeout)       //
      (key::connect, connect_v, desc_connect)                             //
      (key::disconnect, disconnect_v, desc_disconnect)                    //
      (key::list, list_v, desc_list)                                      //
      (opt_help, help_v, desc_help);                                      //

  try {
    po::store(po::parse_command_line(argc, argv, desc), args);
    po::notify(args);

  } catch (const po::error &ex) {
    error_str = fmt::format("bad args: {}", ex.what());
    return;
  }

  if (fixed::transfer() && fixed::activate().empty()) {
    error_str = "--transfer requires --activate";
    return;
  }

  if (ttable[key::help].value_or(false)) {
    help_requested = true;

    desc.print(help_ss);
    std::cout << help_ss.str();
  }

  if (!fs::exists(conf::fixed::cfg_file())) {
    error_str = fmt::format("{}: not found", conf::fixed::cfg_file());
  }
}

} // namespace conf
} // namespace sconnect
