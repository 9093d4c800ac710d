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

#include "app.hpp"
#include "base/conf/cli_args.hpp"
#include "base/conf/fixed.hpp"
#include "base/conf/token.hpp"
#include "base/crypto.hpp"
#include "base/logger.hpp"
#include "base/threads.hpp"
#include "cast/tls_channel.hpp"
#include "daemon.hpp"
#include "directory/task.hpp"
#include "webapi/device_auth.hpp"
#include "webapi/rest.hpp"
#include "webapi/token.hpp"
#include "zc/connect.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

/// @brief sconnectd entry point
int main(int argc, char *argv[]) {
  using namespace sconnect;

  crypto::init();

  conf::cli_args(argc, argv);

  if (!conf::cli_args::nominal_start()) {
    if (conf::cli_args::error()) std::cout << conf::cli_args::error_msg() << std::endl;

    return conf::cli_args::help() ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  if (string err_msg; !conf::token::parse_file(conf::fixed::cfg_file(), err_msg)) {
    std::cout << err_msg << std::endl;
    return EXIT_FAILURE;
  }

  // detach before Avahi creates its poll thread and before the io_context exists
  Daemon daemon(conf::fixed::pid_file(), conf::fixed::force_restart());

  if (conf::fixed::daemon() && !daemon.detach()) {
    std::cout << daemon.error_msg() << std::endl;
    return EXIT_FAILURE;
  }

  App app;
  const auto rc = app.main();

  daemon.release();

  return rc;
}

////
//// App
////
namespace sconnect {

App::App() noexcept : ss_shutdown(io_ctx, SIGINT, SIGTERM) {

  // set up our shutdown signal handler
  ss_shutdown.async_wait([this](const error_code &ec, int sig) {
    INFO_AUTO_CAT("ss_shutdown");

    if (ec) return;

    INFO_AUTO("caught signal({}), requesting stop...", sig);

    thread.request_stop();
  });
}

int App::main() {
  INFO_AUTO_CAT("main");

  Logger::create(io_ctx);

  INFO_INIT("{} {} cfg_file={}", conf::fixed::app_name(), conf::fixed::git(),
            conf::fixed::cfg_file());

  // external collaborators
  webapi::FileToken tokens;
  webapi::Rest web(tokens);
  webapi::HttpDeviceAuth auth;
  zc::Connect zc;

  Task task({.web = web,
             .tokens = tokens,
             .auth = auth,
             .zc = zc,
             .channel_factory = []() { return std::make_unique<cast::TlsChannel>(); }});

  task.start();

  thread = std::jthread([this](std::stop_token stoken) {
    name_thread("sconnect_app");

    stop_request_watcher(std::move(stoken));

    io_ctx.run();
  });

  // the directory task signals once the initial discovery period is over
  task.wait_ready(30s);

  cli_requests(task);

  // one shot requests from the terminal exit once complete
  if (conf::fixed::one_shot() && !conf::fixed::daemon()) thread.request_stop();

  if (thread.joinable()) thread.join();

  INFO_AUTO("io_ctx finished, shutting down");

  task.shutdown();

  Logger::shutdown();

  return rc;
}

void App::cli_requests(Task &task) noexcept {
  INFO_AUTO_CAT("cli");

  try {
    if (conf::fixed::list()) {
      for (const auto &entry : task.get_devices(true)) {
        INFO_AUTO("{}", entry.inspect());
      }
    }

    if (const auto device = conf::fixed::activate(); !device.empty()) {
      const Task::Timeouts timeouts{.activation = conf::fixed::activation_timeout(),
                                    .transfer = conf::fixed::transfer_timeout()};

      task.activate_and_optionally_transfer(device, conf::fixed::transfer(), timeouts);

      INFO_AUTO("{} activated, sessions={}", device, task.session_count());
    }

    if (const auto device = conf::fixed::disconnect(); !device.empty()) {
      INFO_AUTO("{} disconnect {}", device, task.reset_users(device));
    }

    if (const auto device = conf::fixed::connect(); !device.empty()) {
      INFO_AUTO("{} connect {}", device, task.connect_user(device, task.credentials()));
    }

  } catch (const std::exception &e) {
    INFO_AUTO("request failed: {}", e.what());
    rc = 1;
  }
}

void App::stop_request_watcher(std::stop_token stoken) noexcept {

  auto sr_timer = std::make_unique<asio::system_timer>(io_ctx, 1s);

  sr_timer->expires_after(1s);
  sr_timer->async_wait([this, stoken = std::move(stoken),
                        sr_timer = std::move(sr_timer)](const error_code &ec) mutable {
    if (ec) return;

    if (stoken.stop_requested()) {
      asio::post(io_ctx, [this]() {
        INFO("stop_request", "detected");

        io_ctx.stop();
      });
    } else {
      stop_request_watcher(std::move(stoken));
    }
  });
}

} // namespace sconnect
