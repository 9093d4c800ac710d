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

/*
 * Unit tests for src/directory/task.cpp
 */

#include "base/conf/token.hpp"
#include "base/crypto.hpp"
#include "base/error.hpp"
#include "directory/task.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace sconnect;

namespace {

struct TaskFixture : public ::testing::Test {
  test::FakeWeb web;
  test::FakeTokens tokens;
  test::FakeAuth auth;
  test::FakeZc zc;
  test::FakeFactory speakers;
  test::FakeChannel::Script script{
      .get_info_reply = test::get_info_response("real-id", "Kitchen"),
      .add_user_reply = test::add_user_response("user-9")};

  std::unique_ptr<Task> task;

  void SetUp() override {
    task = std::make_unique<Task>(Task::Collaborators{
        .web = web,
        .tokens = tokens,
        .auth = auth,
        .zc = zc,
        .channel_factory = [this]() { return std::make_unique<test::FakeChannel>(script); },
        .speakers = &speakers});
  }

  void TearDown() override { task.reset(); }

  SelfDescription info(csv id, csv name, csv brand = "Bose") {
    SelfDescription sd;

    sd.device_id = string(id);
    sd.remote_name = string(name);
    sd.brand_display_name = string(brand);
    sd.status = SelfDescription::STATUS_OK;

    return sd;
  }
};

/// @brief Task constructed after the directory section was configured
struct ConfiguredTaskFixture : public TaskFixture {
  void SetUp() override {
    ASSERT_TRUE(conf::token::parse_text(R"(
[directory]
default_device = "Office"
login_id = "listener"
user_name = "listener"
password = "pass-phrase"
zeroconf = false
)"));

    TaskFixture::SetUp();
  }

  void TearDown() override {
    TaskFixture::TearDown();

    conf::token::parse_text("");
  }
};

/// @brief Refreshes from the Web API whenever discovery adds a device
struct RefreshingObserver : public Observer {
  explicit RefreshingObserver(Task &task) : task(task) {}

  void device_added(const DirectoryEntry &) override {
    ++added;
    seen = task.get_devices(true).size();
  }

  void device_removed(const DirectoryEntry &) override {}
  void device_updated(const DirectoryEntry &) override {}

  Task &task;
  int added{0};
  size_t seen{0};
};

} // namespace

TEST(TaskTimeouts, Clamped) {
  EXPECT_EQ(Task::clamp_activation(Millis(0), Millis(15000)), Millis(15000));
  EXPECT_EQ(Task::clamp_activation(Millis(1000), Millis(15000)), Millis(15000));
  EXPECT_EQ(Task::clamp_activation(Millis(60000), Millis(15000)), Millis(30000));
  EXPECT_EQ(Task::clamp_activation(Millis(20000), Millis(15000)), Millis(20000));

  EXPECT_EQ(Task::clamp_transfer(Millis(0), Millis(10000)), Millis(10000));
  EXPECT_EQ(Task::clamp_transfer(Millis(500), Millis(10000)), Millis(10000));
  EXPECT_EQ(Task::clamp_transfer(Millis(45000), Millis(10000)), Millis(20000));
}

TEST_F(TaskFixture, OfficeScenario) {
  zc.infos["10.0.0.5"] = info("D1", "Office");

  task->connect_listener().service_added(test::native_record("Office", "10.0.0.5"));

  const auto e = task->get_device("Office");
  ASSERT_TRUE(e.has_value());
  EXPECT_EQ(e->id, "D1");

  task->connect_listener().service_removed(
      mdns::Record({.name = "Office", .type = "_spotify-connect._tcp", .domain = "local"}));

  EXPECT_FALSE(task->get_device("Office", false, false).has_value());
  EXPECT_THROW(task->get_device("Office"), ResolutionError);
}

TEST_F(TaskFixture, RefreshMarksActiveAndListed) {
  zc.infos["10.0.0.5"] = info("D1", "Office");
  task->connect_listener().service_added(test::native_record("Office", "10.0.0.5"));

  web.devices = {RemoteDevice{.id = "D1", .name = "Office", .type = "Speaker", .is_active = true},
                 RemoteDevice{.id = "P1", .name = "Phone", .type = "Smartphone"}};
  web.state.device = web.devices.front();
  web.state.is_playing = true;

  const auto all = task->get_devices(true);
  ASSERT_EQ(all.size(), 2u);

  const auto active = task->get_active_device();
  ASSERT_TRUE(active.has_value());
  EXPECT_EQ(active->id, "D1");
  EXPECT_TRUE(active->is_listed);

  EXPECT_EQ(task->get_device("")->id, "D1");
  EXPECT_EQ(task->get_player_device("phone")->id, "P1");

  // the phone leaves the device list
  web.devices.pop_back();
  task->refresh();
  EXPECT_FALSE(task->get_device("Phone", false, false).has_value());
}

TEST_F(TaskFixture, ObserverQueriesDuringDiscovery) {
  web.devices = {RemoteDevice{.id = "P1", .name = "Phone", .type = "Smartphone"}};

  RefreshingObserver obs(*task);
  task->subscribe(&obs);

  zc.infos["10.0.0.5"] = info("D1", "Office");
  task->connect_listener().service_added(test::native_record("Office", "10.0.0.5"));
  task->cast_listener().service_added(test::cast_record("Nest-1", "k1", "Kitchen", "10.0.0.9"));

  task->unsubscribe(&obs);

  // Office, Phone (added by the refresh) and Kitchen
  EXPECT_GE(obs.added, 2);
  EXPECT_EQ(obs.seen, 3u);
  EXPECT_TRUE(task->get_device("P1", false).has_value());
}

TEST_F(TaskFixture, ImplicitActiveDevice) {
  zc.infos["10.0.0.5"] = info("D1", "Office");
  zc.infos["10.0.0.6"] = info("D2", "Den");
  task->connect_listener().service_added(test::native_record("Office", "10.0.0.5"));
  task->connect_listener().service_added(test::native_record("Den", "10.0.0.6", "den.local"));

  // playback moved to the den without an explicit refresh
  web.state.device = RemoteDevice{.id = "D2", .name = "Den", .is_active = true};

  EXPECT_EQ(task->get_device("", false)->id, "D2");
  EXPECT_EQ(task->get_active_device()->id, "D2");

  web.state.device.reset();
  EXPECT_FALSE(task->get_active_device().has_value());
  EXPECT_THROW(task->get_device("", false), ResolutionError);
}

TEST_F(TaskFixture, DynamicDevices) {
  task->add_dynamic_device(RemoteDevice{.id = "W1", .name = "Web Player (Microsoft Edge)"});

  const auto e = task->get_device("W1", false);
  ASSERT_TRUE(e.has_value());
  EXPECT_EQ(e->info.brand_display_name, "Microsoft");
  EXPECT_EQ(e->info.product_id, "Web Player");

  EXPECT_EQ(task->remove_device("w1", true), 1u);
  EXPECT_FALSE(task->get_device("W1", false, false).has_value());
}

TEST_F(TaskFixture, ActivateCastReceiver) {
  task->cast_listener().service_added(test::cast_record("Nest-1", "k1", "Kitchen", "10.0.0.9"));

  ASSERT_NO_THROW(task->activate_and_optionally_transfer("Kitchen", false));
  EXPECT_EQ(task->session_count(), 1u);

  const auto e = task->get_device("real-id");
  ASSERT_TRUE(e.has_value());
  EXPECT_EQ(e->info.active_user, "user-9");

  // a second activation replaces the running session
  ASSERT_NO_THROW(task->activate_and_optionally_transfer("real-id", false));
  EXPECT_EQ(task->session_count(), 1u);

  task->shutdown();
  EXPECT_EQ(task->session_count(), 0u);
}

TEST_F(TaskFixture, ActivateFailures) {
  zc.infos["10.0.0.5"] = info("D1", "Office");
  task->connect_listener().service_added(test::native_record("Office", "10.0.0.5"));

  EXPECT_THROW(task->activate_and_optionally_transfer("Garage", false), ResolutionError);
  EXPECT_THROW(task->activate_and_optionally_transfer("", false), ResolutionError);
  EXPECT_THROW(task->activate_and_optionally_transfer("  ", false), ResolutionError);
  EXPECT_THROW(task->activate_and_optionally_transfer("Office", false), ActivationError);

  script.add_user_reply = test::error_reply("addUserError", 203, "bad", 12);
  task->cast_listener().service_added(test::cast_record("Nest-1", "k1", "Kitchen", "10.0.0.9"));

  EXPECT_THROW(task->activate_and_optionally_transfer("Kitchen", false), ProtocolError);
  EXPECT_EQ(task->session_count(), 0u);
}

TEST_F(TaskFixture, ZeroconfAddUserAndReset) {
  zc.infos["10.0.0.5"] = info("D1", "Office");
  task->connect_listener().service_added(test::native_record("Office", "10.0.0.5"));

  const auto outcome = task->add_user("Office", zc::AddUser{.user_name = "listener",
                                                            .blob = "blob",
                                                            .client_key = "key"});

  EXPECT_EQ(outcome.kind, ProtocolOutcome::AddUserResponse);
  ASSERT_EQ(zc.added.size(), 1u);
  EXPECT_EQ(zc.added.front().user_name, "listener");
  EXPECT_EQ(zc.hosts.back(), "10.0.0.5");

  EXPECT_EQ(task->get_device("D1")->outcome.kind, ProtocolOutcome::AddUserResponse);

  zc.add_user_status = 203;
  EXPECT_THROW(task->add_user("D1", zc::AddUser{.blob = "blob"}), ProtocolError);

  const auto failed = task->get_device("D1")->outcome;
  EXPECT_EQ(failed.kind, ProtocolOutcome::AddUserError);
  EXPECT_EQ(failed.status, 203);
  EXPECT_EQ(failed.spotify_error, 12);

  EXPECT_TRUE(task->reset_users("office").is_ok());
  EXPECT_EQ(zc.resets, 1);
}

TEST_F(TaskFixture, ConnectUserBuildsBlob) {
  crypto::init();

  auto sd = info("D1", "Office");
  sd.public_key = zc::DhKeys(uint8v(zc::DhKeys::private_key_len, 0x5a)).public_key_b64();
  zc.infos["10.0.0.5"] = sd;
  task->connect_listener().service_added(test::native_record("Office", "10.0.0.5"));

  const string pw{"secret"};
  const zc::Credentials creds{.user_name = "listener", .password = uint8v(pw.begin(), pw.end())};

  const auto outcome = task->connect_user("Office", creds);

  EXPECT_EQ(outcome.kind, ProtocolOutcome::AddUserResponse);
  EXPECT_EQ(zc.resets, 1);
  ASSERT_EQ(zc.added.size(), 1u);

  const auto &req = zc.added.front();
  EXPECT_EQ(req.user_name, "listener");
  EXPECT_EQ(req.token_type, "default");
  EXPECT_FALSE(req.client_key.empty());
  EXPECT_EQ(crypto::base64_decode(req.blob).size(), 16u + 44u + 20u);
  EXPECT_TRUE(req.device_id.empty());

  // without a reset only addUser is sent
  task->connect_user("D1", creds, false);
  EXPECT_EQ(zc.resets, 1);
  EXPECT_EQ(zc.added.size(), 2u);

  EXPECT_THROW(task->connect_user("D1", zc::Credentials{}), ActivationError);
  EXPECT_THROW(task->connect_user("Garage", creds), ResolutionError);
}

TEST_F(TaskFixture, ConnectUserReceiverNotLoaded) {
  auto sd = info("D1", "Office");
  sd.public_key = "SU5WQUxJRA==";
  sd.availability = "NOT-LOADED";
  zc.infos["10.0.0.5"] = sd;
  task->connect_listener().service_added(test::native_record("Office", "10.0.0.5"));

  task->connect_user("Office", zc::Credentials{.user_name = "listener"}, false);

  ASSERT_EQ(zc.added.size(), 1u);
  const auto &req = zc.added.front();
  EXPECT_TRUE(req.blob.empty());
  EXPECT_TRUE(req.client_key.empty());
  EXPECT_EQ(req.device_name, "sconnect");
  EXPECT_EQ(req.device_id, zc::BlobBuilder::origin_device_id());
}

TEST_F(TaskFixture, ConnectUserAuthorizationCode) {
  auto sd = info("D1", "Office");
  sd.token_type = "authorization_code";
  zc.infos["10.0.0.5"] = sd;
  task->connect_listener().service_added(test::native_record("Office", "10.0.0.5"));

  task->connect_user("Office", zc::Credentials{.user_name = "listener"}, false);

  ASSERT_EQ(zc.added.size(), 1u);
  EXPECT_EQ(zc.added.front().blob, "account-token");
  EXPECT_EQ(zc.added.front().token_type, "authorization_code");
  EXPECT_TRUE(zc.added.front().client_key.empty());
}

TEST_F(TaskFixture, ConnectUserRetriesAfterKeyRefusal) {
  crypto::init();

  auto sd = info("D1", "Office");
  sd.public_key = "SU5WQUxJRA==";
  sd.availability = "NOT-LOADED";
  zc.infos["10.0.0.5"] = sd;
  task->connect_listener().service_added(test::native_record("Office", "10.0.0.5"));

  zc.key_refusals = 1;

  const auto outcome = task->connect_user("Office", zc::Credentials{.user_name = "listener"}, false);

  EXPECT_EQ(outcome.kind, ProtocolOutcome::AddUserResponse);
  EXPECT_EQ(zc.added.size(), 2u);
  EXPECT_EQ(task->get_device("D1", false)->outcome.kind, ProtocolOutcome::AddUserResponse);

  // a second refusal is reported
  zc.infos["10.0.0.5"].availability = "NOT-LOADED";
  zc.key_refusals = 2;
  EXPECT_THROW(task->connect_user("Office", zc::Credentials{.user_name = "listener"}, false),
               ProtocolError);
}

TEST_F(ConfiguredTaskFixture, ConfiguredCredentials) {
  const auto creds = task->credentials();

  EXPECT_EQ(creds.user_name, "listener");
  EXPECT_EQ(string(creds.password.begin(), creds.password.end()), "pass-phrase");
  EXPECT_EQ(creds.auth_type, zc::Credentials::UserPass);
}

TEST_F(TaskFixture, ZeroconfRequiresNativeReceiver) {
  task->cast_listener().service_added(test::cast_record("Nest-1", "k1", "Kitchen", "10.0.0.9"));
  task->add_dynamic_device(RemoteDevice{.id = "P1", .name = "Phone"});

  EXPECT_THROW(task->reset_users("Kitchen"), ActivationError);
  EXPECT_THROW(task->add_user("Phone", zc::AddUser{}), ActivationError);
  EXPECT_THROW(task->reset_users("Garage"), ResolutionError);
  EXPECT_EQ(zc.resets, 0);
}

TEST_F(TaskFixture, SonosPlayer) {
  auto member = std::make_shared<test::FakePlayer>("Patio", "10.0.0.21", false);
  auto coordinator = std::make_shared<test::FakePlayer>("Living Room", "10.0.0.20", true);
  member->group_coordinator = coordinator;

  auto orphan = std::make_shared<test::FakePlayer>("Garage", "10.0.0.22", false);

  speakers.players["10.0.0.21"] = member;
  speakers.players["10.0.0.22"] = orphan;

  zc.infos["10.0.0.21"] = info("S1", "Patio", "Sonos");
  zc.infos["10.0.0.22"] = info("S2", "Garage", "Sonos");
  task->connect_listener().service_added(test::native_record("Patio", "10.0.0.21", "patio.local"));
  task->connect_listener().service_added(test::native_record("Garage", "10.0.0.22", "garage.local"));

  const auto patio = task->get_device("Patio").value();
  EXPECT_EQ(task->sonos_player(patio, true)->name(), "Living Room");
  EXPECT_EQ(task->sonos_player(patio, false)->name(), "Patio");

  // orphaned group, the member itself is used
  const auto garage = task->get_device("Garage").value();
  EXPECT_EQ(task->sonos_player(garage, true)->name(), "Garage");

  zc.infos["10.0.0.23"] = info("B1", "Bose", "Bose");
  task->connect_listener().service_added(test::native_record("Bose", "10.0.0.23", "bose.local"));
  EXPECT_THROW(task->sonos_player(task->get_device("Bose").value(), true), ResolutionError);
}

TEST_F(TaskFixture, DiscoveryConcurrentWithQueries) {
  for (int i = 0; i < 10; i++) {
    zc.infos[fmt::format("10.0.1.{}", i)] = info(fmt::format("N{}", i), fmt::format("native{}", i));
  }

  std::vector<std::jthread> threads;

  threads.emplace_back([this]() {
    for (int round = 0; round < 20; round++) {
      for (int i = 0; i < 10; i++) {
        const auto name = fmt::format("native{}", i);
        task->connect_listener().service_added(
            test::native_record(name, fmt::format("10.0.1.{}", i), ""));

        if ((i % 2) == 0) {
          task->connect_listener().service_removed(mdns::Record(
              {.name = name, .type = "_spotify-connect._tcp", .domain = "local"}));
        }
      }
    }
  });

  threads.emplace_back([this]() {
    for (int round = 0; round < 20; round++) {
      for (int i = 0; i < 10; i++) {
        task->cast_listener().service_added(test::cast_record(
            fmt::format("Nest-{}", i), fmt::format("k{}", i), fmt::format("cast{}", i),
            fmt::format("10.0.2.{}", i)));
      }
    }
  });

  threads.emplace_back([this]() {
    for (int round = 0; round < 200; round++) {
      for (const auto &e : task->get_devices()) {
        [[maybe_unused]] auto found = task->get_device(e.id, false, false);
      }
    }
  });

  for (auto &t : threads) t.join();

  const auto all = task->get_devices();
  std::set<string> keys;

  for (const auto &e : all) {
    EXPECT_TRUE(keys.insert(e.key()).second) << "duplicate key " << e.key();
  }

  EXPECT_EQ(all.size(), 15u);
}

TEST_F(ConfiguredTaskFixture, DefaultDeviceAndLogin) {
  EXPECT_EQ(task->default_device(), "Office");
  EXPECT_EQ(task->login_id(), "listener");

  zc.infos["10.0.0.5"] = info("D1", "Office");
  task->connect_listener().service_added(test::native_record("Office", "10.0.0.5"));

  zc.infos["10.0.0.6"] = info("D2", "Den");
  task->connect_listener().service_added(test::native_record("Den", "10.0.0.6", "den.local"));

  // nothing is active, the configured default is used
  EXPECT_EQ(task->get_device("")->id, "D1");
  EXPECT_EQ(task->get_device(Directory::DEFAULT_DEVICE)->id, "D1");
  EXPECT_EQ(task->get_device("Den")->id, "D2");

  task->add_dynamic_device(RemoteDevice{.id = "W1", .name = "Web Player (Chrome)"});
  EXPECT_EQ(task->get_device("W1", false)->info.active_user, "listener");

  // an empty login id selects the configured login
  task->add_user("Office", zc::AddUser{.blob = "blob"});
  ASSERT_EQ(zc.added.size(), 1u);
  EXPECT_EQ(zc.added.front().login_id, "listener");
}

TEST_F(ConfiguredTaskFixture, StartWithoutZeroconf) {
  web.devices = {RemoteDevice{.id = "P1", .name = "Phone", .type = "Smartphone"}};

  task->start();

  EXPECT_TRUE(task->wait_ready(Millis(10000)));
  EXPECT_TRUE(task->is_ready());

  // the Web API was consulted before discovery settled
  const auto phone = task->get_device("Phone", false);
  ASSERT_TRUE(phone.has_value());
  EXPECT_TRUE(phone->is_listed);

  task->shutdown();
}
