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
 * Unit tests for src/cast/
 */

#include "base/crypto.hpp"
#include "base/error.hpp"
#include "cast/controller.hpp"
#include "cast/message.hpp"
#include "cast/session.hpp"
#include "directory/directory.hpp"
#include "discovery/cast_listener.hpp"
#include "fakes.hpp"

#include <ArduinoJson.h>
#include <gtest/gtest.h>
#include <memory>

using namespace sconnect;

namespace {

struct ControllerFixture : public ::testing::Test {
  test::FakeChannel channel{test::FakeChannel::Script{}};
  test::FakeSink sink;
  test::FakeTokens tokens;
  test::FakeAuth auth;
  cast::Controller ctrl{channel, sink, tokens, auth, "Kitchen", false};

  void SetUp() override {
    channel.set_receiver([this](csv ns, csv payload) { ctrl.receive(ns, payload); });
  }

  void deliver(csv payload) { ctrl.receive(cast::Message::NS, payload); }
};

struct SessionFixture : public ::testing::Test {
  Directory dir;
  test::FakeWeb web;
  test::FakeTokens tokens;
  test::FakeAuth auth;
  DirectoryEntry entry;

  void SetUp() override {
    const auto drec = DiscoveryRecord::from_cast(
        test::cast_record("Nest-1", "k1", "Kitchen", "10.0.0.9"));

    entry = discovery::CastListener::make_entry(drec.value());
    dir.add_discovered(entry);
  }

  std::unique_ptr<cast::Session> make(test::FakeChannel *&channel, test::FakeChannel::Script script,
                                      cast::Session::Opts opts) {
    auto ch = std::make_unique<test::FakeChannel>(std::move(script));
    channel = ch.get();

    return std::make_unique<cast::Session>(dir, entry, std::move(ch), web, tokens, auth, opts);
  }
};

} // namespace

TEST(CastMessage, GetInfo) {
  StaticJsonDocument<512> doc;
  ASSERT_FALSE(deserializeJson(doc, cast::Message::get_info("Kitchen", true)));

  EXPECT_STREQ(doc["type"].as<const char *>(), "getInfo");
  EXPECT_STREQ(doc["payload"]["remoteName"].as<const char *>(), "Kitchen");
  EXPECT_EQ(string(doc["payload"]["deviceID"].as<const char *>()), crypto::md5_hex("Kitchen"));
  EXPECT_TRUE(doc["payload"]["deviceAPI_isGroup"].as<bool>());
}

TEST(CastMessage, AddUser) {
  StaticJsonDocument<512> doc;
  ASSERT_FALSE(deserializeJson(doc, cast::Message::add_user("blob-value")));

  EXPECT_STREQ(doc["type"].as<const char *>(), "addUser");
  EXPECT_STREQ(doc["payload"]["blob"].as<const char *>(), "blob-value");
  EXPECT_STREQ(doc["payload"]["tokenType"].as<const char *>(), "accesstoken");
}

TEST_F(ControllerFixture, GetInfoResponse) {
  deliver(test::get_info_response("dev-1", "Kitchen"));

  EXPECT_TRUE(ctrl.get_info_signal().is_set());
  EXPECT_EQ(ctrl.info().device_id, "dev-1");
  EXPECT_EQ(ctrl.info().client_id, "client-1");
  EXPECT_NO_THROW(ctrl.check_get_info());

  ASSERT_EQ(sink.infos.size(), 1u);
  EXPECT_EQ(sink.infos[0].response_source, "getInfoResponse");
}

TEST_F(ControllerFixture, GetInfoError) {
  deliver(test::error_reply("getInfoError", 202, "not ready", 7));

  EXPECT_TRUE(ctrl.get_info_signal().is_set());
  EXPECT_THROW(ctrl.check_get_info(), ProtocolError);

  try {
    ctrl.check_get_info();
  } catch (const ProtocolError &e) {
    EXPECT_EQ(e.status, 202);
    EXPECT_EQ(e.status_string, "not ready");
    EXPECT_EQ(e.vendor_error, 7);
  }

  ASSERT_EQ(sink.outcomes.size(), 1u);
  EXPECT_EQ(sink.outcomes[0].kind, ProtocolOutcome::GetInfoError);
}

TEST_F(ControllerFixture, AddUserResponseFillsActiveUser) {
  deliver(test::get_info_response("dev-1", "Kitchen"));
  deliver(test::add_user_response("user-9"));

  EXPECT_TRUE(ctrl.activation_signal().is_set());
  EXPECT_EQ(ctrl.info().active_user, "user-9");
  EXPECT_EQ(ctrl.outcome().kind, ProtocolOutcome::AddUserResponse);
  EXPECT_NO_THROW(ctrl.check_add_user());

  ASSERT_EQ(sink.infos.size(), 2u);
  EXPECT_EQ(sink.infos[1].active_user, "user-9");
}

TEST_F(ControllerFixture, TransferOutcomes) {
  ctrl.expect_transfer();
  deliver(test::error_reply("transferError", 500, "failed"));

  EXPECT_TRUE(ctrl.transfer_signal().is_set());
  EXPECT_THROW(ctrl.check_transfer(), ProtocolError);

  ctrl.expect_transfer();
  EXPECT_FALSE(ctrl.transfer_signal().is_set());

  deliver(test::error_reply("transferSuccess", 101, "OK"));
  EXPECT_NO_THROW(ctrl.check_transfer());
}

TEST_F(ControllerFixture, UnknownAndForeignIgnored) {
  deliver(R"({"type":"somethingNew","payload":{}})");
  ctrl.receive("urn:x-cast:other", test::add_user_response("user-9"));

  EXPECT_FALSE(ctrl.get_info_signal().is_set());
  EXPECT_FALSE(ctrl.activation_signal().is_set());
  EXPECT_TRUE(sink.outcomes.empty());
}

TEST_F(ControllerFixture, MalformedRecordedAsReceiveFailure) {
  deliver("{not json");

  ASSERT_EQ(sink.outcomes.size(), 1u);
  EXPECT_EQ(sink.outcomes[0].status, ProtocolOutcome::STATUS_RECEIVE_FAILED);
  EXPECT_EQ(ctrl.outcome().status_string, "ERROR-CHROMECAST-RECEIVE-MESSAGE");
}

TEST_F(ControllerFixture, StandaloneGetInformation) {
  EXPECT_THROW(ctrl.get_information(Millis(50)), TimeoutError);

  channel.script.get_info_reply = test::get_info_response("dev-1", "Kitchen");
  EXPECT_NO_THROW(ctrl.get_information(Millis(50)));

  channel.script.get_info_reply = test::error_reply("getInfoError", 404, "unknown");
  EXPECT_THROW(ctrl.get_information(Millis(50)), ProtocolError);
}

TEST_F(ControllerFixture, StandaloneAddUser) {
  // addUser needs the client id from getInfo
  EXPECT_THROW(ctrl.add_user(Millis(50)), ActivationError);

  deliver(test::get_info_response("dev-1", "Kitchen"));

  EXPECT_THROW(ctrl.add_user(Millis(50)), TimeoutError);
  EXPECT_EQ(auth.last_client_id, "client-1");
  EXPECT_EQ(auth.last_device_id, "dev-1");
  EXPECT_EQ(auth.last_access_token, "account-token");

  channel.script.add_user_reply = test::error_reply("addUserError", 203, "bad token", 12);
  EXPECT_THROW(ctrl.add_user(Millis(50)), ProtocolError);

  channel.script.add_user_reply = test::add_user_response("user-9");
  EXPECT_NO_THROW(ctrl.add_user(Millis(50)));
}

TEST_F(ControllerFixture, LaunchingDoesNotWait) {
  ctrl.set_launching(true);

  EXPECT_NO_THROW(ctrl.get_information(Millis(5000)));
  EXPECT_FALSE(ctrl.get_info_signal().is_set());
  EXPECT_EQ(channel.sent_messages().size(), 1u);
}

TEST_F(SessionFixture, ActivateWithoutTransfer) {
  test::FakeChannel *channel{nullptr};
  auto session = make(channel,
                      {.get_info_reply = test::get_info_response("real-id", "Kitchen"),
                       .add_user_reply = test::add_user_response("user-9")},
                      {.activation = 2s, .transfer = 1s, .transfer_playback = false});

  session->start();
  ASSERT_NO_THROW(session->wait_ready());

  EXPECT_TRUE(session->is_running());
  EXPECT_EQ(session->activated_id(), "real-id");
  EXPECT_EQ(channel->launched_app, cast::Message::APP_ID);

  const auto e = dir.find_by_key("k1");
  EXPECT_EQ(e->id, "real-id");
  EXPECT_EQ(e->info.active_user, "user-9");
  EXPECT_EQ(e->outcome.kind, ProtocolOutcome::AddUserResponse);

  session->stop();
  EXPECT_EQ(session->state(), cast::Session::Stopped);
  EXPECT_TRUE(channel->closed);
}

TEST_F(SessionFixture, TransferSuccess) {
  test::FakeChannel *channel{nullptr};
  auto session = make(channel,
                      {.get_info_reply = test::get_info_response("real-id", "Kitchen"),
                       .add_user_reply = test::add_user_response("user-9")},
                      {.activation = 2s, .transfer = 1s, .transfer_playback = true});

  web.on_transfer = [&]() {
    channel->deliver(cast::Message::NS, test::error_reply("transferSuccess", 101, "OK"));
  };

  session->start();
  ASSERT_NO_THROW(session->wait_ready());

  ASSERT_EQ(web.transfers.size(), 1u);
  EXPECT_EQ(web.transfers[0].first, "real-id");
  EXPECT_EQ(dir.find_by_key("k1")->outcome.kind, ProtocolOutcome::TransferSuccess);
}

TEST_F(SessionFixture, TransferTimeoutKeepsLastOutcome) {
  test::FakeChannel *channel{nullptr};
  auto session = make(channel,
                      {.get_info_reply = test::get_info_response("real-id", "Kitchen"),
                       .add_user_reply = test::add_user_response("user-9")},
                      {.activation = 2s, .transfer = 200ms, .transfer_playback = true});

  session->start();
  EXPECT_THROW(session->wait_ready(), TimeoutError);
  EXPECT_EQ(session->state(), cast::Session::Error);

  const auto e = dir.find_by_key("k1");
  EXPECT_EQ(e->outcome.kind, ProtocolOutcome::AddUserResponse);
  EXPECT_EQ(e->outcome.status, 101);
}

TEST_F(SessionFixture, AddUserErrorSurfaced) {
  test::FakeChannel *channel{nullptr};
  auto session = make(channel,
                      {.get_info_reply = test::get_info_response("real-id", "Kitchen"),
                       .add_user_reply = test::error_reply("addUserError", 203, "bad", 12)},
                      {.activation = 2s});

  session->start();
  EXPECT_THROW(session->wait_ready(), ProtocolError);
  EXPECT_EQ(dir.find_by_key("k1")->outcome.kind, ProtocolOutcome::AddUserError);
}

TEST_F(SessionFixture, GetInfoTimeoutRecordsLaunchError) {
  test::FakeChannel *channel{nullptr};
  auto session = make(channel, {}, {.activation = 100ms});

  session->start();
  EXPECT_THROW(session->wait_ready(), TimeoutError);
  EXPECT_EQ(dir.find_by_key("k1")->outcome.kind, ProtocolOutcome::LaunchError);
}

TEST_F(SessionFixture, ConnectFailure) {
  test::FakeChannel *channel{nullptr};
  auto session = make(channel, {.connect_ok = false}, {.activation = 1s});

  session->start();
  EXPECT_THROW(session->wait_ready(), TransientDiscoveryError);
  EXPECT_EQ(session->state(), cast::Session::Error);
  EXPECT_EQ(dir.find_by_key("k1")->outcome.kind, ProtocolOutcome::LaunchError);
}
