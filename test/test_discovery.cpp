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
 * Unit tests for src/discovery/
 */

#include "base/crypto.hpp"
#include "directory/directory.hpp"
#include "discovery/cast_listener.hpp"
#include "discovery/connect_listener.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>
#include <mutex>

using namespace sconnect;

namespace {

SelfDescription office_info() {
  SelfDescription sd;

  sd.device_id = "D1";
  sd.remote_name = "Office";
  sd.brand_display_name = "Bose";
  sd.status = SelfDescription::STATUS_OK;
  sd.status_string = "OK";

  return sd;
}

struct ConnectFixture : public ::testing::Test {
  Directory dir;
  std::mutex discovery_mtx;
  test::FakeZc zc;
  test::FakeFactory factory;
  speaker::Players players{&factory};
  discovery::ConnectListener listener{dir, discovery_mtx, zc, players};
};

struct CastFixture : public ::testing::Test {
  Directory dir;
  std::mutex discovery_mtx;
  discovery::CastListener listener{dir, discovery_mtx};
};

} // namespace

TEST_F(ConnectFixture, AddedThenRemoved) {
  zc.infos["10.0.0.5"] = office_info();

  listener.service_added(test::native_record("Office", "10.0.0.5"));

  const auto e = dir.resolve("Office", "", false);
  ASSERT_TRUE(e.has_value());
  EXPECT_EQ(e->id, "D1");
  EXPECT_EQ(e->key(), "office._spotify-connect._tcp.local.");

  listener.service_removed(mdns::Record({.name = "Office",
                                         .type = "_spotify-connect._tcp",
                                         .domain = "local"}));

  EXPECT_FALSE(dir.resolve("Office", "", false).has_value());
  EXPECT_EQ(dir.size(), 0u);
}

TEST_F(ConnectFixture, HostNameFallback) {
  zc.infos["office.local"] = office_info();

  listener.service_added(test::native_record("Office", "10.0.0.5"));

  ASSERT_EQ(zc.hosts.size(), 2u);
  EXPECT_EQ(zc.hosts[0], "10.0.0.5");
  EXPECT_EQ(zc.hosts[1], "office.local");

  const auto e = dir.find_by_id("D1");
  ASSERT_TRUE(e.has_value());
  EXPECT_TRUE(e->info.is_ok());
}

TEST_F(ConnectFixture, DiagnosticEntryWhenUnreachable) {
  listener.service_added(test::native_record("Office", "10.0.0.5"));

  const auto all = dir.snapshot();
  ASSERT_EQ(all.size(), 1u);

  const auto &e = all.front();
  EXPECT_EQ(e.id, "getInfoError");
  EXPECT_EQ(e.name, "Office");
  EXPECT_EQ(e.info.status, SelfDescription::STATUS_GET_INFO_FAILED);
  EXPECT_EQ(e.info.response_source, "sconnect");
  EXPECT_FALSE(e.info.status_string.empty());

  // a second unreachable receiver does not replace the first
  listener.service_added(test::native_record("Den", "10.0.0.6", "den.local"));
  EXPECT_EQ(dir.size(), 2u);
}

TEST_F(ConnectFixture, UpdateKeepsIdentity) {
  zc.infos["10.0.0.5"] = office_info();

  listener.service_added(test::native_record("Office", "10.0.0.5"));
  listener.service_updated(test::native_record("Office", "10.0.0.50"));

  ASSERT_EQ(dir.size(), 1u);

  const auto e = dir.find_by_id("D1");
  EXPECT_EQ(e->discovery.host_address(), "10.0.0.50");

  // identity came from the first getInfo only
  EXPECT_EQ(zc.hosts.size(), 1u);
}

TEST_F(ConnectFixture, SonosPlayerCreated) {
  auto info = office_info();
  info.brand_display_name = "Sonos";
  zc.infos["10.0.0.5"] = info;

  listener.service_added(test::native_record("Office", "10.0.0.5"));

  ASSERT_NE(players.find("10.0.0.5"), nullptr);

  listener.service_removed(mdns::Record({.name = "Office",
                                         .type = "_spotify-connect._tcp",
                                         .domain = "local"}));
  EXPECT_EQ(players.find("10.0.0.5"), nullptr);
}

TEST_F(CastFixture, PlaceholderIdentity) {
  listener.service_added(test::cast_record("Nest-1", "k1", "Kitchen", "10.0.0.9"));

  const auto e = dir.find_by_key("k1");
  ASSERT_TRUE(e.has_value());
  EXPECT_EQ(e->id, crypto::md5_hex("Kitchen"));
  EXPECT_EQ(e->name, "Kitchen");
  EXPECT_EQ(e->info.device_type, "CastAudio");
  EXPECT_EQ(e->info.brand_display_name, "ChromeCast");
  EXPECT_EQ(e->info.model_display_name, "Google Nest Mini");
  EXPECT_TRUE(e->is_cast());
}

TEST_F(CastFixture, GroupAdvertisedTwice) {
  const auto md = "Google Cast Group";

  listener.service_added(test::cast_record("Group-a", "grp1", "Downstairs", "10.0.0.10", md, "2084"));
  listener.service_added(test::cast_record("Group-b", "grp1", "Downstairs", "10.0.0.11", md, "2084"));

  ASSERT_EQ(dir.size(), 1u);
  EXPECT_EQ(dir.find_by_key("grp1")->discovery.host_address(), "10.0.0.10");
}

TEST_F(CastFixture, UpdateAndRemoveByServiceName) {
  listener.service_added(test::cast_record("Nest-1", "k1", "Kitchen", "10.0.0.9"));
  listener.service_updated(test::cast_record("Nest-1", "k1", "Kitchen", "10.0.0.19"));

  ASSERT_EQ(dir.size(), 1u);
  EXPECT_EQ(dir.find_by_key("k1")->discovery.host_address(), "10.0.0.19");

  listener.service_removed(
      mdns::Record({.name = "Nest-1", .type = "_googlecast._tcp", .domain = "local"}));

  EXPECT_EQ(dir.size(), 0u);
}

TEST_F(CastFixture, RenameChangesId) {
  listener.service_added(test::cast_record("Nest-1", "k1", "Kitchen", "10.0.0.9"));
  const auto before = dir.find_by_key("k1")->id;

  listener.service_removed(
      mdns::Record({.name = "Nest-1", .type = "_googlecast._tcp", .domain = "local"}));
  listener.service_added(test::cast_record("Nest-1", "k1", "Pantry", "10.0.0.9"));

  EXPECT_NE(dir.find_by_key("k1")->id, before);
}
