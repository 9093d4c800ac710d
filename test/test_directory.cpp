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
 * Unit tests for src/directory/directory.cpp
 */

#include "base/error.hpp"
#include "directory/directory.hpp"
#include "discovery/cast_listener.hpp"
#include "fakes.hpp"

#include <algorithm>
#include <atomic>
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace sconnect;

namespace {

DirectoryEntry native_entry(csv name, csv id, csv address) {
  DirectoryEntry e;

  e.discovery = DiscoveryRecord::from_native(test::native_record(name, address));
  e.info.device_id = string(id);
  e.info.remote_name = string(name);
  e.info.status = SelfDescription::STATUS_OK;
  e.id = string(id);
  e.name = string(name);

  return e;
}

RemoteDevice remote(csv id, csv name, bool active = false) {
  return RemoteDevice{.id = string(id), .name = string(name), .type = "Computer",
                      .is_active = active};
}

struct CountingObserver : public Observer {
  void device_added(const DirectoryEntry &) override { ++added; }
  void device_removed(const DirectoryEntry &) override { ++removed; }
  void device_updated(const DirectoryEntry &) override { ++updated; }

  std::atomic_int added{0};
  std::atomic_int removed{0};
  std::atomic_int updated{0};
};

struct ThrowingObserver : public Observer {
  void device_added(const DirectoryEntry &) override { throw std::runtime_error("added"); }
  void device_removed(const DirectoryEntry &) override { throw std::runtime_error("removed"); }
  void device_updated(const DirectoryEntry &) override { throw std::runtime_error("updated"); }
};

struct ForeignThrowObserver : public Observer {
  void device_added(const DirectoryEntry &) override { throw 42; }
  void device_removed(const DirectoryEntry &) override { throw 42; }
  void device_updated(const DirectoryEntry &) override { throw 42; }
};

DirectoryEntry cast_entry(csv instance, csv id, csv fn, csv address) {
  const auto drec = DiscoveryRecord::from_cast(test::cast_record(instance, id, fn, address));

  return discovery::CastListener::make_entry(drec.value());
}

size_t active_count(const Directory &dir) {
  const auto all = dir.snapshot();

  return std::count_if(all.begin(), all.end(), [](const auto &e) { return e.is_active; });
}

} // namespace

TEST(Directory, SortedByName) {
  Directory dir;

  dir.add_discovered(native_entry("kitchen", "K", "10.0.0.3"));
  dir.add_discovered(native_entry("Bedroom", "B", "10.0.0.1"));
  dir.add_discovered(native_entry("attic", "A", "10.0.0.2"));

  const auto all = dir.snapshot();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].name, "attic");
  EXPECT_EQ(all[1].name, "Bedroom");
  EXPECT_EQ(all[2].name, "kitchen");
}

TEST(Directory, ResolveByIdAndName) {
  Directory dir;

  dir.add_discovered(native_entry("Office", "D1", "10.0.0.5"));

  EXPECT_EQ(dir.resolve("D1", "")->name, "Office");
  EXPECT_EQ(dir.resolve("d1", "")->name, "Office");
  EXPECT_EQ(dir.resolve("office", "")->id, "D1");
  EXPECT_EQ(dir.resolve("  Office ", "")->id, "D1");

  EXPECT_THROW(dir.resolve("Garage", ""), ResolutionError);
  EXPECT_FALSE(dir.resolve("Garage", "", false).has_value());
}

TEST(Directory, ResolveEmptyAndDefault) {
  Directory dir;

  dir.add_discovered(native_entry("Office", "D1", "10.0.0.5"));
  dir.add_discovered(native_entry("Den", "D2", "10.0.0.6"));

  // nothing active, fall back to the default id
  EXPECT_EQ(dir.resolve("", "D2")->name, "Den");
  EXPECT_EQ(dir.resolve("*", "D1")->name, "Office");
  EXPECT_THROW(dir.resolve("", ""), ResolutionError);

  dir.mark_active(PlaybackState{.device = remote("D1", "Office", true), .is_playing = true});

  EXPECT_EQ(dir.resolve("", "D2")->name, "Office");
  EXPECT_EQ(dir.resolve("*", "")->name, "Office");
}

TEST(Directory, ResolveDefaultIsIdempotent) {
  Directory dir;

  dir.add_discovered(native_entry("Office", "D1", "10.0.0.5"));

  const auto first = dir.resolve("*", "D1");
  const auto second = dir.resolve("*", "D1");

  ASSERT_TRUE(first.has_value() && second.has_value());
  EXPECT_EQ(first->id, second->id);
}

TEST(Directory, ResolvePrefersActiveOnSharedName) {
  Directory dir;

  dir.add_discovered(native_entry("Speaker", "S1", "10.0.0.1"));
  dir.add_discovered(native_entry("Speaker", "S2", "10.0.0.2"));

  dir.mark_active(PlaybackState{.device = remote("S2", "Speaker", true)});

  EXPECT_EQ(dir.resolve("Speaker", "")->id, "S2");
}

TEST(Directory, ResolveRestrictedActive) {
  Directory dir;

  auto e = native_entry("Car", "C1", "10.0.0.7");
  dir.add_discovered(e);

  // restricted devices are reported by name only
  RemoteDevice dev{.name = "Car", .is_restricted = true};
  const auto active = dir.mark_active(PlaybackState{.device = dev, .is_restricted = true});

  ASSERT_TRUE(active.has_value());
  EXPECT_TRUE(active->is_restricted);
  EXPECT_EQ(dir.resolve("Car", "")->id, "C1");
}

TEST(Directory, AliasLookup) {
  Directory dir;

  auto e = native_entry("", "R1", "10.0.0.8");
  e.info.aliases = {Alias{.id = "A1", .name = "Living Room"}, Alias{.id = "A2", .name = "Patio"}};
  e.name = e.info.display_name();
  dir.add_discovered(e);

  EXPECT_TRUE(dir.find_by_id("A2").has_value());
  EXPECT_TRUE(dir.find_by_name("patio").has_value());
  EXPECT_FALSE(dir.find_by_id("R1").has_value());
}

TEST(Directory, MarkActiveAtMostOne) {
  Directory dir;

  dir.add_discovered(native_entry("Office", "D1", "10.0.0.5"));
  dir.add_discovered(native_entry("Den", "D2", "10.0.0.6"));
  dir.add_discovered(native_entry("Patio", "D3", "10.0.0.7"));

  for (const auto *id : {"D1", "D2", "D3", "unknown", "D2"}) {
    dir.mark_active(PlaybackState{.device = remote(id, "", true)});
    EXPECT_LE(active_count(dir), 1u);
  }

  EXPECT_EQ(dir.active()->id, "D2");

  // nothing playing clears the flag
  dir.mark_active(PlaybackState{});
  EXPECT_EQ(active_count(dir), 0u);
  EXPECT_FALSE(dir.active().has_value());
}

TEST(Directory, MarkActiveNotifiesOnChangeOnly) {
  Directory dir;
  CountingObserver obs;

  dir.add_discovered(native_entry("Office", "D1", "10.0.0.5"));
  dir.subscribe(&obs);

  dir.mark_active(PlaybackState{.device = remote("D1", "Office", true)});
  dir.mark_active(PlaybackState{.device = remote("D1", "Office", true)});

  EXPECT_EQ(obs.updated.load(), 1);

  dir.unsubscribe(&obs);
}

TEST(Directory, ReconcileRoundTrip) {
  Directory dir;

  dir.add_dynamic(remote("W1", "Web Player (Chrome)"), "user1");

  auto e = dir.find_by_id("W1");
  ASSERT_TRUE(e.has_value());
  EXPECT_TRUE(e->is_dynamic());
  EXPECT_EQ(e->info.brand_display_name, "Google");
  EXPECT_EQ(e->info.model_display_name, "Chrome");
  EXPECT_EQ(e->info.active_user, "user1");

  dir.reconcile_listed({remote("W1", "Web Player (Chrome)")}, "user1");
  EXPECT_TRUE(dir.find_by_id("W1")->is_listed);

  dir.reconcile_listed({}, "user1");
  EXPECT_FALSE(dir.find_by_id("W1").has_value());
}

TEST(Directory, ReconcileResetsListed) {
  Directory dir;

  dir.add_discovered(native_entry("Office", "D1", "10.0.0.5"));

  dir.reconcile_listed({remote("D1", "Office"), remote("P1", "Phone")}, "");
  EXPECT_TRUE(dir.find_by_id("D1")->is_listed);
  EXPECT_TRUE(dir.find_by_id("P1")->is_listed);
  EXPECT_EQ(dir.size(), 2u);

  // discovered entries survive, their flag is cleared
  dir.reconcile_listed({}, "");
  ASSERT_TRUE(dir.find_by_id("D1").has_value());
  EXPECT_FALSE(dir.find_by_id("D1")->is_listed);
  EXPECT_FALSE(dir.find_by_id("P1").has_value());
}

TEST(Directory, DiscoveredReplacesDynamic) {
  Directory dir;

  dir.add_dynamic(remote("D1", "Office"), "");
  dir.reconcile_listed({remote("D1", "Office")}, "");
  dir.mark_active(PlaybackState{.device = remote("D1", "Office", true)});

  dir.add_discovered(native_entry("Office", "D1", "10.0.0.5"));

  ASSERT_EQ(dir.size(), 1u);

  const auto e = dir.find_by_id("D1");
  EXPECT_FALSE(e->is_dynamic());
  EXPECT_TRUE(e->is_active);
  EXPECT_TRUE(e->is_listed);
}

TEST(Directory, SnapshotIsolation) {
  Directory dir;

  dir.add_discovered(native_entry("Office", "D1", "10.0.0.5"));

  auto snap = dir.snapshot();
  snap[0].name = "Changed";
  snap[0].is_active = true;
  snap.clear();

  const auto again = dir.snapshot();
  ASSERT_EQ(again.size(), 1u);
  EXPECT_EQ(again[0].name, "Office");
  EXPECT_FALSE(again[0].is_active);
}

TEST(Directory, RemoveById) {
  Directory dir;

  dir.add_dynamic(remote("X1", "Phone"), "");
  dir.add_discovered(native_entry("Office", "D1", "10.0.0.5"));

  EXPECT_EQ(dir.remove("d1", true), 0u);
  EXPECT_EQ(dir.remove("x1", true), 1u);
  EXPECT_EQ(dir.remove("D1"), 1u);
  EXPECT_EQ(dir.size(), 0u);
}

TEST(Directory, ObserverExceptionsContained) {
  Directory dir;
  ThrowingObserver bad;
  CountingObserver good;

  dir.subscribe(&bad);
  dir.subscribe(&good);

  EXPECT_NO_THROW(dir.add_discovered(native_entry("Office", "D1", "10.0.0.5")));
  EXPECT_NO_THROW(dir.remove("D1"));

  EXPECT_EQ(good.added.load(), 1);
  EXPECT_EQ(good.removed.load(), 1);
}

TEST(Directory, ObserverNonStandardExceptionsContained) {
  Directory dir;
  ForeignThrowObserver bad;
  CountingObserver good;

  dir.subscribe(&bad);
  dir.subscribe(&good);

  EXPECT_NO_THROW(dir.add_discovered(native_entry("Office", "D1", "10.0.0.5")));
  EXPECT_NO_THROW(dir.remove("D1"));

  EXPECT_EQ(good.added.load(), 1);
  EXPECT_EQ(good.removed.load(), 1);
}

TEST(Directory, UpdateKeepsKeysUnique) {
  Directory dir;
  CountingObserver obs;

  dir.add_discovered(cast_entry("Nest-A", "k1", "Kitchen", "10.0.0.9"));
  dir.add_discovered(cast_entry("Nest-B", "k2", "Pantry", "10.0.0.10"));
  dir.subscribe(&obs);

  // Nest-A now advertises the key held by Nest-B
  const auto moved =
      DiscoveryRecord::from_cast(test::cast_record("Nest-A", "k2", "Kitchen", "10.0.0.9")).value();

  EXPECT_TRUE(dir.update_discovery(moved.service_name, moved));

  const auto all = dir.snapshot();
  std::set<string> keys;

  for (const auto &e : all) {
    EXPECT_TRUE(keys.insert(e.key()).second) << "duplicate key " << e.key();
  }

  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all.front().name, "Kitchen");
  EXPECT_EQ(dir.find_by_key("k2")->discovery.service_name, moved.service_name);
  EXPECT_EQ(obs.removed.load(), 1);
  EXPECT_EQ(obs.updated.load(), 1);
}

TEST(Directory, ApplySelfDescriptionAndOutcome) {
  Directory dir;

  const auto drec = DiscoveryRecord::from_cast(
      test::cast_record("Nest-1", "k1", "Kitchen", "10.0.0.9"));
  dir.add_discovered(discovery::CastListener::make_entry(drec.value()));

  SelfDescription info;
  info.device_id = "real-id";
  info.remote_name = "Kitchen";
  info.client_id = "client-1";
  info.status = SelfDescription::STATUS_OK;

  EXPECT_TRUE(dir.apply_self_description("k1", info));
  EXPECT_FALSE(dir.apply_self_description("nope", info));

  auto e = dir.find_by_key("k1");
  EXPECT_EQ(e->id, "real-id");
  EXPECT_EQ(e->info.device_type, "CastAudio");
  EXPECT_EQ(e->info.client_id, "client-1");

  const ProtocolOutcome o{.kind = ProtocolOutcome::AddUserResponse, .status = 101};
  EXPECT_TRUE(dir.apply_outcome("k1", o));
  EXPECT_EQ(dir.find_by_key("k1")->outcome, o);
}

TEST(Directory, PlayerDevice) {
  Directory dir;

  dir.add_discovered(native_entry("Office", "D1", "10.0.0.5"));
  EXPECT_FALSE(dir.player_device("Office").has_value());

  dir.reconcile_listed({remote("D1", "Office")}, "");
  EXPECT_EQ(dir.player_device("office")->id, "D1");
  EXPECT_EQ(dir.player_device("D1")->name, "Office");
}

TEST(Directory, ConcurrentMutationAndQuery) {
  Directory dir;
  CountingObserver obs;
  dir.subscribe(&obs);

  std::atomic_bool done{false};
  std::vector<std::jthread> threads;

  for (int t = 0; t < 4; t++) {
    threads.emplace_back([&dir, t]() {
      for (int i = 0; i < 200; i++) {
        const auto name = fmt::format("dev{}", i % 10);
        const auto id = fmt::format("id{}", i % 10);

        dir.add_discovered(native_entry(name, id, fmt::format("10.0.{}.{}", t, i % 10)));

        if ((i % 3) == 0) dir.remove_by_key(fmt::format("{}._spotify-connect._tcp.local.", name));
        if ((i % 5) == 0) dir.mark_active(PlaybackState{.device = remote(id, name, true)});
      }
    });
  }

  threads.emplace_back([&]() {
    while (!done) {
      for (const auto &e : dir.snapshot()) {
        [[maybe_unused]] auto found = dir.find_by_id(e.id);
      }

      [[maybe_unused]] auto r = dir.resolve("dev1", "", false);
    }
  });

  for (int t = 0; t < 4; t++) threads[t].join();
  done = true;
  threads.back().join();

  const auto all = dir.snapshot();
  std::set<string> keys;

  for (const auto &e : all) {
    EXPECT_TRUE(keys.insert(e.key()).second) << "duplicate key " << e.key();
  }

  EXPECT_LE(active_count(dir), 1u);

  dir.unsubscribe(&obs);
}
