// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "../test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

using Names = std::vector<std::string>;

// ============================================================================
// Registration
// ============================================================================

TEST_CASE_METHOD(RegionTestFixture, "RegionManager: create_region validates its input",
                 "[region_manager]") {
    create_root("main");

    SECTION("duplicate name") {
        CHECK_THROWS_AS(create_root("main"), std::invalid_argument);
        CHECK(regions.size() == 1);
    }

    SECTION("empty name") {
        CHECK_THROWS_AS(create_root(""), std::invalid_argument);
    }

    SECTION("null host") {
        CHECK_THROWS_AS(regions.create_region("side", nullptr), std::invalid_argument);
        CHECK(regions.get_region("side") == nullptr);
    }
}

TEST_CASE_METHOD(RegionTestFixture, "RegionManager: lookups by name and owner",
                 "[region_manager]") {
    auto main = create_root("main");
    auto side = create_root("side");

    REQUIRE(regions.get_region("main") == main);
    REQUIRE(regions.get_region("nope") == nullptr);
    CHECK(regions.get_owner("main") == nullptr);
    CHECK(regions.region_names() == Names{"main", "side"});

    auto roots = regions.root_regions();
    REQUIRE(roots.size() == 2);
    CHECK(roots[0] == main);
    CHECK(roots[1] == side);
}

TEST_CASE_METHOD(RegionTestFixture, "RegionManager: nested regions are listed per hosting view",
                 "[region_manager][nested]") {
    RecordingOptions options;
    options.nested_regions = {"left", "right"};
    register_recording("split", options);

    auto main = create_root("main");
    REQUIRE(main->push("split"));
    View* split = main->get_current_view();

    auto nested = regions.get_regions(split);
    REQUIRE(nested.size() == 2);
    CHECK(nested[0]->get_name() == "left");
    CHECK(nested[1]->get_name() == "right");
    CHECK(regions.get_owner("left") == split);

    // Roots are unaffected by nested registrations
    CHECK(regions.root_regions().size() == 1);
}

TEST_CASE_METHOD(RegionTestFixture, "RegionManager: remove_holder", "[region_manager]") {
    auto main = create_root("main");

    regions.remove_holder("missing");
    CHECK(regions.size() == 1);

    regions.remove_holder("main");
    CHECK(regions.size() == 0);
    CHECK(regions.get_region("main") == nullptr);

    // The caller's reference is still valid
    CHECK(main->get_name() == "main");
}

// ============================================================================
// destroy_all
// ============================================================================

TEST_CASE_METHOD(RegionTestFixture, "RegionManager: destroy_all tears down every region",
                 "[region_manager][destroy]") {
    RecordingOptions options;
    options.nested_regions = {"content"};
    register_recording("shell", options);
    register_recordings({"home", "status"});

    auto main = create_root("main");
    auto bar = create_root("bar");
    REQUIRE(main->push("shell"));
    REQUIRE(regions.get_region("content")->push("home"));
    REQUIRE(bar->push("status"));
    log.clear();

    regions.destroy_all();

    CHECK(regions.size() == 0);
    // Roots in reverse registration order
    CHECK(log.events == Names{"status:destroy", "home:destroy", "shell:destroy"});
}

TEST_CASE_METHOD(RegionTestFixture, "RegionManager: destroy_all also reaches orphaned regions",
                 "[region_manager][destroy]") {
    register_recording("home");

    // Owned by a view that no region displays
    View detached("detached");
    auto orphan = regions.create_region("orphan", std::make_unique<RegionHost>(), &detached);
    REQUIRE(orphan->push("home"));
    log.clear();

    regions.destroy_all();

    CHECK(regions.size() == 0);
    CHECK(log.events == Names{"home:destroy"});
    CHECK(orphan->get_stack_size() == 0);
}

TEST_CASE_METHOD(RegionTestFixture, "RegionManager: destroy_all on an empty registry",
                 "[region_manager][destroy]") {
    REQUIRE_NOTHROW(regions.destroy_all());
    CHECK(regions.size() == 0);
}
