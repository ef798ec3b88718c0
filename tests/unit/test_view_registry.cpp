// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "navigation_result.h"
#include "view.h"
#include "view_registry.h"

#include <catch2/catch_test_macros.hpp>

using namespace waypoint;

namespace {

class HomeView : public View {
  public:
    using View::View;
};

class HomeController : public ViewController {};

class TagBehavior : public ViewBehavior {
  public:
    explicit TagBehavior(std::vector<std::string>& order, std::string tag)
        : order_(order), tag_(std::move(tag)) {}
    void on_attached(View&) override {
        order_.push_back(tag_);
    }

  private:
    std::vector<std::string>& order_;
    std::string tag_;
};

} // namespace

TEST_CASE("ViewRegistry: resolve creates a fresh instance per call", "[view_registry]") {
    ViewRegistry views;
    views.register_view<HomeView>("home");

    auto first = views.resolve("home");
    auto second = views.resolve("home");

    REQUIRE(first != nullptr);
    REQUIRE(second != nullptr);
    CHECK(first.get() != second.get());
    CHECK(first->get_name() == "home");
    CHECK(dynamic_cast<HomeView*>(first.get()) != nullptr);
    CHECK(first->get_binding_context() == nullptr);
}

TEST_CASE("ViewRegistry: controller becomes the binding context", "[view_registry]") {
    ViewRegistry views;
    views.register_view<HomeView, HomeController>("home");

    auto view = views.resolve("home");

    CHECK(dynamic_cast<HomeController*>(view->get_binding_context()) != nullptr);
}

TEST_CASE("ViewRegistry: unknown names", "[view_registry]") {
    ViewRegistry views;

    CHECK_FALSE(views.is_registered("ghost"));
    CHECK_THROWS_AS(views.resolve("ghost"), ViewNotFoundError);

    try {
        views.resolve("ghost");
        FAIL("resolve should have thrown");
    } catch (const ViewNotFoundError& e) {
        CHECK(e.view_name() == "ghost");
        CHECK(std::string(e.what()) == "View not registered: ghost");
    }
}

TEST_CASE("ViewRegistry: registration validation", "[view_registry]") {
    ViewRegistry views;

    CHECK_THROWS_AS(views.register_view("", [](const std::string& n) {
        return std::make_unique<View>(n);
    }),
                    std::invalid_argument);
    CHECK_THROWS_AS(views.register_view("home", ViewFactory()), std::invalid_argument);
    CHECK_THROWS_AS(views.register_behavior("home", BehaviorFactory()), std::invalid_argument);

    SECTION("factory returning null") {
        views.register_view("broken", [](const std::string&) { return std::unique_ptr<View>(); });
        CHECK_THROWS_AS(views.resolve("broken"), std::runtime_error);
    }
}

TEST_CASE("ViewRegistry: re-registering replaces the factory", "[view_registry]") {
    ViewRegistry views;
    views.register_view<View>("home");
    views.register_view<HomeView>("home");

    CHECK(dynamic_cast<HomeView*>(views.resolve("home").get()) != nullptr);
    CHECK(views.registered_names() == std::vector<std::string>{"home"});
}

TEST_CASE("ViewRegistry: registered names are sorted", "[view_registry]") {
    ViewRegistry views;
    views.register_view<View>("settings");
    views.register_view<View>("about");
    views.register_view<View>("home");

    CHECK(views.registered_names() == std::vector<std::string>{"about", "home", "settings"});
}

TEST_CASE("ViewRegistry: behaviors apply in registration order", "[view_registry]") {
    ViewRegistry views;
    std::vector<std::string> order;
    views.register_view<HomeView>("home");
    views.register_behavior("home", [&order] { return std::make_unique<TagBehavior>(order, "first"); });
    views.register_behavior("home", [&order] { return std::make_unique<TagBehavior>(order, "second"); });

    auto view = views.resolve("home");
    CHECK(view->behavior_count() == 0);

    views.apply_behaviors(*view);

    CHECK(view->behavior_count() == 2);
    CHECK(order == std::vector<std::string>{"first", "second"});

    SECTION("views without behaviors are left alone") {
        views.register_view<View>("plain");
        auto plain = views.resolve("plain");
        views.apply_behaviors(*plain);
        CHECK(plain->behavior_count() == 0);
    }
}
