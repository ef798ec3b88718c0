// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nav_shell.h"

#include "region.h"
#include "region_manager.h"
#include "view.h"

#include <spdlog/spdlog.h>

#include <sstream>
#include <stdexcept>

namespace waypoint {

namespace {

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream in(line);
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string describe(const NavigationResult& result, const std::string& what) {
    if (result) {
        return "ok: " + what;
    }
    return "error: " + result.error().get_type_string() + " " + result.error().message;
}

} // namespace

NavShell::NavShell(RegionManager& regions) : regions_(regions) {}

std::string NavShell::execute(const std::string& line) {
    std::vector<std::string> tokens = tokenize(line);
    if (tokens.empty() || tokens[0][0] == '#') {
        return "";
    }

    spdlog::debug("[NavShell] {}", line);

    // Destroy and lifecycle hooks are not wrapped in a NavigationResult
    try {
        return dispatch(tokens);
    } catch (const std::exception& e) {
        spdlog::warn("[NavShell] '{}' failed: {}", line, e.what());
        return std::string("error: ") + e.what();
    }
}

std::string NavShell::dispatch(const std::vector<std::string>& tokens) {
    const std::string& command = tokens[0];

    if (command == "help") {
        return help_text();
    }
    if (command == "tree") {
        return render_tree();
    }
    if (command == "quit" || command == "exit") {
        quit_requested_ = true;
        return "ok: quit";
    }

    if (command == "resume" || command == "sleep") {
        bool resume = command == "resume";
        for (const auto& region : regions_.root_regions()) {
            region->on_window_lifecycle_recursively(resume);
        }
        return "ok: " + command;
    }
    if (command == "appear" || command == "disappear") {
        bool appearing = command == "appear";
        for (const auto& region : regions_.root_regions()) {
            region->on_page_lifecycle_recursively(appearing);
        }
        return "ok: " + command;
    }

    if (command == "replace" || command == "push" || command == "pushback" ||
        command == "back" || command == "forward" || command == "destroy") {
        return navigate(command, tokens);
    }

    return "error: unknown command '" + command + "' (try 'help')";
}

std::string NavShell::navigate(const std::string& command,
                               const std::vector<std::string>& tokens) {
    if (tokens.size() < 2) {
        return "error: " + command + " requires a region name";
    }

    std::shared_ptr<Region> region = regions_.get_region(tokens[1]);
    if (!region) {
        return "error: no region named '" + tokens[1] + "'";
    }

    if (command == "destroy") {
        region->destroy_all();
        return "ok: destroyed " + tokens[1];
    }

    if (command == "back" || command == "forward") {
        NavigationParameters parameters;
        try {
            parameters = parse_parameters(tokens, 2);
        } catch (const std::invalid_argument& e) {
            return std::string("error: ") + e.what();
        }
        NavigationResult result =
            command == "back" ? region->go_back(parameters) : region->go_forward(parameters);
        return describe(result, command + " " + tokens[1]);
    }

    if (tokens.size() < 3) {
        return "error: " + command + " requires a region and a view name";
    }

    NavigationParameters parameters;
    try {
        parameters = parse_parameters(tokens, 3);
    } catch (const std::invalid_argument& e) {
        return std::string("error: ") + e.what();
    }

    NavigationResult result = NavigationResult::ok();
    if (command == "replace") {
        result = region->replace_all(tokens[2], parameters);
    } else if (command == "push") {
        result = region->push(tokens[2], parameters);
    } else {
        result = region->push_backwards(tokens[2], parameters);
    }
    return describe(result, command + " " + tokens[1] + " " + tokens[2]);
}

NavigationParameters NavShell::parse_parameters(const std::vector<std::string>& tokens,
                                                size_t first) {
    NavigationParameters parameters;
    for (size_t i = first; i < tokens.size(); i++) {
        const std::string& token = tokens[i];
        size_t eq = token.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw std::invalid_argument("expected key=value, got '" + token + "'");
        }

        std::string key = token.substr(0, eq);
        std::string raw = token.substr(eq + 1);

        json value = json::parse(raw, nullptr, false);
        if (value.is_discarded()) {
            value = raw;
        }
        parameters.set(key, std::move(value));
    }
    return parameters;
}

std::string NavShell::render_tree() const {
    std::string out;
    for (const auto& region : regions_.root_regions()) {
        render_region(*region, 0, out);
    }
    if (out.empty()) {
        return "(no regions)";
    }
    out.pop_back(); // trailing newline
    return out;
}

void NavShell::render_region(const Region& region, int depth, std::string& out) const {
    out.append(static_cast<size_t>(depth) * 2, ' ');
    out += region.get_name();
    out += " [";
    for (size_t i = 0; i < region.get_stack_size(); i++) {
        View* view = region.get_view_at(i);
        if (i > 0) {
            out += ", ";
        }
        out += view->get_name();
        if (view == region.get_current_view()) {
            out += '*';
        }
    }
    out += "]\n";

    for (size_t i = 0; i < region.get_stack_size(); i++) {
        for (const auto& child : regions_.get_regions(region.get_view_at(i))) {
            render_region(*child, depth + 1, out);
        }
    }
}

std::string NavShell::help_text() {
    return "Commands:\n"
           "  replace <region> <view> [k=v ...]   replace the whole stack\n"
           "  push <region> <view> [k=v ...]      push after current\n"
           "  pushback <region> <view> [k=v ...]  push before current\n"
           "  back <region> / forward <region>    step through history\n"
           "  resume | sleep                      window lifecycle broadcast\n"
           "  appear | disappear                  page lifecycle broadcast\n"
           "  destroy <region>                    destroy a region and its views\n"
           "  tree                                show the region tree\n"
           "  quit                                exit";
}

} // namespace waypoint
