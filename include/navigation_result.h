// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file navigation_result.h
 * @brief Navigation direction tag, error taxonomy and result type
 *
 * Region navigation methods never throw. Any fault raised while resolving a
 * view, running a hook or mutating the stack is captured into a
 * NavigationResult at the public boundary.
 */

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace waypoint {

/**
 * @brief Semantic direction of a navigation, stored in the parameter bag
 */
enum class NavigationDirection {
    New,     ///< ReplaceAll, Push, PushBackwards
    Back,    ///< GoBack
    Forward, ///< GoForward
};

const char* navigation_direction_name(NavigationDirection direction);

/**
 * @brief Parse a direction name as written into NavigationParameters
 * @throws std::invalid_argument for an unknown name
 */
NavigationDirection parse_navigation_direction(const std::string& name);

/**
 * @brief Raised by a ViewProvider when a view name is not registered
 */
class ViewNotFoundError : public std::runtime_error {
  public:
    explicit ViewNotFoundError(const std::string& view_name)
        : std::runtime_error("View not registered: " + view_name), view_name_(view_name) {}

    const std::string& view_name() const {
        return view_name_;
    }

  private:
    std::string view_name_;
};

/**
 * @brief Raised when GoBack/GoForward is attempted without a neighbour
 */
class InvalidNavigationError : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

/**
 * @brief Error categories for a failed navigation
 */
enum class NavigationErrorType {
    NONE,              // No error
    VIEW_NOT_FOUND,    // View provider could not produce the named view
    INVALID_OPERATION, // GoBack/GoForward boundary check failed
    UNKNOWN            // Fault raised by a hook, behavior or collaborator
};

/**
 * @brief Captured fault of a failed navigation
 */
struct NavigationError {
    NavigationErrorType type = NavigationErrorType::NONE;
    std::string message;          // what() of the captured fault
    std::exception_ptr exception; // Original fault, for rethrow()

    bool has_error() const {
        return type != NavigationErrorType::NONE;
    }

    std::string get_type_string() const;

    /**
     * @brief Classify the exception currently being handled
     *
     * Must be called from inside a catch block.
     */
    static NavigationError from_current_exception();
};

/**
 * @brief Outcome of one navigation call
 */
class NavigationResult {
  public:
    static NavigationResult ok() {
        return NavigationResult(true, NavigationError{});
    }

    static NavigationResult failed(NavigationError error) {
        return NavigationResult(false, std::move(error));
    }

    bool success() const {
        return success_;
    }

    explicit operator bool() const {
        return success_;
    }

    const NavigationError& error() const {
        return error_;
    }

    /**
     * @brief Re-raise the captured fault
     *
     * Does nothing for a successful result.
     */
    void rethrow() const;

  private:
    NavigationResult(bool success, NavigationError error)
        : success_(success), error_(std::move(error)) {}

    bool success_;
    NavigationError error_;
};

} // namespace waypoint
