// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file compare_session.h
/// @brief Interactive comparison state held in a lager store.
///
/// A session keeps the two input texts, the comparison options and the
/// outcome of the last run. Every change goes through an action and the
/// pure reducer session_update(), so the model can be observed and replayed:
///
/// @code
///   CompareSession session;
///   auto unwatch = session.watch([](const CompareModel& m) { ... });
///   session.set_first_text(R"({"a": 1})");
///   session.set_second_text(R"({"a": 1.0})");
///   session.run();
///   // session.model().result holds the tree, session.model().error is empty
///   unwatch();
/// @endcode

#pragma once

#include <jsoncmp/api.h>
#include <jsoncmp/comparison.h>
#include <jsoncmp/serialization.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace jsoncmp {

/// Why the last run produced no result
struct SessionError {
    enum class Kind : std::uint8_t {
        ParseFirst,   ///< first text is not valid JSON
        ParseSecond,  ///< second text is not valid JSON
        InvalidRoot   ///< a document is not a JSON object
    };

    Kind kind;
    std::string message;
};

struct CompareModel {
    std::string first_text;
    std::string second_text;
    CompareOptions options;
    ParseOptions parse_options;

    /// Tree of the last successful run; null before any run and after a failed one
    std::shared_ptr<const ComparisonResult> result;
    std::optional<SessionError> error;

    /// Number of completed runs, successful or not
    std::uint64_t revision = 0;
};

// ============================================================
// Actions
// ============================================================
namespace session_actions {

struct SetFirstText {
    std::string text;
};

struct SetSecondText {
    std::string text;
};

struct SetNumericEquality {
    NumericEquality numeric;
};

/// Exchange the two texts; clears result and error
struct SwapSides {};

/// Parse both texts and compare them
struct RunCompare {};

/// Replace the whole model; CompareSession::reset() passes the model it was created with
struct Reset {
    CompareModel model;
};

} // namespace session_actions

using SessionAction = std::variant<session_actions::SetFirstText,
                                   session_actions::SetSecondText,
                                   session_actions::SetNumericEquality,
                                   session_actions::SwapSides,
                                   session_actions::RunCompare,
                                   session_actions::Reset>;

/// Reducer: pure function of model and action
[[nodiscard]] JSONCMP_API CompareModel session_update(CompareModel model, SessionAction action);

// ============================================================
// CompareSession - store wrapper
// ============================================================
class JSONCMP_API CompareSession {
public:
    explicit CompareSession(CompareModel initial = {});
    ~CompareSession();

    CompareSession(const CompareSession&) = delete;
    CompareSession& operator=(const CompareSession&) = delete;

    void dispatch(SessionAction action);

    [[nodiscard]] const CompareModel& model() const;

    void set_first_text(std::string text);
    void set_second_text(std::string text);
    void set_numeric_equality(NumericEquality numeric);
    void swap_sides();
    void run();

    /// Back to the model the session was constructed with
    void reset();

    /// True when the model holds the tree of a successful run
    [[nodiscard]] bool has_result() const;

    using WatchCallback = std::function<void(const CompareModel&)>;

    /// Register a callback on the store, invoked after every dispatch.
    /// @return Function that disconnects the callback; safe to call after the session is gone
    [[nodiscard]] std::function<void()> watch(WatchCallback callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace jsoncmp
