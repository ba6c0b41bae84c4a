// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// compare_session.cpp - session reducer and lager store wrapper

#include <jsoncmp/compare_session.h>

#include <lager/event_loop/manual.hpp>
#include <lager/reader.hpp>
#include <lager/store.hpp>
#include <lager/watch.hpp>

#include <map>

namespace jsoncmp {

namespace {

CompareModel run_compare(CompareModel model)
{
    ++model.revision;
    model.result.reset();
    model.error.reset();

    Value first;
    try {
        first = parse_json(model.first_text, model.parse_options);
    } catch (const JsonParseError& e) {
        model.error = SessionError{SessionError::Kind::ParseFirst, e.what()};
        return model;
    }

    Value second;
    try {
        second = parse_json(model.second_text, model.parse_options);
    } catch (const JsonParseError& e) {
        model.error = SessionError{SessionError::Kind::ParseSecond, e.what()};
        return model;
    }

    try {
        model.result = std::make_shared<const ComparisonResult>(
            TreeComparator{model.options}.compare(first, second));
    } catch (const InvalidRootType& e) {
        model.error = SessionError{SessionError::Kind::InvalidRoot, e.what()};
    }
    return model;
}

} // anonymous namespace

// ============================================================
// Reducer
// ============================================================

CompareModel session_update(CompareModel model, SessionAction action)
{
    return std::visit(
        [&model](auto&& act) -> CompareModel {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, session_actions::SetFirstText>) {
                model.first_text = std::move(act.text);
                return model;
            }

            else if constexpr (std::is_same_v<T, session_actions::SetSecondText>) {
                model.second_text = std::move(act.text);
                return model;
            }

            else if constexpr (std::is_same_v<T, session_actions::SetNumericEquality>) {
                model.options.numeric = act.numeric;
                return model;
            }

            else if constexpr (std::is_same_v<T, session_actions::SwapSides>) {
                std::swap(model.first_text, model.second_text);
                model.result.reset();
                model.error.reset();
                return model;
            }

            else if constexpr (std::is_same_v<T, session_actions::RunCompare>) {
                return run_compare(std::move(model));
            }

            else if constexpr (std::is_same_v<T, session_actions::Reset>) {
                return std::move(act.model);
            }

            else {
                static_assert(detail::always_false_v<T>, "unhandled session action");
            }
        },
        action);
}

// Store type deduction helper
inline auto make_session_store_impl(CompareModel initial)
{
    return lager::make_store<SessionAction>(std::move(initial), lager::with_manual_event_loop{},
                                            lager::with_reducer(session_update));
}

using SessionStoreType = decltype(make_session_store_impl(std::declval<CompareModel>()));

// ============================================================
// CompareSession Implementation
// ============================================================

// One reader per watch() call; dropping the reader disconnects its callback
using WatcherMap = std::map<std::uint64_t, lager::reader<CompareModel>>;

struct CompareSession::Impl {
    CompareModel initial;
    std::unique_ptr<SessionStoreType> store;
    std::shared_ptr<WatcherMap> watchers = std::make_shared<WatcherMap>();
    std::uint64_t next_watcher_id = 0;
};

CompareSession::CompareSession(CompareModel initial) : impl_(std::make_unique<Impl>())
{
    impl_->initial = initial;
    impl_->store = std::make_unique<SessionStoreType>(make_session_store_impl(std::move(initial)));
}

CompareSession::~CompareSession() = default;

void CompareSession::dispatch(SessionAction action)
{
    impl_->store->dispatch(std::move(action));
}

const CompareModel& CompareSession::model() const
{
    return impl_->store->get();
}

void CompareSession::set_first_text(std::string text)
{
    dispatch(session_actions::SetFirstText{std::move(text)});
}

void CompareSession::set_second_text(std::string text)
{
    dispatch(session_actions::SetSecondText{std::move(text)});
}

void CompareSession::set_numeric_equality(NumericEquality numeric)
{
    dispatch(session_actions::SetNumericEquality{numeric});
}

void CompareSession::swap_sides()
{
    dispatch(session_actions::SwapSides{});
}

void CompareSession::run()
{
    dispatch(session_actions::RunCompare{});
}

void CompareSession::reset()
{
    dispatch(session_actions::Reset{impl_->initial});
}

bool CompareSession::has_result() const
{
    return model().result != nullptr;
}

std::function<void()> CompareSession::watch(WatchCallback callback)
{
    const auto id = impl_->next_watcher_id++;
    auto [it, inserted] = impl_->watchers->emplace(id, lager::reader<CompareModel>{*impl_->store});
    lager::watch(it->second, std::move(callback));

    std::weak_ptr<WatcherMap> weak = impl_->watchers;
    return [weak, id]() {
        if (auto watchers = weak.lock()) {
            watchers->erase(id);
        }
    };
}

} // namespace jsoncmp
