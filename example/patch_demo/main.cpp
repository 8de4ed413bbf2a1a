// main.cpp - JSON Patch Example
//
// A small document store: patches are dispatched as actions, failed
// patches leave the document alone, and every applied patch can be undone.

#include <jsonrfc/patch.h>
#include <jsonrfc/pointer.h>
#include <jsonrfc/pointer_lens.h>

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <immer/vector.hpp>

#include <iostream>
#include <string>
#include <variant>
#include <vector>

using namespace jsonrfc;

// ============================================================
// Application State and Actions
// ============================================================

struct ApplyPatch
{
    std::vector<patch::Operation> ops;
};

struct Undo {};
struct Redo {};

using Action = std::variant<ApplyPatch, Undo, Redo>;

struct AppState
{
    Value document;
    immer::vector<Value> history;
    immer::vector<Value> future;
    std::string last_error;
};

AppState create_initial_state()
{
    return AppState{
        .document = Value::map({{"foo", Value::vector({})}, {"byebye", 5}}),
        .history = {},
        .future = {},
        .last_error = {},
    };
}

// ============================================================
// Reducer
// ============================================================

AppState reducer(AppState state, Action action)
{
    return std::visit(
        [&](auto&& act) -> AppState {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, Undo>) {
                if (state.history.empty())
                    return state;

                auto new_state = state;
                new_state.future = new_state.future.push_back(new_state.document);
                new_state.document = new_state.history.back();
                new_state.history = new_state.history.take(new_state.history.size() - 1);
                return new_state;

            } else if constexpr (std::is_same_v<T, Redo>) {
                if (state.future.empty())
                    return state;

                auto new_state = state;
                new_state.history = new_state.history.push_back(new_state.document);
                new_state.document = new_state.future.back();
                new_state.future = new_state.future.take(new_state.future.size() - 1);
                return new_state;

            } else if constexpr (std::is_same_v<T, ApplyPatch>) {
                auto result = patch::evaluate(state.document, act.ops);
                auto new_state = state;
                if (!result) {
                    new_state.last_error = to_string(result.error());
                    return new_state;
                }
                new_state.history = new_state.history.push_back(state.document);
                new_state.future = immer::vector<Value>{};
                new_state.document = std::move(result).value();
                new_state.last_error.clear();
                return new_state;
            }

            return state;
        },
        action);
}

// ============================================================
// Main Application
// ============================================================

namespace {

void show(const AppState& state)
{
    std::cout << "  document: " << value_to_string(state.document) << "\n";
    if (!state.last_error.empty()) {
        std::cout << "  rejected: " << state.last_error << "\n";
    }
}

} // namespace

int main()
{
    auto loop = lager::with_manual_event_loop{};
    auto store = lager::make_store<Action>(
        create_initial_state(),
        loop,
        lager::with_reducer(reducer));

    std::cout << "=== JSON Patch Example ===\n";
    show(store.get());

    std::cout << "\n1. Patch decoded from operation records\n";
    Value records = Value::vector({
        Value::map({{"op", "add"}, {"path", "/bar"}, {"value", 3}}),
        Value::map({{"op", "replace"}, {"path", "/foo"}, {"value", Value::map({})}}),
        Value::map({{"op", "remove"}, {"path", "/byebye"}}),
        Value::map({{"op", "move"}, {"from", "/bar"}, {"path", "/foo/bar"}}),
        Value::map({{"op", "copy"}, {"from", "/foo"}, {"path", "/baz"}}),
    });
    auto decoded = patch::patch_from_value(records);
    if (!decoded) {
        std::cerr << to_string(decoded.error()) << "\n";
        return 1;
    }
    store.dispatch(ApplyPatch{decoded.value()});
    show(store.get());

    std::cout << "\n2. A failing patch changes nothing\n";
    store.dispatch(ApplyPatch{{patch::add("/list", Value::vector({})), patch::replace("/missing", 1)}});
    show(store.get());

    std::cout << "\n3. Appending with the \"-\" marker\n";
    store.dispatch(ApplyPatch{{
        patch::add("/list", Value::vector({"a"})),
        patch::add("/list/-", "b"),
        patch::add("/list/0", "first"),
    }});
    show(store.get());

    std::cout << "\n4. Reading through pointers and lenses\n";
    const Value& doc = store.get().document;
    std::cout << "  /list/1   = " << value_to_string(fetch(doc, "/list/1").get_or(Value{})) << "\n";
    std::cout << "  /baz/bar  = " << value_to_string(get_by_pointer(doc, "/baz/bar")) << "\n";
    std::cout << "  /nothing  = " << to_string(fetch(doc, "/nothing").error()) << "\n";

    std::cout << "\n5. Undo, then redo\n";
    store.dispatch(Undo{});
    show(store.get());
    store.dispatch(Redo{});
    show(store.get());

    std::cout << "\n6. Patch records for the applied operations\n";
    auto replayed = patch::evaluate_with_ops(Value::map({}), {patch::add("/x", 1), patch::copy("/x", "/y")});
    if (replayed) {
        print_value(patch::patch_to_value(replayed.value().ops), "  ", 1);
        std::cout << "  result: " << value_to_string(replayed.value().document) << "\n";
    }

    return 0;
}
