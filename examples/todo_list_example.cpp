#include <reactivedom/ReactiveDom.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace RD;
using namespace RD::Dom;

namespace {

struct Todo {
    int         id = 0;
    std::string title;
    bool        done = false;

    auto operator==(Todo const&) const -> bool = default;
};

struct TodoState {
    std::vector<Todo> todos;
    std::string       filter = "all";
    int               nextId = 1;

    auto operator==(TodoState const&) const -> bool = default;
};

auto visibleTodos(TodoState const& state) -> std::vector<Todo> {
    std::vector<Todo> out;
    for (auto const& todo : state.todos) {
        if (state.filter == "all" || (state.filter == "done") == todo.done)
            out.push_back(todo);
    }
    return out;
}

auto addTodo(Store<TodoState> const& store, std::string title) -> void {
    store.patch([&](TodoState& draft) {
        draft.todos.push_back(Todo{draft.nextId++, std::move(title), false});
    });
}

auto toggleTodo(Store<TodoState> const& store, int id) -> void {
    store.patch([id](TodoState& draft) {
        for (auto& todo : draft.todos) {
            if (todo.id == id)
                todo.done = !todo.done;
        }
    });
}

auto renderItem(Todo const& todo) -> Node::Ptr {
    auto li = Element::create("li");
    li->setAttribute("data-id", std::to_string(todo.id));
    if (todo.done)
        li->addClass("done");
    if (auto appended = li->appendChild(Text::create(todo.title)); !appended)
        std::cerr << "appendChild failed: " << describeError(appended.error()) << '\n';
    return li;
}

auto step(std::string_view label, Node const& root) -> bool {
    auto flushed = flush();
    if (!flushed) {
        std::cerr << "flush failed: " << describeError(flushed.error()) << '\n';
        return false;
    }
    std::cout << label << ":\n  " << root.outerHtml() << '\n';
    return true;
}

} // namespace

int main(int argc, char** argv) {
    bool dump_json = false;
    for (int idx = 1; idx < argc; ++idx) {
        std::string_view arg{argv[idx]};
        if (arg == "--dump_json") {
            dump_json = true;
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            std::cerr << "Usage: " << argv[0] << " [--dump_json]\n";
            return 1;
        }
    }

    auto options = RuntimeOptions::fromEnvironment();
    if (!options) {
        std::cerr << "RuntimeOptions::fromEnvironment failed: " << describeError(options.error()) << '\n';
        return 1;
    }
    options->inspectCells = options->inspectCells || dump_json;
    configureRuntime(*options);

    Store<TodoState> store(TodoState{});
    auto             filter = store.branch([](TodoState const& state) { return state.filter; },
                                           [](TodoState state, std::string next) {
                                               state.filter = std::move(next);
                                               return state;
                                           });
    auto visible   = derive(store.value(), [](TodoState const& state) { return visibleTodos(state); });
    auto remaining = derive([&] {
        int open = 0;
        for (auto const& todo : store.value().get().todos)
            open += todo.done ? 0 : 1;
        return open;
    });

    auto root = Element::create("main");
    auto app  = component([&]() -> Node::Ptr {
        auto section = Element::create("section");
        auto header  = Element::create("h1");
        auto counter = Text::create();
        bindText(counter, remaining, [](int open) { return std::to_string(open) + " left"; });
        bindAttribute(section, "data-filter", filter.value());
        if (auto hooked = onMount([] { std::cout << "todo list mounted\n"; }); !hooked) {
            std::cerr << "onMount failed: " << describeError(hooked.error()) << '\n';
            return nullptr;
        }

        auto list = Element::create("ul");
        if (auto bound = bindList(list, visible, [](Todo const& todo) { return todo.id; }, renderItem); !bound) {
            std::cerr << "bindList failed: " << describeError(bound.error()) << '\n';
            return nullptr;
        }

        for (auto const& appended : {header->appendChild(counter), section->appendChild(header), section->appendChild(list)}) {
            if (!appended) {
                std::cerr << "appendChild failed: " << describeError(appended.error()) << '\n';
                return nullptr;
            }
        }
        return section;
    });
    if (!app)
        return 1;
    if (auto mounted = mount(*root, app); !mounted) {
        std::cerr << "mount failed: " << describeError(mounted.error()) << '\n';
        return 1;
    }
    if (!step("empty", *root))
        return 1;

    batch([&] {
        addTodo(store, "write the reconciler");
        addTodo(store, "test the binder");
        addTodo(store, "ship it");
    });
    if (!step("three todos", *root))
        return 1;

    toggleTodo(store, 2);
    if (!step("second done", *root))
        return 1;

    filter.set("done");
    if (!step("done filter", *root))
        return 1;

    if (dump_json) {
        auto snapshot = Inspector::BuildGraphSnapshot(CellRegistry::current());
        std::cout << Inspector::SerializeGraphSnapshot(snapshot) << '\n';
    }

    unmount(app);
    remaining.dispose();
    visible.dispose();
    filter.value().dispose();
    return 0;
}
