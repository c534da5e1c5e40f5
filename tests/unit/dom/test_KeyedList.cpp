#include "../ReactiveTestHelper.hpp"

#include <reactivedom/dom/Binder.hpp>
#include <reactivedom/dom/Component.hpp>
#include <reactivedom/dom/KeyedList.hpp>
#include <reactivedom/reactive/Cell.hpp>
#include <reactivedom/reactive/Lifecycle.hpp>

#include <doctest/doctest.h>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace RD;
using namespace RD::Dom;

namespace {

struct Row {
    std::string id;
    std::string label;

    auto operator==(Row const&) const -> bool = default;
};

auto rowKey(Row const& row) -> std::string {
    return row.id;
}

auto renderRow(Row const& row) -> Node::Ptr {
    auto li = Element::create("li");
    li->setAttribute("data-key", row.id);
    auto appended = li->appendChild(Text::create(row.label));
    REQUIRE(appended);
    return li;
}

auto keysOf(ChildRegion const& region) -> std::vector<std::string> {
    std::vector<std::string> keys;
    for (auto const& node : region.nodes()) {
        auto const& el = static_cast<Element const&>(*node);
        keys.push_back(el.getAttribute("data-key").value_or("?"));
    }
    return keys;
}

} // namespace

TEST_SUITE("dom.keyed_list") {

TEST_CASE_FIXTURE(ReactiveFixture, "reconcile keeps the nodes of surviving keys") {
    auto parent = Element::create("ul");
    auto region = ChildRegion::create(*parent, "list");
    REQUIRE(region);
    KeyedNodeMap<std::string> nodes;

    std::vector<Row> first{{"a", "A"}, {"b", "B"}, {"c", "C"}};
    auto             initial = reconcile(*region, nodes, first, rowKey, renderRow);
    REQUIRE(initial);
    CHECK(initial->created == 3);
    CHECK(keysOf(*region) == std::vector<std::string>{"a", "b", "c"});
    auto nodeA = nodes.at("a");
    auto nodeC = nodes.at("c");

    std::vector<Row> second{{"c", "C"}, {"a", "A"}};
    auto             next = reconcile(*region, nodes, second, rowKey, renderRow);
    REQUIRE(next);
    CHECK(next->created == 0);
    CHECK(next->removed == 1);
    CHECK(next->reused == 2);
    CHECK(next->moved == 1);
    CHECK(keysOf(*region) == std::vector<std::string>{"c", "a"});
    CHECK(nodes.at("a") == nodeA);
    CHECK(nodes.at("c") == nodeC);
    CHECK_FALSE(nodes.contains("b"));
}

TEST_CASE_FIXTURE(ReactiveFixture, "reconcile creates new keys in position") {
    auto parent = Element::create("ul");
    auto region = ChildRegion::create(*parent, "list");
    REQUIRE(region);
    KeyedNodeMap<std::string> nodes;
    REQUIRE(reconcile(*region, nodes, std::vector<Row>{{"a", "A"}, {"c", "C"}}, rowKey, renderRow));

    auto stats = reconcile(*region, nodes, std::vector<Row>{{"a", "A"}, {"b", "B"}, {"c", "C"}, {"d", "D"}}, rowKey,
                           renderRow);
    REQUIRE(stats);
    CHECK(stats->created == 2);
    CHECK(stats->moved == 0);
    CHECK(keysOf(*region) == std::vector<std::string>{"a", "b", "c", "d"});
}

TEST_CASE_FIXTURE(ReactiveFixture, "duplicate keys are rejected before any mutation") {
    auto parent = Element::create("ul");
    auto region = ChildRegion::create(*parent, "list");
    REQUIRE(region);
    KeyedNodeMap<std::string> nodes;
    REQUIRE(reconcile(*region, nodes, std::vector<Row>{{"a", "A"}, {"b", "B"}}, rowKey, renderRow));
    auto before = region->nodes();

    auto result = reconcile(*region, nodes, std::vector<Row>{{"x", "X"}, {"x", "Y"}}, rowKey, renderRow);
    REQUIRE_FALSE(result);
    CHECK(result.error().code == Error::Code::DuplicateKey);
    CHECK(region->nodes() == before);
    CHECK(nodes.size() == 2);
}

TEST_CASE_FIXTURE(ReactiveFixture, "an empty list clears the region but keeps the markers") {
    auto parent = Element::create("ul");
    auto region = ChildRegion::create(*parent, "list");
    REQUIRE(region);
    KeyedNodeMap<std::string> nodes;
    REQUIRE(reconcile(*region, nodes, std::vector<Row>{{"a", "A"}, {"b", "B"}}, rowKey, renderRow));

    auto cleared = reconcile(*region, nodes, std::vector<Row>{}, rowKey, renderRow);
    REQUIRE(cleared);
    CHECK(cleared->removed == 2);
    CHECK(region->empty());
    CHECK(parent->childCount() == 2);
    CHECK(nodes.empty());
}

TEST_CASE_FIXTURE(ReactiveFixture, "render results must be single nodes") {
    auto parent = Element::create("ul");
    auto region = ChildRegion::create(*parent, "list");
    REQUIRE(region);
    KeyedNodeMap<int> nodes;
    auto result = reconcile(*region, nodes, std::vector<int>{1}, [](int value) { return value; },
                            [](int) -> Node::Ptr { return Fragment::create(); });
    REQUIRE_FALSE(result);
    CHECK(result.error().code == Error::Code::InvalidNode);
}

TEST_CASE_FIXTURE(ReactiveFixture, "detached markers report NotFound") {
    auto parent = Element::create("ul");
    auto region = ChildRegion::create(*parent, "list");
    REQUIRE(region);
    region->end()->remove();
    KeyedNodeMap<std::string> nodes;
    auto result = reconcile(*region, nodes, std::vector<Row>{{"a", "A"}}, rowKey, renderRow);
    REQUIRE_FALSE(result);
    CHECK(result.error().code == Error::Code::NotFound);
}

TEST_CASE_FIXTURE(ReactiveFixture, "bindList follows the cell and disposes removed item scopes") {
    auto                       rows = makeCell(std::vector<Row>{{"a", "A"}, {"b", "B"}});
    std::map<std::string, int> mounted;
    std::map<std::string, int> disposed;
    auto                       parent = Element::create("ul");

    auto binding = bindList(parent, rows, rowKey, [&](Row const& row) -> Node::Ptr {
        auto onMounted = onMount([&, id = row.id] { ++mounted[id]; });
        REQUIRE(onMounted);
        auto onRemoved = onUnmount([&, id = row.id] { ++disposed[id]; });
        REQUIRE(onRemoved);
        return renderRow(row);
    });
    REQUIRE(binding);
    CHECK(binding->size() == 2);
    CHECK(mounted.empty());

    rows.set({{"b", "B"}, {"c", "C"}});
    drain();
    CHECK(keysOf(binding->region()) == std::vector<std::string>{"b", "c"});
    CHECK(disposed == std::map<std::string, int>{{"a", 1}});
    CHECK(mounted == std::map<std::string, int>{{"c", 1}});
    CHECK(binding->lastStats().created == 1);
    CHECK(binding->lastStats().removed == 1);

    rows.set({{"c", "C"}, {"c", "again"}});
    drain();
    CHECK(keysOf(binding->region()) == std::vector<std::string>{"b", "c"});

    binding->dispose();
    rows.set({});
    drain();
    CHECK(binding->size() == 2);

    binding->release();
    CHECK(binding->size() == 0);
    CHECK(disposed == std::map<std::string, int>{{"a", 1}, {"b", 1}, {"c", 1}});
}

TEST_CASE_FIXTURE(ReactiveFixture, "item bindings die with their item") {
    auto rows   = makeCell(std::vector<Row>{{"a", "A"}});
    auto accent = makeCell(std::string("red"));
    auto parent = Element::create("ul");

    auto binding = bindList(parent, rows, rowKey, [&](Row const& row) -> Node::Ptr {
        auto li   = Element::create("li");
        li->setAttribute("data-key", row.id);
        auto stop = bindAttribute(li, "data-accent", accent);
        (void)stop;
        return li;
    });
    REQUIRE(binding);
    CHECK(accent.subscriberCount() == 1);

    rows.set({});
    drain();
    CHECK(accent.subscriberCount() == 0);
    binding->release();
}

TEST_CASE_FIXTURE(ReactiveFixture, "component scopes mount with the tree and die on unmount") {
    std::vector<std::string> log;
    auto                     label = makeCell(std::string("hi"));

    auto view = component([&]() -> Node::Ptr {
        auto p    = Element::create("p");
        auto text = Text::create();
        auto ok   = p->appendChild(text);
        REQUIRE(ok);
        auto stop = bindText(text, label);
        (void)stop;
        auto hook = onMount([&] { log.push_back("mounted"); });
        REQUIRE(hook);
        auto gone = onUnmount([&] { log.push_back("unmounted"); });
        REQUIRE(gone);
        return p;
    });
    REQUIRE(view);
    CHECK(view->scopes().size() == 1);
    CHECK(log.empty());

    auto root = Element::create("main");
    REQUIRE(mount(*root, view));
    CHECK(log == std::vector<std::string>{"mounted"});
    CHECK(root->textContent() == "hi");

    label.set("bye");
    drain();
    CHECK(root->textContent() == "bye");

    unmount(view);
    CHECK(log == std::vector<std::string>{"mounted", "unmounted"});
    CHECK_FALSE(root->hasChildren());
    CHECK(label.subscriberCount() == 0);
}

TEST_CASE_FIXTURE(ReactiveFixture, "a component that throws disposes what it registered") {
    auto cell = makeCell(1);
    CHECK_THROWS_AS(component([&]() -> Node::Ptr {
                        auto text = Text::create();
                        auto stop = bindText(text, cell);
                        (void)stop;
                        throw std::runtime_error("render failed");
                    }),
                    std::runtime_error);
    CHECK(cell.subscriberCount() == 0);
}

TEST_CASE_FIXTURE(ReactiveFixture, "fragment components attach the scope to every child") {
    int  disposed = 0;
    auto view     = component([&]() -> Node::Ptr {
        auto fragment = Fragment::create();
        auto a        = fragment->appendChild(Element::create("dt"));
        auto b        = fragment->appendChild(Element::create("dd"));
        REQUIRE(a);
        REQUIRE(b);
        auto hook = onUnmount([&] { ++disposed; });
        REQUIRE(hook);
        return fragment;
    });
    auto root = Element::create("dl");
    REQUIRE(mount(*root, view));
    CHECK(root->childCount() == 2);
    for (auto const& child : root->children())
        CHECK(child->scopes().size() == 1);

    unmount(root->firstChild());
    unmount(root->firstChild());
    CHECK(disposed == 1);
}

}
