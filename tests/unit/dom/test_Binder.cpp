#include "../ReactiveTestHelper.hpp"

#include <reactivedom/dom/Binder.hpp>
#include <reactivedom/reactive/Cell.hpp>

#include <doctest/doctest.h>

#include <optional>
#include <string>
#include <vector>

using namespace RD;
using namespace RD::Dom;

TEST_SUITE("dom.binder") {

TEST_CASE_FIXTURE(ReactiveFixture, "bindText writes the text form now and on every pass") {
    auto count = makeCell(3);
    auto text  = Text::create();
    auto stop  = bindText(text, count);
    CHECK(text->data() == "3");

    count.set(42);
    CHECK(text->data() == "3");
    drain();
    CHECK(text->data() == "42");

    auto price = makeCell(2.5);
    auto label = Text::create();
    auto stopPrice = bindText(label, price, [](double value) { return "$" + std::to_string(static_cast<int>(value * 100)); });
    CHECK(label->data() == "$250");

    stop();
    count.set(7);
    drain();
    CHECK(text->data() == "42");
    stopPrice();
}

TEST_CASE_FIXTURE(ReactiveFixture, "bindAttribute handles booleans, optionals and values") {
    auto el       = Element::create("button");
    auto disabled = makeCell(true);
    auto title    = makeCell(std::optional<std::string>{"save"});
    auto width    = makeCell(120);
    auto a = bindAttribute(el, "disabled", disabled);
    auto b = bindAttribute(el, "title", title);
    auto c = bindAttribute(el, "width", width);

    CHECK(el->getAttribute("disabled") == std::optional<std::string>{""});
    CHECK(el->getAttribute("title") == std::optional<std::string>{"save"});
    CHECK(el->getAttribute("width") == std::optional<std::string>{"120"});

    disabled.set(false);
    title.set(std::nullopt);
    width.set(80);
    drain();
    CHECK_FALSE(el->hasAttribute("disabled"));
    CHECK_FALSE(el->hasAttribute("title"));
    CHECK(el->getAttribute("width") == std::optional<std::string>{"80"});
    a();
    b();
    c();
}

TEST_CASE_FIXTURE(ReactiveFixture, "bindClass only manages tokens it contributed") {
    auto el = Element::create("div");
    el->addClass("x");
    auto classes = makeCell(std::string("a b"));
    auto stop    = bindClass(el, classes);
    CHECK(el->getAttribute("class") == std::optional<std::string>{"x a b"});

    classes.set("b c");
    drain();
    CHECK(el->classTokens() == std::vector<std::string>{"x", "b", "c"});

    auto list     = makeCell(std::vector<std::string>{"one", "two three"});
    auto listed   = Element::create("div");
    auto stopList = bindClass(listed, list);
    CHECK(listed->classTokens() == std::vector<std::string>{"one", "two", "three"});
    list.set({});
    drain();
    CHECK_FALSE(listed->hasAttribute("class"));
    stop();
    stopList();
}

TEST_CASE_FIXTURE(ReactiveFixture, "bindStyle with a property map diffs against the previous map") {
    auto el = Element::create("div");
    el->setStyleProperty("display", "block");
    auto style = makeCell(StyleMap{{"color", "red"}, {"margin", "0"}});
    auto stop  = bindStyle(el, style);
    CHECK(el->cssText() == "display: block; color: red; margin: 0;");

    style.set(StyleMap{{"color", "blue"}});
    drain();
    CHECK(el->cssText() == "display: block; color: blue;");
    stop();
}

TEST_CASE_FIXTURE(ReactiveFixture, "bindStyle with css text replaces the style attribute") {
    auto el   = Element::create("div");
    auto css  = makeCell(std::string("color: red"));
    auto stop = bindStyle(el, css);
    CHECK(el->cssText() == "color: red;");
    css.set("");
    drain();
    CHECK_FALSE(el->hasAttribute("style"));
    stop();
}

TEST_CASE_FIXTURE(ReactiveFixture, "bindStyle with mixed entries binds only the reactive ones") {
    auto el    = Element::create("div");
    auto color = makeCell(std::string("red"));
    auto stop  = bindStyle(el, std::vector<StyleEntry>{{"display", std::string("flex")}, {"color", color}});
    CHECK(el->cssText() == "display: flex; color: red;");
    CHECK(color.subscriberCount() == 1);

    color.set("");
    drain();
    CHECK(el->cssText() == "display: flex;");

    stop();
    CHECK(color.subscriberCount() == 0);
}

TEST_CASE_FIXTURE(ReactiveFixture, "bindStyleProperty removes the property for empty values") {
    auto el    = Element::create("div");
    auto width = makeCell(std::optional<int>{10});
    auto stop  = bindStyleProperty(el, "width", width);
    CHECK(el->styleProperty("width") == std::optional<std::string>{"10"});
    width.set(std::nullopt);
    drain();
    CHECK_FALSE(el->styleProperty("width").has_value());
    stop();
}

TEST_CASE_FIXTURE(ReactiveFixture, "bindings do not keep their node alive") {
    auto                        cell = makeCell(1);
    std::weak_ptr<Text>         weak;
    Cleanup                     stop;
    {
        auto text = Text::create();
        weak      = text;
        stop      = bindText(text, cell);
    }
    CHECK(weak.expired());
    cell.set(2);
    drain();
    stop();
}

TEST_CASE_FIXTURE(ReactiveFixture, "bindChild renders text and swaps in nodes") {
    auto parent = Element::create("div");
    REQUIRE(parent->appendChild(Text::create("before ")));
    auto content = makeCell(std::string("hello"));
    auto stop    = bindChild(parent, content);
    REQUIRE(stop);
    CHECK(parent->textContent() == "before hello");
    CHECK(parent->outerHtml() == "<div>before <!--child-->hello<!--/child--></div>");

    auto text = parent->children()[2];
    content.set("world");
    drain();
    CHECK(parent->children()[2] == text);
    CHECK(parent->textContent() == "before world");
    (*stop)();

    auto bold = Element::create("b");
    REQUIRE(bold->appendChild(Text::create("x")));
    auto node      = makeCell(Node::Ptr(bold));
    auto host      = Element::create("p");
    auto stopNode  = bindChild(host, node);
    REQUIRE(stopNode);
    CHECK(host->outerHtml() == "<p><!--child--><b>x</b><!--/child--></p>");

    node.set(Node::Ptr{});
    drain();
    CHECK(host->outerHtml() == "<p><!--child--><!--/child--></p>");
    CHECK(bold->parent() == nullptr);
    (*stopNode)();
}

TEST_CASE_FIXTURE(ReactiveFixture, "child nodes leaving the region have their scopes disposed") {
    int  disposed = 0;
    auto item     = Element::create("li");
    auto scope    = std::make_shared<LifecycleScope>();
    scope->addCleanup(Cleanup([&] { ++disposed; }));
    item->attachScope(scope);

    auto parent = Element::create("ul");
    auto items  = makeCell(std::vector<Node::Ptr>{item});
    auto stop   = bindChild(parent, items);
    REQUIRE(stop);
    items.set({});
    drain();
    CHECK(disposed == 1);
    (*stop)();
}

}
