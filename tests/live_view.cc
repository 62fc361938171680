#include "sigrun/console.hh"
#include "sigrun/document.hh"
#include "sigrun/live_view.hh"
#include <gtest/gtest.h>
#include <memory>

using namespace sigrun;
using nlohmann::json;

namespace {

std::vector<std::string> warnings, logs;

void record(console::Level lvl, const std::string& msg)
{
    if (lvl == console::Level::warn) {
        warnings.push_back(msg);
    } else if (lvl == console::Level::log) {
        logs.push_back(msg);
    }
}

// Counts destroyed hooks
unsigned destroyed_hooks = 0;

class Counter : public Hook {
public:
    void destroyed() override { destroyed_hooks++; }
};

class LiveViewTest : public ::testing::Test {
protected:
    Document doc;
    HookRegistry hooks;
    NodeRef root = no_node;
    std::unique_ptr<LiveView> view;
    std::vector<std::string> remounts;

    const json page = json::parse(
        R"({"s": ["<p id=\"t\" sg-hook=\"Counter\">", "</p>"], "0": "hello"})");

    void SetUp() override
    {
        root = doc.create_element("div");
        doc.insert_before(doc.body(), root, no_node);
        hooks.define("Counter", [] { return std::make_unique<Counter>(); });

        view = std::make_unique<LiveView>(doc, root, &hooks);
        view->on_remount
            = [this](const std::string& reason) { remounts.push_back(reason); };

        warnings.clear();
        logs.clear();
        destroyed_hooks = 0;
        console::sink = record;
    }

    void TearDown() override { console::sink = nullptr; }

    std::string html() const { return doc.inner_html(root); }
};
}

TEST_F(LiveViewTest, JoinThenUpdate)
{
    EXPECT_EQ(view->state(), ViewState::loading);

    auto rep = view->join(page);
    ASSERT_TRUE(rep);
    EXPECT_EQ(view->state(), ViewState::joined);
    EXPECT_EQ(html(), "<p id=\"t\" sg-hook=\"Counter\">hello</p>");
    EXPECT_EQ(hooks.size(), 1u);
    const auto p = doc.get_element_by_id("t");

    rep = view->update(json::parse(R"({"0": "world"})"));
    ASSERT_TRUE(rep);
    EXPECT_EQ(doc.get_element_by_id("t"), p);
    EXPECT_EQ(html(), "<p id=\"t\" sg-hook=\"Counter\">world</p>");
    EXPECT_EQ(rep->updated, std::vector<NodeRef> { p });
    EXPECT_EQ(view->shadow().html(), html());

    // Empty changes patch nothing
    rep = view->update(json::object());
    ASSERT_TRUE(rep);
    EXPECT_TRUE(rep->updated.empty());
}

TEST_F(LiveViewTest, UpdateBeforeJoinIgnored)
{
    EXPECT_FALSE(view->update(json::parse(R"({"0": "x"})")));
    EXPECT_EQ(view->state(), ViewState::loading);
    EXPECT_EQ(html(), "");
    EXPECT_EQ(warnings.size(), 1u);
}

TEST_F(LiveViewTest, JoinRequiresFullTree)
{
    EXPECT_FALSE(view->join(json::parse(R"({"0": "x"})")));
    EXPECT_EQ(view->state(), ViewState::failed);
    ASSERT_EQ(remounts.size(), 1u);
    EXPECT_EQ(remounts[0], view->error());
    EXPECT_FALSE(view->error().empty());
}

TEST_F(LiveViewTest, InvalidUpdateFailsAndRejoins)
{
    ASSERT_TRUE(view->join(page));

    EXPECT_FALSE(view->update(json::parse(R"({"5": "x"})")));
    EXPECT_EQ(view->state(), ViewState::failed);
    EXPECT_EQ(remounts.size(), 1u);
    EXPECT_TRUE(view->shadow().empty());

    // The DOM keeps the last good content
    EXPECT_EQ(html(), "<p id=\"t\" sg-hook=\"Counter\">hello</p>");

    // Updates are refused until rejoined
    EXPECT_FALSE(view->update(json::parse(R"({"0": "x"})")));
    EXPECT_EQ(view->state(), ViewState::failed);
    EXPECT_EQ(remounts.size(), 1u);

    const auto p = doc.get_element_by_id("t");
    ASSERT_TRUE(view->join(page));
    EXPECT_EQ(view->state(), ViewState::joined);
    EXPECT_EQ(doc.get_element_by_id("t"), p);
}

TEST_F(LiveViewTest, RepeatedFailureRemountsOnce)
{
    EXPECT_FALSE(view->join(json::parse(R"({"s": []})")));
    EXPECT_FALSE(view->join(json::parse(R"({"s": []})")));
    EXPECT_EQ(view->state(), ViewState::failed);
    EXPECT_EQ(remounts.size(), 1u);
}

TEST_F(LiveViewTest, LeaveTearsDown)
{
    ASSERT_TRUE(view->join(page));
    view->leave();
    EXPECT_EQ(view->state(), ViewState::left);
    EXPECT_EQ(destroyed_hooks, 1u);
    EXPECT_EQ(hooks.size(), 0u);
    EXPECT_TRUE(view->shadow().empty());

    EXPECT_FALSE(view->update(json::parse(R"({"0": "x"})")));
    EXPECT_FALSE(view->join(page));
    EXPECT_EQ(view->state(), ViewState::left);
    EXPECT_EQ(html(), "<p id=\"t\" sg-hook=\"Counter\">hello</p>");

    // Leaving twice is harmless
    view->leave();
    EXPECT_EQ(destroyed_hooks, 1u);
}

TEST_F(LiveViewTest, StreamItemsKeptAcrossUpdates)
{
    ASSERT_TRUE(view->join(json::parse(R"({
        "s": ["<ul id=\"msgs\" sg-update=\"stream\">", "</ul>"],
        "0": {"s": ["<li id=\"", "\">", "</li>"], "d": [["a", "A"]],
              "stream": ["msgs", [["a", -1, null]], [], false]}
    })")));
    const auto a = doc.get_element_by_id("a");
    ASSERT_NE(a, no_node);

    // The shadow no longer holds inserted items
    EXPECT_EQ(view->shadow().html(), "<ul id=\"msgs\" sg-update=\"stream\"></ul>");

    auto rep = view->update(json::parse(R"({
        "0": {"s": ["<li id=\"", "\">", "</li>"], "d": [["b", "B"]],
              "stream": ["msgs", [["b", -1, null]], [], false]}
    })"));
    ASSERT_TRUE(rep);
    auto items = doc.children(doc.get_element_by_id("msgs"));
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], a);
    EXPECT_EQ(items[1], doc.get_element_by_id("b"));

    rep = view->update(json::parse(R"({
        "0": {"s": ["<li id=\"", "\">", "</li>"], "d": [],
              "stream": ["msgs", [], ["a"], false]}
    })"));
    ASSERT_TRUE(rep);
    EXPECT_EQ(rep->discarded, std::vector<NodeRef> { a });
    EXPECT_EQ(doc.get_element_by_id("a"), no_node);
    EXPECT_EQ(doc.children(doc.get_element_by_id("msgs")).size(), 1u);
}

TEST_F(LiveViewTest, ComponentUpdates)
{
    ASSERT_TRUE(view->join(json::parse(R"({
        "s": ["<main>", "</main>"], "0": 1,
        "c": {"1": {"s": ["<p>", "</p>"], "0": "a"}}
    })")));
    EXPECT_EQ(html(), "<main><p data-sg-component=\"1\">a</p></main>");
    const auto p = doc.first_child(doc.first_child(root));

    ASSERT_TRUE(view->update(json::parse(R"({"c": {"1": {"0": "b"}}})")));
    EXPECT_EQ(html(), "<main><p data-sg-component=\"1\">b</p></main>");
    EXPECT_EQ(doc.first_child(doc.first_child(root)), p);

    // A reference to a component the client does not have
    EXPECT_FALSE(view->update(json::parse(R"({"0": 2})")));
    EXPECT_EQ(view->state(), ViewState::failed);
    EXPECT_EQ(remounts.size(), 1u);
    EXPECT_EQ(html(), "<main><p data-sg-component=\"1\">b</p></main>");
}

TEST_F(LiveViewTest, RejoinIsLogged)
{
    EXPECT_FALSE(view->join(json::parse(R"({"0": "x"})")));
    EXPECT_TRUE(logs.empty());

    ASSERT_TRUE(view->join(page));
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0], "view rejoined after failure: " + view->error());

    ASSERT_TRUE(view->join(page));
    EXPECT_EQ(logs.size(), 1u);
}
