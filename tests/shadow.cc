#include "sigrun/errors.hh"
#include "sigrun/serializer.hh"
#include "sigrun/shadow.hh"
#include <gtest/gtest.h>

using namespace sigrun;
using nlohmann::json;

TEST(Shadow, FullTreeThenChanges)
{
    Shadow s;
    EXPECT_TRUE(s.empty());

    s.merge(json::parse(R"({"s": ["<p>", "</p>"], "0": "hello"})"));
    EXPECT_FALSE(s.empty());
    EXPECT_EQ(s.html(), "<p>hello</p>");

    s.merge(json::parse(R"({"0": "world"})"));
    EXPECT_EQ(s.html(), "<p>world</p>");

    // Empty changes leave the tree as is
    s.merge(json::object());
    EXPECT_EQ(s.html(), "<p>world</p>");
}

TEST(Shadow, FullTreeReplaces)
{
    Shadow s;
    s.merge(json::parse(R"({"s": ["<p>", "</p>"], "0": "a"})"));
    s.merge(json::parse(R"({"s": ["<b>", "</b>"], "0": "b"})"));
    EXPECT_EQ(s.html(), "<b>b</b>");
}

TEST(Shadow, ChangesBeforeTreeThrow)
{
    Shadow s;
    EXPECT_THROW(s.merge(json::parse(R"({"0": "x"})")), Error);
    EXPECT_THROW(s.tree(), Error);
    EXPECT_THROW(s.html(), Error);
}

TEST(Shadow, InvalidChangesLeaveTreeUnchanged)
{
    Shadow s;
    s.merge(json::parse(R"({"s": ["<p>", "</p>"], "0": "a"})"));
    EXPECT_THROW(s.merge(json::parse(R"({"5": "x"})")), StructuralMismatch);
    EXPECT_THROW(s.merge(json::parse(R"({"x": "x"})")), DecodeError);
    EXPECT_EQ(s.html(), "<p>a</p>");
}

TEST(Shadow, ComprehensionUpdates)
{
    Shadow s;
    s.merge(json::parse(R"({
        "s": ["<ul>", "</ul>"],
        "0": {"s": ["<li>", "</li>"], "d": [["a"], ["b"]]}
    })"));
    EXPECT_EQ(s.html(), "<ul><li>a</li><li>b</li></ul>");

    s.merge(json::parse(R"({"0": {"n": 3, "d": {"0": {"0": "A"}, "2": ["c"]}}})"));
    EXPECT_EQ(s.html(), "<ul><li>A</li><li>b</li><li>c</li></ul>");

    s.merge(json::parse(R"({"0": {"n": 1}})"));
    EXPECT_EQ(s.html(), "<ul><li>A</li></ul>");

    s.clear();
    EXPECT_TRUE(s.empty());
}

TEST(Shadow, ComponentChanges)
{
    Shadow s;
    s.merge(json::parse(R"({
        "s": ["<div>", "", "</div>"], "0": 1, "1": 2,
        "c": {
            "1": {"s": ["<p>", "</p>"], "0": "a"},
            "2": {"s": 1, "0": "b"}
        }
    })"));
    EXPECT_EQ(s.components().size(), 2u);
    EXPECT_EQ(s.html(),
        "<div><p data-sg-component=\"1\">a</p>"
        "<p data-sg-component=\"2\">b</p></div>");

    s.merge(json::parse(R"({"1": 3, "c": {"2": null, "3": {"s": -1, "0": "c"}}})"));
    EXPECT_EQ(s.components().count(2), 0u);
    EXPECT_EQ(s.html(),
        "<div><p data-sg-component=\"1\">a</p>"
        "<p data-sg-component=\"3\">c</p></div>");

    // Changes to unknown components
    EXPECT_THROW(s.merge(json::parse(R"({"c": {"7": {"0": "x"}}})")),
        StructuralMismatch);
    EXPECT_EQ(s.components().size(), 2u);

    s.clear();
    EXPECT_TRUE(s.components().empty());
}

TEST(Shadow, FailedComponentMergeLeavesTreeUnchanged)
{
    Shadow s;
    s.merge(json::parse(R"({
        "s": ["<div>", "</div>"], "0": 1,
        "c": {"1": {"s": ["<p>", "</p>"], "0": "a"}}
    })"));
    EXPECT_THROW(s.merge(json::parse(R"({"0": 2, "c": {"2": {"0": "x"}}})")),
        StructuralMismatch);
    EXPECT_EQ(s.tree()[0].component(), 1u);
    EXPECT_EQ(s.html(), "<div><p data-sg-component=\"1\">a</p></div>");
}

TEST(Shadow, StreamsPrunedOnceApplied)
{
    Shadow s;
    s.merge(json::parse(R"({
        "s": ["<ul sg-update=\"stream\" id=\"list\">", "</ul>"],
        "0": {"s": ["<li id=\"", "\">", "</li>"], "d": [["a", "A"]],
              "stream": ["items", [["a", -1, null]], [], false]}
    })"));
    EXPECT_EQ(s.html(),
        "<ul sg-update=\"stream\" id=\"list\"><li id=\"a\">A</li></ul>");
    auto streams = s.streams();
    ASSERT_EQ(streams.size(), 1u);
    EXPECT_EQ(streams[0].ref, "items");
    ASSERT_EQ(streams[0].inserts.size(), 1u);
    EXPECT_EQ(streams[0].inserts[0].id, "a");

    s.prune_streams();
    EXPECT_EQ(s.html(), "<ul sg-update=\"stream\" id=\"list\"></ul>");
    ASSERT_EQ(s.streams().size(), 1u);
    EXPECT_TRUE(s.streams()[0].empty());

    // A later stream render replaces the pruned one
    s.merge(json::parse(R"({
        "0": {"s": ["<li id=\"", "\">", "</li>"], "d": [["b", "B"]],
              "stream": ["items", [["b", 0, null]], ["a"], false]}
    })"));
    EXPECT_EQ(s.streams()[0].deletes, std::vector<std::string> { "a" });
    EXPECT_EQ(s.html(),
        "<ul sg-update=\"stream\" id=\"list\"><li id=\"b\">B</li></ul>");

    Shadow empty;
    empty.prune_streams();
    EXPECT_TRUE(empty.empty());
}
