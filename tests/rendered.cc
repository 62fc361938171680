#include "sigrun/console.hh"
#include "sigrun/errors.hh"
#include "sigrun/rendered.hh"
#include <gtest/gtest.h>

using namespace sigrun;

TEST(Rendered, FlattensStaticsAndDynamics)
{
    Rendered r(make_statics({ "<p>", "</p>" }), { "hello" });
    EXPECT_EQ(r.html(), "<p>hello</p>");
    EXPECT_EQ(r.size(), 1u);
    EXPECT_EQ(r[0].scalar(), "hello");
}

TEST(Rendered, StaticOnly)
{
    Rendered r(make_statics({ "<hr>" }), {});
    EXPECT_EQ(r.html(), "<hr>");
}

TEST(Rendered, ArityMismatch)
{
    EXPECT_THROW(Rendered(make_statics({ "<p>", "</p>" }), {}), ArityMismatch);
    EXPECT_THROW(Rendered(make_statics({ "<p>", "</p>" }), { "a", "b" }),
        ArityMismatch);
    EXPECT_THROW(Rendered(make_statics({}), {}), ArityMismatch);
    EXPECT_THROW(Rendered(Statics(), {}), ArityMismatch);
}

TEST(Rendered, ScalarsFromNumbersAndBooleans)
{
    Rendered r(make_statics({ "", ",", ",", "" }), { 3, true, false });
    EXPECT_EQ(r.html(), "3,true,false");
}

TEST(Rendered, Nested)
{
    Rendered inner(make_statics({ "<b>", "</b>" }), { "x" });
    Rendered outer(make_statics({ "<div>", "</div>" }), { inner });
    EXPECT_TRUE(outer[0].is_nested());
    EXPECT_EQ(outer.html(), "<div><b>x</b></div>");
}

TEST(Rendered, NestedEmptyRenders)
{
    Rendered empty(make_statics({ "" }), {});
    Rendered outer(make_statics({ "<div>", "</div>" }), { empty });
    EXPECT_EQ(outer.html(), "<div></div>");
}

TEST(Rendered, ScalarsAreNotEscaped)
{
    Rendered r(make_statics({ "<div>", "</div>" }), { "<i>&</i>" });
    EXPECT_EQ(r.html(), "<div><i>&</i></div>");
}

TEST(Rendered, Equality)
{
    auto st = make_statics({ "<p>", "</p>" });
    EXPECT_EQ(Rendered(st, { "a" }), Rendered(st, { "a" }));
    EXPECT_EQ(Rendered(st, { "a" }),
        Rendered(make_statics({ "<p>", "</p>" }), { "a" }));
    EXPECT_NE(Rendered(st, { "a" }), Rendered(st, { "b" }));
}

TEST(Statics, SameStatics)
{
    auto a = make_statics({ "x", "y" });
    EXPECT_TRUE(same_statics(a, a));
    EXPECT_TRUE(same_statics(a, make_statics({ "x", "y" })));
    EXPECT_FALSE(same_statics(a, make_statics({ "x", "z" })));
    EXPECT_FALSE(same_statics(a, Statics()));
}

TEST(Comprehension, FlattensEntriesInOrder)
{
    Comprehension c(make_statics({ "<li>", "</li>" }), { { "a" }, { "b" } });
    EXPECT_EQ(c.html(), "<li>a</li><li>b</li>");
    EXPECT_EQ(c.size(), 2u);
}

TEST(Comprehension, EmptyRendersNothing)
{
    Comprehension c(make_statics({ "<li>", "</li>" }));
    EXPECT_TRUE(c.empty());
    EXPECT_EQ(c.html(), "");

    Rendered r(make_statics({ "<ul>", "</ul>" }), { c });
    EXPECT_EQ(r.html(), "<ul></ul>");
}

TEST(Comprehension, ArityMismatch)
{
    EXPECT_THROW(Comprehension(make_statics({ "<li>", "</li>" }),
                     { { "a" }, { "b", "c" } }),
        ArityMismatch);
    EXPECT_THROW(Comprehension(make_statics({})), ArityMismatch);
}

TEST(Comprehension, NestedRows)
{
    auto item = make_statics({ "<b>", "</b>" });
    Comprehension c(make_statics({ "<li>", "</li>" }),
        {
            { Rendered(item, { "1" }) },
            { Rendered(item, { "2" }) },
        });
    EXPECT_EQ(c.html(), "<li><b>1</b></li><li><b>2</b></li>");
}

TEST(Dynamic, NullTreesRejected)
{
    std::shared_ptr<const Rendered> no_tree;
    std::shared_ptr<const Comprehension> no_comprehension;
    EXPECT_THROW(Dynamic { no_tree }, Error);
    EXPECT_THROW(Dynamic { no_comprehension }, Error);

    auto r = std::make_shared<const Rendered>(make_statics({ "x" }), Row {});
    EXPECT_EQ(Dynamic(r).nested_ptr(), r);
}

namespace {

std::vector<std::string> errors;

void record(console::Level lvl, const std::string& msg)
{
    if (lvl == console::Level::error) {
        errors.push_back(msg);
    }
}

class ComponentTest : public ::testing::Test {
protected:
    Statics card = make_statics({ "<div class=card>", "</div>" });
    Statics page = make_statics({ "<main>", "", "</main>" });

    void SetUp() override
    {
        errors.clear();
        console::sink = record;
    }

    void TearDown() override { console::sink = nullptr; }
};
}

TEST_F(ComponentTest, RootElementsStamped)
{
    Components c;
    c.emplace(1, Rendered(card, { "one" }));
    c.emplace(2,
        Rendered(make_statics({ "<p>a</p> <p>", "</p>" }), { "b" }));
    Rendered r(page, { ComponentRef { 1 }, ComponentRef { 2 } });

    EXPECT_EQ(html(r, c),
        "<main><div class=\"card\" data-sg-component=\"1\">one</div>"
        "<p data-sg-component=\"2\">a</p> <p data-sg-component=\"2\">b</p>"
        "</main>");
    EXPECT_TRUE(errors.empty());
}

TEST_F(ComponentTest, RootTextWrappedInSpan)
{
    Components c;
    c.emplace(3, Rendered(make_statics({ "hi ", "" }), { "there" }));
    Rendered r(make_statics({ "", "" }), { ComponentRef { 3 } });

    EXPECT_EQ(html(r, c),
        "<span data-sg-component=\"3\">hi there</span>");
    EXPECT_EQ(errors.size(), 1u);
}

TEST_F(ComponentTest, NestedComponents)
{
    Components c;
    c.emplace(1, Rendered(card, { ComponentRef { 2 } }));
    c.emplace(2, Rendered(make_statics({ "<b>", "</b>" }), { "x" }));
    Rendered r(make_statics({ "", "" }), { ComponentRef { 1 } });

    EXPECT_EQ(html(r, c),
        "<div class=\"card\" data-sg-component=\"1\">"
        "<b data-sg-component=\"2\">x</b></div>");
}

TEST_F(ComponentTest, InvalidReferences)
{
    Rendered r(make_statics({ "", "" }), { ComponentRef { 1 } });
    EXPECT_THROW(r.html(), Error);
    EXPECT_THROW(html(r, Components()), StructuralMismatch);

    Components cyclic;
    cyclic.emplace(1, Rendered(card, { ComponentRef { 1 } }));
    EXPECT_THROW(html(r, cyclic), StructuralMismatch);
}

TEST(Stream, CollectAndPrune)
{
    Stream st;
    st.ref = "msgs";
    st.inserts = { { "m1" }, { "m2", 0 } };
    st.deletes = { "m0" };
    auto li = make_statics({ "<li id=", ">", "</li>" });
    Comprehension items(li, { { "m1", "a" }, { "m2", "b" } }, st);
    Rendered r(make_statics({ "<ul sg-update=stream>", "</ul>" }), { items });

    EXPECT_EQ(r.html(),
        "<ul sg-update=stream><li id=m1>a</li><li id=m2>b</li></ul>");
    EXPECT_EQ(collect_streams(r), std::vector<Stream> { st });

    auto pruned = prune_streams(r);
    EXPECT_EQ(pruned.html(), "<ul sg-update=stream></ul>");
    auto& c = pruned[0].comprehension();
    ASSERT_TRUE(c.is_stream());
    EXPECT_EQ(c.stream()->ref, "msgs");
    EXPECT_TRUE(c.stream()->empty());
    EXPECT_TRUE(c.statics() == li);

    // Trees without streams are shared
    Rendered plain(make_statics({ "<p>", "</p>" }), { "x" });
    EXPECT_EQ(prune_streams(plain).dynamics()[0], plain[0]);
}

TEST(Stream, CollectedFromComponents)
{
    Stream st;
    st.ref = "feed";
    Components c;
    c.emplace(1,
        Rendered(make_statics({ "<ul>", "</ul>" }),
            { Comprehension(make_statics({ "" }), {}, st) }));
    Rendered r(make_statics({ "", "" }), { ComponentRef { 1 } });

    EXPECT_TRUE(collect_streams(r).empty());
    EXPECT_EQ(collect_streams(r, &c), std::vector<Stream> { st });
}

TEST(Stream, MoreInsertsThanEntries)
{
    Stream st;
    st.inserts = { { "a" } };
    EXPECT_THROW(Comprehension(make_statics({ "x" }), {}, st), ArityMismatch);
}
