#include "sigrun/errors.hh"
#include "sigrun/registry.hh"
#include "sigrun/serializer.hh"
#include "sigrun/session.hh"
#include <gtest/gtest.h>

using namespace sigrun;
using nlohmann::json;

namespace {

class SessionTest : public ::testing::Test {
protected:
    TemplateRegistry reg;
    Session session;

    void SetUp() override
    {
        reg.define("page", { "<main>", "", "</main>" });
        reg.define("title", { "<h1>", "</h1>" });
        reg.define("item", { "<li>", "</li>" });
    }

    Rendered page(std::string title, std::vector<Row> items)
    {
        return reg.render("page",
            {
                reg.render("title", { std::move(title) }),
                reg.comprehension("item", std::move(items)),
            });
    }
};
}

TEST_F(SessionTest, MountReturnsFullTreeAndHTML)
{
    auto m = session.mount(page("Hi", { { "a" } }));
    EXPECT_EQ(m.html, "<main><h1>Hi</h1><li>a</li></main>");
    EXPECT_TRUE(is_full(m.rendered));
    EXPECT_EQ(decode_rendered(m.rendered).html(), m.html);
    EXPECT_TRUE(session.mounted());
    EXPECT_EQ(session.renders(), 0u);
}

TEST_F(SessionTest, RenderSendsOnlyChanges)
{
    session.mount(page("Hi", { { "a" } }));

    auto d = session.render(page("Hello", { { "a" } }));
    ASSERT_TRUE(d);
    EXPECT_EQ(*d, json::parse(R"({"0": {"0": "Hello"}})"));
    EXPECT_EQ(session.renders(), 1u);
    EXPECT_EQ(session.last().html(), "<main><h1>Hello</h1><li>a</li></main>");
}

TEST_F(SessionTest, UnchangedRenderSendsNothing)
{
    session.mount(page("Hi", { { "a" } }));
    EXPECT_FALSE(session.render(page("Hi", { { "a" } })));
    EXPECT_EQ(session.renders(), 1u);
}

TEST_F(SessionTest, RenderBeforeMountThrows)
{
    EXPECT_THROW(session.render(page("Hi", {})), Error);
    EXPECT_THROW(session.last(), Error);
}

TEST_F(SessionTest, StructuralMismatchDropsRetainedTree)
{
    session.mount(page("Hi", {}));
    EXPECT_THROW(session.render(reg.render("title", { "x" })), StructuralMismatch);
    EXPECT_FALSE(session.mounted());
    EXPECT_THROW(session.render(page("Hi", {})), Error);

    session.mount(page("Hi", {}));
    EXPECT_TRUE(session.mounted());
}

TEST_F(SessionTest, ChangesReproduceServerTree)
{
    session.mount(page("Hi", {}));
    auto client = decode_rendered(session.mount(page("Hi", {})).rendered);

    const std::vector<Rendered> renders = {
        page("Hi", { { "a" } }),
        page("Hi", { { "a" }, { "b" } }),
        page("Bye", { { "b" } }),
        page("Bye", {}),
    };
    for (auto& r : renders) {
        if (auto d = session.render(r)) {
            client = merge(client, decode_changes(*d));
        }
        EXPECT_EQ(client.html(), r.html());
    }
}

TEST_F(SessionTest, MountWithComponents)
{
    auto root = reg.render("page", { ComponentRef { 1 }, ComponentRef { 2 } });
    auto m = session.mount(root,
        {
            { 1, reg.render("title", { "Hi" }) },
            { 2, reg.render("item", { "a" }) },
        });
    EXPECT_EQ(m.html,
        "<main><h1 data-sg-component=\"1\">Hi</h1>"
        "<li data-sg-component=\"2\">a</li></main>");
    EXPECT_EQ(decode_components(m.rendered), session.components());
    EXPECT_EQ(session.components().size(), 2u);

    session.reset();
    EXPECT_TRUE(session.components().empty());
}

TEST_F(SessionTest, RenderSendsComponentChanges)
{
    auto root = reg.render("page", { ComponentRef { 1 }, ComponentRef { 2 } });
    session.mount(root,
        {
            { 1, reg.render("title", { "Hi" }) },
            { 2, reg.render("item", { "a" }) },
        });

    auto d = session.render(root,
        {
            { 1, reg.render("title", { "Bye" }) },
            { 2, reg.render("item", { "a" }) },
            { 3, reg.render("title", { "New" }) },
        });
    ASSERT_TRUE(d);
    EXPECT_EQ(*d, json::parse(R"({"c": {"1": {"0": "Bye"}, "3": {"s": -1, "0": "New"}}})"));

    d = session.render(reg.render("page", { ComponentRef { 1 }, "x" }),
        { { 1, reg.render("title", { "Bye" }) } });
    ASSERT_TRUE(d);
    EXPECT_EQ(*d, json::parse(R"({"1": "x", "c": {"2": null, "3": null}})"));
}

TEST_F(SessionTest, StreamItemsNotRetained)
{
    Stream st { "items" };
    st.inserts = { { "a", -1, std::nullopt } };
    auto tree = reg.render("page",
        {
            reg.render("title", { "Hi" }),
            Comprehension(reg.get("item"), { { "a" } }, st),
        });

    auto m = session.mount(tree);
    EXPECT_EQ(m.html, "<main><h1>Hi</h1><li>a</li></main>");
    EXPECT_EQ(session.last().html(), "<main><h1>Hi</h1></main>");
    ASSERT_TRUE(session.last()[1].comprehension().is_stream());
    EXPECT_TRUE(session.last()[1].comprehension().stream()->empty());

    // Nothing inserted, nothing sent
    auto idle = reg.render("page",
        {
            reg.render("title", { "Hi" }),
            Comprehension(reg.get("item"), {}, Stream { "items" }),
        });
    EXPECT_FALSE(session.render(idle));

    auto d = session.render(tree);
    ASSERT_TRUE(d);
    EXPECT_EQ((*d)["1"]["d"], json::parse(R"([["a"]])"));
}
