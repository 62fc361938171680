#include "sigrun/util.hh"
#include <gtest/gtest.h>

using namespace sigrun;

TEST(Rope, ConcatenatesParts)
{
    Rope s;
    s << "<div" << ' ' << std::string("id=\"a\"") << std::string_view(">")
      << 12 << "</div>";
    EXPECT_EQ(s.str(), "<div id=\"a\">12</div>");
    EXPECT_EQ(s.size(), s.str().size());
}

TEST(Rope, GrowsPastFirstPart)
{
    Rope s;
    const std::string chunk(700, 'x');
    for (int i = 0; i < 10; i++) {
        s << chunk;
    }
    EXPECT_EQ(s.size(), 7000u);
    EXPECT_EQ(s.str(), std::string(7000, 'x'));
}

TEST(Escape, ReplacesSpecialCharacters)
{
    EXPECT_EQ(escape("<a href='x'>\"&\"</a>"),
        "&lt;a href=&#39;x&#39;&gt;&#34;&amp;&#34;&lt;/a&gt;");
    EXPECT_EQ(escape("plain"), "plain");
}

TEST(Unescape, DecodesReferences)
{
    EXPECT_EQ(unescape("&lt;p&gt; &amp; &quot;q&quot; &apos;"), "<p> & \"q\" '");
    EXPECT_EQ(unescape("&#39;&#34;&#x41;"), "'\"A");
    EXPECT_EQ(unescape("a&nbsp;b"), "a\xC2\xA0" "b");
    EXPECT_EQ(unescape("&#x263A;"), "\xE2\x98\xBA");
}

TEST(Unescape, LeavesUnknownReferences)
{
    EXPECT_EQ(unescape("&copy; & &;"), "&copy; & &;");
    EXPECT_EQ(unescape("fish & chips"), "fish & chips");
    EXPECT_EQ(unescape("&#xZZ;"), "&#xZZ;");
}

TEST(Unescape, InvertsEscape)
{
    const std::string s = "<b class=\"x\">it's & done</b>";
    EXPECT_EQ(unescape(escape(s)), s);
}

TEST(Strings, Helpers)
{
    EXPECT_TRUE(is_blank(" \n\t"));
    EXPECT_TRUE(is_blank(""));
    EXPECT_FALSE(is_blank(" a "));
    EXPECT_EQ(to_lower("DiV"), "div");
    EXPECT_EQ(split_words("  a  b\tc\n"),
        (std::vector<std::string> { "a", "b", "c" }));
    EXPECT_TRUE(split_words("   ").empty());
}
