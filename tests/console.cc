#include "sigrun/console.hh"
#include <gtest/gtest.h>
#include <utility>
#include <vector>

using namespace sigrun;

namespace {

std::vector<std::pair<console::Level, std::string>> messages;

void record(console::Level lvl, const std::string& msg)
{
    messages.emplace_back(lvl, msg);
}

class ConsoleTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        messages.clear();
        console::sink = record;
    }

    void TearDown() override { console::sink = nullptr; }
};
}

TEST_F(ConsoleTest, SinkReceivesEveryLevel)
{
    console::log("joined");
    console::warn("slow");
    console::error("broken");

    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].first, console::Level::log);
    EXPECT_EQ(messages[0].second, "joined");
    EXPECT_EQ(messages[1].first, console::Level::warn);
    EXPECT_EQ(messages[1].second, "slow");
    EXPECT_EQ(messages[2].first, console::Level::error);
    EXPECT_EQ(messages[2].second, "broken");
}

TEST_F(ConsoleTest, DefaultOutputWithoutSink)
{
    console::sink = nullptr;
    testing::internal::CaptureStderr();
    console::log("to clog");
    const auto out = testing::internal::GetCapturedStderr();
    EXPECT_NE(out.find("sigrun log: to clog"), std::string::npos);
    EXPECT_TRUE(messages.empty());
}
