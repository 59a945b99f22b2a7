#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "keyward/log/Log.hpp"

namespace
{

class LogCapture : public ::testing::Test
{
protected:
    std::ostringstream m_out;
    keyward::log::Level m_previous{ keyward::log::level() };

    void SetUp() override
    {
        keyward::log::setSink(&m_out);
    }

    void TearDown() override
    {
        keyward::log::setSink(nullptr);
        keyward::log::setLevel(m_previous);
    }
};

} // namespace

TEST_F(LogCapture, WritesComponentAndMessageAtOrAboveLevel)
{
    keyward::log::setLevel(keyward::log::Level::Info);
    keyward::log::info("store", "vault persisted: ", 3, " accounts");
    keyward::log::debug("store", "hidden");

    const std::string text{ m_out.str() };
    EXPECT_NE(text.find("INFO  store: vault persisted: 3 accounts\n"), std::string::npos);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_EQ(text.front(), '[');
}

TEST_F(LogCapture, OffSilencesEverything)
{
    keyward::log::setLevel(keyward::log::Level::Off);
    keyward::log::error("session", "should not appear");
    EXPECT_TRUE(m_out.str().empty());
}

TEST(Log, ParseLevelAcceptsNamesCaseInsensitively)
{
    EXPECT_EQ(keyward::log::parseLevel("DEBUG"), keyward::log::Level::Debug);
    EXPECT_EQ(keyward::log::parseLevel("warn"), keyward::log::Level::Warning);
    EXPECT_EQ(keyward::log::parseLevel("Error"), keyward::log::Level::Error);
    EXPECT_EQ(keyward::log::parseLevel("none"), keyward::log::Level::Off);
    EXPECT_FALSE(keyward::log::parseLevel("verbose").has_value());
}
