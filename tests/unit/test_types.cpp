#include <gtest/gtest.h>
#include <lise/types.hpp>

using namespace lise;

TEST(TypesTest, ParseModesIsCaseInsensitive)
{
    EXPECT_EQ(parse_build_mode("debug"), BuildMode::Debug);
    EXPECT_EQ(parse_build_mode("RELEASE"), BuildMode::Release);
    EXPECT_FALSE(parse_build_mode("profile").has_value());

    EXPECT_EQ(parse_startup_mode("Launch"), StartupMode::Launch);
    EXPECT_EQ(parse_startup_mode("attach"), StartupMode::Attach);
    EXPECT_FALSE(parse_startup_mode("").has_value());
}

TEST(TypesTest, ModeNamesParseBack)
{
    for (auto mode : {BuildMode::Debug, BuildMode::Release})
        EXPECT_EQ(parse_build_mode(to_string(mode)), mode);
    for (auto mode : {StartupMode::Launch, StartupMode::Attach})
        EXPECT_EQ(parse_startup_mode(to_string(mode)), mode);
}

TEST(TypesTest, DefaultBuildModeFollowsNdebug)
{
#ifdef NDEBUG
    EXPECT_EQ(default_build_mode(), BuildMode::Release);
#else
    EXPECT_EQ(default_build_mode(), BuildMode::Debug);
#endif
}

TEST(TypesTest, EndpointUrlAndJson)
{
    AgentEndpoint endpoint;
    EXPECT_EQ(endpoint.url(), "http://localhost:8000");

    endpoint.host = "10.0.0.5";
    endpoint.port = 8443;
    endpoint.scheme = "https";
    EXPECT_EQ(endpoint.url(), "https://10.0.0.5:8443");

    json j = endpoint.to_json();
    EXPECT_EQ(j["host"], "10.0.0.5");
    EXPECT_EQ(j["port"], 8443);
}

TEST(TypesTest, DefaultLayoutMatchesBuildOutputNesting)
{
    AgentLayout layout;
    EXPECT_EQ(layout.debug_parent_levels, 3);
    EXPECT_EQ(layout.debug_relative_dir, (std::vector<std::string>{"agent", "dist"}));
#ifdef _WIN32
    EXPECT_EQ(layout.executable_name, "lise-agent.exe");
#else
    EXPECT_EQ(layout.executable_name, "lise-agent");
#endif
}
