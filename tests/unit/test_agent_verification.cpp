#include "../../src/internal/launcher/agent_verification.hpp"
#include "../test_utils.hpp"

#include <cctype>
#include <gtest/gtest.h>

using namespace lise::internal;
using lise::test::TempDir;
using lise::test::write_file;

namespace
{
// SHA-256("abc")
const std::string ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
} // namespace

TEST(AgentVerificationTest, ComputesKnownDigest)
{
    TempDir dir;
    write_file(dir.path() / "abc.bin", "abc");

    auto digest = compute_file_sha256(dir.path() / "abc.bin");
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(*digest, ABC_SHA256);
}

TEST(AgentVerificationTest, MissingFileHasNoDigest)
{
    TempDir dir;
    EXPECT_FALSE(compute_file_sha256(dir.path() / "absent").has_value());
}

TEST(AgentVerificationTest, HashCheckIsCaseInsensitive)
{
    TempDir dir;
    write_file(dir.path() / "abc.bin", "abc");

    std::string upper = ABC_SHA256;
    for (auto& c : upper)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    std::string error;
    EXPECT_TRUE(verify_agent_hash(dir.path() / "abc.bin", upper, error)) << error;
}

TEST(AgentVerificationTest, NoExpectedHashAlwaysPasses)
{
    std::string error;
    EXPECT_TRUE(verify_agent_hash("/does/not/matter", std::nullopt, error));
    EXPECT_TRUE(error.empty());
}

TEST(AgentVerificationTest, MalformedHashRejected)
{
    TempDir dir;
    write_file(dir.path() / "abc.bin", "abc");

    std::string error;
    EXPECT_FALSE(verify_agent_hash(dir.path() / "abc.bin", std::string("abc123"), error));
    EXPECT_NE(error.find("Invalid hash format"), std::string::npos);

    error.clear();
    EXPECT_FALSE(verify_agent_hash(dir.path() / "abc.bin", std::string(64, 'z'), error));
    EXPECT_NE(error.find("Invalid hash format"), std::string::npos);
}

TEST(AgentVerificationTest, MismatchReportsBothDigests)
{
    TempDir dir;
    write_file(dir.path() / "abc.bin", "abd");

    std::string error;
    EXPECT_FALSE(verify_agent_hash(dir.path() / "abc.bin", ABC_SHA256, error));
    EXPECT_NE(error.find("mismatch"), std::string::npos);
    EXPECT_NE(error.find(ABC_SHA256), std::string::npos);
}

TEST(AgentVerificationTest, EmptyAllowlistAllowsAll)
{
    EXPECT_TRUE(verify_agent_path_allowed("/any/path", {}));
}

TEST(AgentVerificationTest, AllowlistComparesNormalizedPaths)
{
    TempDir dir;
    write_file(dir.path() / "bin" / "lise-agent", "x");

    const auto agent = dir.path() / "bin" / "lise-agent";
    const auto dotted = (dir.path() / "bin" / ".." / "bin" / "lise-agent").string();

    EXPECT_TRUE(verify_agent_path_allowed(agent, {dotted}));
    EXPECT_FALSE(verify_agent_path_allowed(agent, {(dir.path() / "other").string()}));
}
