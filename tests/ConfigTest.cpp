#include <gtest/gtest.h>

#include <stdexcept>

#include "common/Config.hpp"

using namespace lanwatch;

namespace
{
    common::Config Parse(const std::vector<std::string> &args)
    {
        bool show_help = false;
        return common::ParseCommandLine(args, show_help);
    }
}

TEST(ConfigTest, Defaults)
{
    common::Config config = Parse({});
    EXPECT_EQ(config.http_port, 8000);
    EXPECT_EQ(config.prefix_length, 24);
    EXPECT_EQ(config.scan_interval, std::chrono::seconds(30));
    EXPECT_EQ(config.probe_timeout, std::chrono::milliseconds(800));
    EXPECT_EQ(config.lookup_timeout, std::chrono::milliseconds(1000));
    EXPECT_EQ(config.probe_concurrency, 32);
    EXPECT_TRUE(config.interface_name.empty());
    EXPECT_EQ(config.frontend_dir, "frontend");
    EXPECT_FALSE(config.TlsEnabled());
}

TEST(ConfigTest, ParsesEveryOption)
{
    common::Config config = Parse({"--port", "9090", "--prefix", "22", "--interval", "60",
                                   "--probe-timeout-ms", "500", "--lookup-timeout-ms", "250",
                                   "--concurrency", "8", "--interface", "eth1",
                                   "--frontend", "/srv/www", "--platform", "darwin",
                                   "--tls-cert", "cert.pem", "--tls-key", "key.pem"});

    EXPECT_EQ(config.http_port, 9090);
    EXPECT_EQ(config.prefix_length, 22);
    EXPECT_EQ(config.scan_interval, std::chrono::seconds(60));
    EXPECT_EQ(config.probe_timeout, std::chrono::milliseconds(500));
    EXPECT_EQ(config.lookup_timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(config.probe_concurrency, 8);
    EXPECT_EQ(config.interface_name, "eth1");
    EXPECT_EQ(config.frontend_dir, "/srv/www");
    EXPECT_EQ(config.platform, common::Platform::MacOS);
    EXPECT_TRUE(config.TlsEnabled());
}

TEST(ConfigTest, HelpStopsParsing)
{
    bool show_help = false;
    common::ParseCommandLine({"--help", "--bogus"}, show_help);
    EXPECT_TRUE(show_help);

    EXPECT_NE(common::Usage("lanwatch").find("--concurrency"), std::string::npos);
}

TEST(ConfigTest, RejectsBadInput)
{
    EXPECT_THROW(Parse({"--bogus", "1"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--port"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--port", "80x"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--port", "70000"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--prefix", "8"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--prefix", "31"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--concurrency", "0"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--platform", "plan9"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--tls-cert", "cert.pem"}), std::invalid_argument);
}

TEST(ConfigTest, PlatformNames)
{
    EXPECT_EQ(common::ParsePlatform("linux"), common::Platform::Linux);
    EXPECT_EQ(common::ParsePlatform("windows"), common::Platform::Windows);
    EXPECT_EQ(common::PlatformName(common::Platform::MacOS), "macos");
    EXPECT_EQ(common::PlatformName(common::ParsePlatform("macos")), "macos");
}
