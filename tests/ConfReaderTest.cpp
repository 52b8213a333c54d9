#include <gtest/gtest.h>

#include <fstream>
#include <cstdio>
#include <stdexcept>

#include "ConfReader.hpp"
#include "CommandLine.hpp"

namespace {

std::string WriteFile(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream f(path);
    f << content;
    return path;
}

} // namespace

TEST(ConfReaderTest, MissingFileGivesDefaults) {
    ConfReader reader(::testing::TempDir());
    EndpointConfig conf = reader.ReadEndpointConfig("does_not_exist.json");

    EXPECT_EQ(conf.host, "localhost");
    EXPECT_EQ(conf.port, 8745);
    EXPECT_EQ(conf.username, "");
    EXPECT_EQ(conf.resend_timeout, 5u);
    EXPECT_EQ(conf.buffer_size, 1024u);
    EXPECT_EQ(conf.log_file, "logs.txt");
}

TEST(ConfReaderTest, PartialFileKeepsOtherDefaults) {
    WriteFile("simp_partial.json", R"({ "port": 9000, "username": "alice" })");

    ConfReader reader(::testing::TempDir());
    EndpointConfig conf = reader.ReadEndpointConfig("simp_partial.json");

    EXPECT_EQ(conf.host, "localhost");
    EXPECT_EQ(conf.port, 9000);
    EXPECT_EQ(conf.username, "alice");
    EXPECT_EQ(conf.resend_timeout, 5u);
}

TEST(ConfReaderTest, FullFile) {
    WriteFile("simp_full.json", R"({
        "host": "127.0.0.1",
        "port": 8800,
        "username": "Server",
        "resend_timeout": 2,
        "buffer_size": 2048,
        "log_file": "server.log"
    })");

    ConfReader reader(::testing::TempDir());
    EndpointConfig conf = reader.ReadEndpointConfig("simp_full.json");

    EXPECT_EQ(conf.host, "127.0.0.1");
    EXPECT_EQ(conf.port, 8800);
    EXPECT_EQ(conf.username, "Server");
    EXPECT_EQ(conf.resend_timeout, 2u);
    EXPECT_EQ(conf.buffer_size, 2048u);
    EXPECT_EQ(conf.log_file, "server.log");
}

TEST(ConfReaderTest, MalformedFileThrows) {
    WriteFile("simp_broken.json", "{ \"port\": ");

    ConfReader reader(::testing::TempDir());
    EXPECT_THROW(reader.ReadEndpointConfig("simp_broken.json"), nlohmann::json::exception);
}

TEST(ConfReaderTest, ZeroResendTimeoutIsRejected) {
    WriteFile("simp_zero_timeout.json", R"({ "resend_timeout": 0 })");

    ConfReader reader(::testing::TempDir());
    EXPECT_THROW(reader.ReadEndpointConfig("simp_zero_timeout.json"), std::out_of_range);
}

TEST(ConfReaderTest, HugeOrNegativeResendTimeoutIsRejected) {
    WriteFile("simp_huge_timeout.json", R"({ "resend_timeout": 4294968 })");
    WriteFile("simp_negative_timeout.json", R"({ "resend_timeout": -5 })");

    ConfReader reader(::testing::TempDir());
    EXPECT_THROW(reader.ReadEndpointConfig("simp_huge_timeout.json"), std::out_of_range);
    EXPECT_THROW(reader.ReadEndpointConfig("simp_negative_timeout.json"), std::out_of_range);
}

TEST(ConfReaderTest, BufferSmallerThanHeaderIsRejected) {
    WriteFile("simp_small_buffer.json", R"({ "buffer_size": 38 })");

    ConfReader reader(::testing::TempDir());
    EXPECT_THROW(reader.ReadEndpointConfig("simp_small_buffer.json"), std::out_of_range);
}

TEST(CommandLineTest, DefaultsWhenNoArguments) {
    char prog[] = "simp_server";
    char* argv[] = {prog};
    CommandLineOptions options;
    std::string error;

    ASSERT_TRUE(ParseArguments(1, argv, options, error));
    EXPECT_TRUE(options.host.empty());
    EXPECT_EQ(options.port, 0);
    EXPECT_FALSE(options.show_help);
}

TEST(CommandLineTest, HostAndPortOverrideConfig) {
    char prog[] = "simp_client";
    char host_flag[] = "--host";
    char host[] = "10.0.0.2";
    char port_flag[] = "--port";
    char port[] = "9100";
    char* argv[] = {prog, host_flag, host, port_flag, port};
    CommandLineOptions options;
    std::string error;

    ASSERT_TRUE(ParseArguments(5, argv, options, error));

    EndpointConfig conf;
    conf.host = "example.org";
    conf.port = 1234;
    ApplyOverrides(options, conf);
    EXPECT_EQ(conf.host, "10.0.0.2");
    EXPECT_EQ(conf.port, 9100);
}

TEST(CommandLineTest, InvalidPortIsRejected) {
    char prog[] = "simp_server";
    char port_flag[] = "--port";
    char port[] = "70000";
    char* argv[] = {prog, port_flag, port};
    CommandLineOptions options;
    std::string error;

    EXPECT_FALSE(ParseArguments(3, argv, options, error));
    EXPECT_NE(error.find("70000"), std::string::npos);
}

TEST(CommandLineTest, UnknownArgumentIsRejected) {
    char prog[] = "simp_server";
    char flag[] = "--verbose";
    char* argv[] = {prog, flag};
    CommandLineOptions options;
    std::string error;

    EXPECT_FALSE(ParseArguments(2, argv, options, error));
}
