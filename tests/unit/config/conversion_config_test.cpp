#include <gtest/gtest.h>

#include <fconv/config/config_helpers.h>
#include <fconv/config/conversion_config.h>
#include <support/temp_dir_scope.hpp>

#include <cstdlib>
#include <fstream>

namespace fconv::test {

using config::ClientSettings;
using config::ServerSettings;
using test_support::TempDirScope;

namespace {

std::filesystem::path writeConfig(const TempDirScope& dir, const std::string& text) {
    auto path = dir.path() / "config.toml";
    std::ofstream out(path);
    out << text;
    return path;
}

} // namespace

class ConversionConfigTest : public ::testing::Test {
protected:
    TempDirScope dir_ = TempDirScope::unique_under("fconv-config-test");
};

TEST_F(ConversionConfigTest, ParsesSectionsCommentsAndQuotes) {
    auto path = writeConfig(dir_, R"(
# top comment
[server]
host = "0.0.0.0"   # inline comment
port = 9443
cert_path = 'certs/server#1.pem'

[client]
verify_peer = false
)");

    auto parsed = config::parse_toml_sections(path);
    ASSERT_TRUE(parsed) << parsed.error().message;
    const auto& sections = parsed.value();
    EXPECT_EQ(sections.at("server").at("host"), "0.0.0.0");
    EXPECT_EQ(sections.at("server").at("port"), "9443");
    EXPECT_EQ(sections.at("server").at("cert_path"), "certs/server#1.pem");
    EXPECT_EQ(sections.at("client").at("verify_peer"), "false");
}

TEST_F(ConversionConfigTest, DottedKeysLandInTheirSection) {
    auto path = writeConfig(dir_, "server.port = 1234\n");
    auto parsed = config::parse_toml_sections(path);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().at("server").at("port"), "1234");
}

TEST_F(ConversionConfigTest, UnterminatedSectionIsInvalidArgument) {
    auto path = writeConfig(dir_, "[server\nport = 1\n");
    auto parsed = config::parse_toml_sections(path);
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConversionConfigTest, MissingFileIsFileNotFound) {
    auto parsed = config::parse_toml_sections(dir_.path() / "nope.toml");
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, ErrorCode::FileNotFound);
}

TEST_F(ConversionConfigTest, ServerSectionOverridesOnlyPresentKeys) {
    config::TomlSections sections;
    sections["server"] = {{"port", "9000"},
                          {"save_outputs", "yes"},
                          {"connection_timeout_ms", "2500"},
                          {"jpeg_quality", "75"},
                          {"pdf_zoom", "1.5"}};

    ServerSettings settings;
    auto r = config::apply_server_section(sections, settings);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(settings.port, 9000);
    EXPECT_TRUE(settings.saveOutputs);
    EXPECT_EQ(settings.connectionTimeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(settings.jpegQuality, 75);
    EXPECT_DOUBLE_EQ(settings.pdfZoom, 1.5);
    // untouched
    EXPECT_EQ(settings.host, "127.0.0.1");
    EXPECT_EQ(settings.maxConnections, 16u);
    EXPECT_EQ(settings.outputDir, std::filesystem::path("converted_files"));
}

TEST_F(ConversionConfigTest, MalformedServerValuesAreRejected) {
    const std::pair<const char*, const char*> bad[] = {
        {"port", "70000"},         {"port", "12ab"},        {"worker_threads", "0"},
        {"save_outputs", "maybe"}, {"jpeg_quality", "101"}, {"pdf_zoom", "-1"},
        {"connection_timeout_ms", "soon"},
    };
    for (const auto& [key, value] : bad) {
        config::TomlSections sections;
        sections["server"][key] = value;
        ServerSettings settings;
        auto r = config::apply_server_section(sections, settings);
        ASSERT_FALSE(r) << key << "=" << value;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
        EXPECT_NE(r.error().message.find(key), std::string::npos);
    }
}

TEST_F(ConversionConfigTest, NegativeSizesDoNotWrapAround) {
    for (const char* value : {"-1", " 5", "+5", ""}) {
        config::TomlSections sections;
        sections["server"]["max_payload_bytes"] = value;
        sections["client"]["max_payload_bytes"] = value;

        ServerSettings server;
        auto rs = config::apply_server_section(sections, server);
        ASSERT_FALSE(rs) << "'" << value << "'";
        EXPECT_EQ(rs.error().code, ErrorCode::InvalidArgument);
        EXPECT_EQ(server.maxPayloadBytes, DEFAULT_MAX_PAYLOAD_SIZE);

        ClientSettings client;
        auto rc = config::apply_client_section(sections, client);
        ASSERT_FALSE(rc) << "'" << value << "'";
        EXPECT_EQ(client.maxPayloadBytes, DEFAULT_MAX_PAYLOAD_SIZE);
    }

    config::TomlSections sections;
    sections["server"]["max_payload_bytes"] = "1048576";
    ServerSettings server;
    ASSERT_TRUE(config::apply_server_section(sections, server));
    EXPECT_EQ(server.maxPayloadBytes, 1048576u);
}

TEST_F(ConversionConfigTest, ClientSectionIsApplied) {
    auto path = writeConfig(dir_, R"([client]
host = "convert.local"
port = 8444
request_timeout_ms = 1000
verify_peer = off
output_dir = "out"
)");
    ClientSettings settings;
    auto r = config::load_client_settings(path, settings);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(settings.host, "convert.local");
    EXPECT_EQ(settings.port, 8444);
    EXPECT_EQ(settings.requestTimeout, std::chrono::milliseconds(1000));
    EXPECT_FALSE(settings.verifyPeer);
    EXPECT_EQ(settings.outputDir, std::filesystem::path("out"));
    EXPECT_EQ(settings.connectTimeout, std::chrono::milliseconds(5000));
}

TEST_F(ConversionConfigTest, AbsentConfigFileKeepsDefaults) {
    ServerSettings settings;
    auto r = config::load_server_settings(dir_.path() / "missing.toml", settings);
    ASSERT_TRUE(r);
    EXPECT_EQ(settings.port, DEFAULT_PORT);
}

TEST_F(ConversionConfigTest, ExplicitConfigPathWins) {
    EXPECT_EQ(config::get_config_path("/etc/fconv.toml"), std::filesystem::path("/etc/fconv.toml"));
}

TEST(ConfigHelpersTest, ParseBoolAcceptsCommonSpellings) {
    EXPECT_EQ(config::parse_bool(" TRUE "), true);
    EXPECT_EQ(config::parse_bool("on"), true);
    EXPECT_EQ(config::parse_bool("0"), false);
    EXPECT_EQ(config::parse_bool("No"), false);
    EXPECT_FALSE(config::parse_bool("2").has_value());
}

} // namespace fconv::test
