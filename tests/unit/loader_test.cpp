#include "io/loader.hpp"
#include "core/errors.hpp"

#include <gtest/gtest.h>

#include <msgpack.hpp>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace ctp;
using namespace ctp::core;
using namespace ctp::io;
using namespace std::chrono_literals;

namespace {

const char* sample_yaml = R"(
listen_port: 58080
proxy_ports: [80, 8080]
proxy_mark: 255
ignore_mark: 255
route_table: 100
rules:
  - target: Request
    selector:
      path: /rs-tproxy
      method: GET
      headers:
        aname: avalue
    actions:
      delay:
        secs: 1
        nanos: 0
  - target: Response
    selector:
      path: /rs-tproxy
      method: GET
      code: 404
      response_headers:
        server: nginx
    actions:
      abort: true
)";

class TempFile {
public:
    TempFile(const std::string& name, const std::string& content)
        : _path(std::filesystem::temp_directory_path() / ("ctproxy_" + name))
    {
        std::ofstream ofs(_path, std::ios::binary);
        ofs << content;
    }
    ~TempFile() { std::filesystem::remove(_path); }

    std::string path() const { return _path.string(); }

private:
    std::filesystem::path _path;
};

TEST(TestLoader, ParseYaml)
{
    auto raw = Loader::parse_yaml(sample_yaml);

    ASSERT_TRUE(raw.listen_port);
    EXPECT_EQ(*raw.listen_port, 58080);
    ASSERT_EQ(raw.proxy_ports.size(), 2u);
    EXPECT_EQ(raw.proxy_ports[1], 8080);
    EXPECT_EQ(*raw.route_table, 100);

    ASSERT_TRUE(raw.rules);
    ASSERT_EQ(raw.rules->size(), 2u);

    const auto& first = (*raw.rules)[0];
    EXPECT_EQ(first.target, "Request");
    EXPECT_EQ(*first.selector.path, "/rs-tproxy");
    EXPECT_EQ(first.selector.headers->at("aname"), "avalue");
    ASSERT_TRUE(first.actions.delay);
    EXPECT_EQ(first.actions.delay->secs, 1u);
    EXPECT_FALSE(first.actions.abort);

    const auto& second = (*raw.rules)[1];
    EXPECT_EQ(*second.selector.code, 404);
    EXPECT_EQ(second.selector.response_headers->at("server"), "nginx");
    EXPECT_TRUE(*second.actions.abort);
}

TEST(TestLoader, ParseJson)
{
    auto raw = Loader::parse_yaml(R"({
        "proxy_ports": [80],
        "rules": [
            {"target": "Request", "selector": {}, "actions": {"replace": {"queries": {"os": "windows"}}}}
        ]
    })");

    ASSERT_EQ(raw.proxy_ports.size(), 1u);
    EXPECT_FALSE(raw.listen_port);
    ASSERT_TRUE(raw.rules);
    ASSERT_TRUE((*raw.rules)[0].actions.replace);
    EXPECT_EQ((*raw.rules)[0].actions.replace->queries->at("os"), "windows");
}

TEST(TestLoader, NullFieldsAreAbsent)
{
    auto raw = Loader::parse_yaml("proxy_ports: [80]\nlisten_port: ~\nrules:\n  - target: Request\n    selector: ~\n");
    EXPECT_FALSE(raw.listen_port);
    ASSERT_TRUE(raw.rules);
    EXPECT_FALSE((*raw.rules)[0].selector.path);
}

TEST(TestLoader, ParseYamlErrors)
{
    EXPECT_THROW(Loader::parse_yaml("- a\n- b\n"), ConfigError);
    EXPECT_THROW(Loader::parse_yaml("proxy_ports: [70000]\n"), ConfigError);
    EXPECT_THROW(Loader::parse_yaml("route_table: 256\nproxy_ports: [80]\n"), ConfigError);
    EXPECT_THROW(Loader::parse_yaml("proxy_ports: [80\n"), YAML::Exception);
    EXPECT_THROW(Loader::parse_yaml("proxy_ports: [abc]\n"), YAML::Exception);
}

TEST(TestLoader, ParseMsgpack)
{
    RawConfig config;
    config.listen_port = 58080;
    config.proxy_ports = {80};
    config.route_table = 100;

    RawRule rule;
    rule.target = "Response";
    rule.selector.code = 404;
    rule.actions.abort = true;
    rule.actions.delay = RawDuration{2, 0};
    config.rules = std::vector<RawRule>{rule};

    msgpack::sbuffer buffer;
    msgpack::pack(buffer, config);

    auto raw = Loader::parse_msgpack(std::string_view(buffer.data(), buffer.size()));
    EXPECT_EQ(*raw.listen_port, 58080);
    EXPECT_FALSE(raw.proxy_mark);
    ASSERT_TRUE(raw.rules);
    ASSERT_EQ(raw.rules->size(), 1u);
    EXPECT_EQ((*raw.rules)[0].target, "Response");
    EXPECT_EQ(*(*raw.rules)[0].selector.code, 404);
    EXPECT_EQ((*raw.rules)[0].actions.delay->secs, 2u);
}

TEST(TestLoader, LoadYamlFile)
{
    TempFile file("load_test.yaml", sample_yaml);

    Config config;
    ASSERT_TRUE(Loader::load(file.path(), config));
    EXPECT_EQ(config.proxy.listen_port, 58080);
    ASSERT_EQ(config.rules.size(), 2u);
    EXPECT_EQ(config.rules[0].target, Target::REQUEST);
    EXPECT_EQ(*config.rules[0].actions.delay, 1s);
    EXPECT_EQ(config.rules[1].target, Target::RESPONSE);
    EXPECT_TRUE(config.rules[1].actions.abort);
}

TEST(TestLoader, LoadMsgpackFile)
{
    RawConfig raw;
    raw.proxy_ports = {443};
    msgpack::sbuffer buffer;
    msgpack::pack(buffer, raw);

    TempFile file("load_test.msgpack", std::string(buffer.data(), buffer.size()));

    Config config;
    ASSERT_TRUE(Loader::load(file.path(), config));
    EXPECT_EQ(config.proxy.proxy_ports, std::vector<uint16_t>{443});
}

TEST(TestLoader, LoadFailuresLeaveOutputUntouched)
{
    Config config;
    config.proxy.listen_port = 1234;

    TempFile bad_extension("load_test.toml", "proxy_ports = [80]\n");
    EXPECT_FALSE(Loader::load(bad_extension.path(), config));

    EXPECT_FALSE(Loader::load("/nonexistent/ctproxy/rules.yaml", config));

    TempFile invalid_rule("load_invalid.yaml", "proxy_ports: [80]\nrules:\n  - target: Sideways\n");
    EXPECT_FALSE(Loader::load(invalid_rule.path(), config));

    TempFile no_ports("load_noports.json", "{\"rules\": []}");
    EXPECT_FALSE(Loader::load(no_ports.path(), config));

    TempFile garbage("load_garbage.msgpack", std::string("\xc1", 1));
    EXPECT_FALSE(Loader::load(garbage.path(), config));

    EXPECT_EQ(config.proxy.listen_port, 1234);
}

TEST(TestLoader, ExtensionIsCaseInsensitive)
{
    TempFile file("load_upper.YAML", "proxy_ports: [80]\n");
    Config config;
    EXPECT_TRUE(Loader::load(file.path(), config));
}

} // namespace
