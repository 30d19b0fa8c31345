#include "io/translator.hpp"
#include "core/errors.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace ctp;
using namespace ctp::core;
using namespace ctp::io;
using namespace std::chrono_literals;

namespace {

RawConfig minimal_config()
{
    RawConfig raw;
    raw.proxy_ports = {80};
    return raw;
}

RawRule request_rule()
{
    RawRule rule;
    rule.target = "Request";
    return rule;
}

TEST(TestTranslator, Defaults)
{
    auto config = Translator::translate(minimal_config());

    EXPECT_EQ(config.proxy.listen_port, ctp::config::DEFAULT_LISTEN_PORT);
    EXPECT_EQ(config.proxy.proxy_mark, ctp::config::DEFAULT_PROXY_MARK);
    EXPECT_EQ(config.proxy.ignore_mark, ctp::config::DEFAULT_IGNORE_MARK);
    EXPECT_EQ(config.proxy.route_table, ctp::config::DEFAULT_ROUTE_TABLE);
    EXPECT_EQ(config.proxy.proxy_ports, std::vector<uint16_t>{80});
    EXPECT_TRUE(config.rules.empty());
}

TEST(TestTranslator, ExplicitProxySettings)
{
    RawConfig raw = minimal_config();
    raw.listen_port = 9000;
    raw.proxy_ports = {80, 8080};
    raw.proxy_mark = 7;
    raw.ignore_mark = 8;
    raw.route_table = 42;

    auto config = Translator::translate(raw);
    EXPECT_EQ(config.proxy.listen_port, 9000);
    EXPECT_EQ(config.proxy.proxy_ports.size(), 2u);
    EXPECT_EQ(config.proxy.proxy_mark, 7);
    EXPECT_EQ(config.proxy.ignore_mark, 8);
    EXPECT_EQ(config.proxy.route_table, 42);
}

TEST(TestTranslator, ProxyPortsRequired)
{
    EXPECT_THROW(Translator::translate(RawConfig{}), ConfigError);
}

TEST(TestTranslator, TargetIsCaseInsensitive)
{
    RawRule rule = request_rule();
    rule.target = "request";
    EXPECT_EQ(Translator::translate_rule(rule, 0).target, Target::REQUEST);

    rule.target = "RESPONSE";
    EXPECT_EQ(Translator::translate_rule(rule, 0).target, Target::RESPONSE);

    rule.target = "both";
    EXPECT_THROW(Translator::translate_rule(rule, 0), ConfigError);
}

TEST(TestTranslator, RulesKeepDeclarationOrder)
{
    RawConfig raw = minimal_config();
    RawRule first = request_rule();
    first.selector.method = "GET";
    RawRule second = request_rule();
    second.target = "Response";
    raw.rules = std::vector<RawRule>{first, second};

    auto config = Translator::translate(raw);
    ASSERT_EQ(config.rules.size(), 2u);
    EXPECT_EQ(config.rules[0].target, Target::REQUEST);
    ASSERT_TRUE(config.rules[0].selector.method);
    EXPECT_EQ(*config.rules[0].selector.method, "GET");
    EXPECT_EQ(config.rules[1].target, Target::RESPONSE);
}

TEST(TestTranslator, Selector)
{
    RawRule raw = request_rule();
    raw.selector.port = 80;
    raw.selector.path = "/rs-tproxy?ignored=1";
    raw.selector.method = "GET";
    raw.selector.headers = std::map<std::string, std::string>{{"AName", "avalue"}};

    auto rule = Translator::translate_rule(raw, 0);
    ASSERT_TRUE(rule.selector.port);
    EXPECT_EQ(*rule.selector.port, 80);
    ASSERT_TRUE(rule.selector.path);
    EXPECT_EQ(rule.selector.path->path(), "/rs-tproxy");
    ASSERT_TRUE(rule.selector.headers);
    EXPECT_TRUE(rule.selector.headers->has_value("aname", "avalue"));
}

TEST(TestTranslator, InvalidSelector)
{
    RawRule bad_path = request_rule();
    bad_path.selector.path = "no-slash";
    EXPECT_THROW(Translator::translate_rule(bad_path, 0), ConfigError);

    RawRule bad_method = request_rule();
    bad_method.selector.method = "GE T";
    EXPECT_THROW(Translator::translate_rule(bad_method, 0), ConfigError);

    RawRule bad_header = request_rule();
    bad_header.selector.headers = std::map<std::string, std::string>{{"bad name", "x"}};
    EXPECT_THROW(Translator::translate_rule(bad_header, 0), ConfigError);

    RawRule bad_code = request_rule();
    bad_code.target = "Response";
    bad_code.selector.code = 42;
    EXPECT_THROW(Translator::translate_rule(bad_code, 0), ConfigError);
}

TEST(TestTranslator, ErrorNamesTheRule)
{
    RawConfig raw = minimal_config();
    RawRule good = request_rule();
    RawRule bad = request_rule();
    bad.selector.method = "BAD METHOD";
    raw.rules = std::vector<RawRule>{good, bad};

    try {
        Translator::translate(raw);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("rule #1"), std::string::npos) << e.what();
    }
}

TEST(TestTranslator, DelayConversion)
{
    RawRule raw = request_rule();
    raw.actions.delay = RawDuration{1, 500000000};

    auto rule = Translator::translate_rule(raw, 0);
    ASSERT_TRUE(rule.actions.delay);
    EXPECT_EQ(*rule.actions.delay, 1500ms);
}

TEST(TestTranslator, DelayOutOfRange)
{
    RawRule raw = request_rule();
    raw.actions.delay = RawDuration{0, 1000000000};
    EXPECT_THROW(Translator::translate_rule(raw, 0), ConfigError);

    raw.actions.delay = RawDuration{UINT64_MAX, 0};
    EXPECT_THROW(Translator::translate_rule(raw, 0), ConfigError);
}

TEST(TestTranslator, Actions)
{
    RawRule raw = request_rule();
    raw.actions.abort = false;
    raw.actions.append = RawAppendAction{};
    raw.actions.append->queries = "foo=bar";
    raw.actions.append->headers = std::map<std::string, std::string>{{"X-Chaos", "on"}};
    raw.actions.replace = RawReplaceAction{};
    raw.actions.replace->path = "/pull/2/lgtm";
    raw.actions.replace->method = "PUT";
    raw.actions.replace->queries = std::map<std::string, std::string>{{"os", "windows"}};
    raw.actions.replace->body = "hello";

    auto rule = Translator::translate_rule(raw, 0);
    EXPECT_FALSE(rule.actions.abort);
    ASSERT_TRUE(rule.actions.append);
    EXPECT_EQ(*rule.actions.append->queries, "foo=bar");
    EXPECT_TRUE(rule.actions.append->headers->has_value("x-chaos", "on"));
    ASSERT_TRUE(rule.actions.replace);
    EXPECT_EQ(*rule.actions.replace->path, "/pull/2/lgtm");
    EXPECT_EQ(*rule.actions.replace->method, "PUT");
    EXPECT_EQ(rule.actions.replace->queries->at("os"), "windows");
    EXPECT_EQ(*rule.actions.replace->body, "hello");
}

TEST(TestTranslator, InvalidActions)
{
    RawRule bad_queries = request_rule();
    bad_queries.actions.append = RawAppendAction{};
    bad_queries.actions.append->queries = "a b";
    EXPECT_THROW(Translator::translate_rule(bad_queries, 0), ConfigError);

    RawRule path_with_query = request_rule();
    path_with_query.actions.replace = RawReplaceAction{};
    path_with_query.actions.replace->path = "/p?q=1";
    EXPECT_THROW(Translator::translate_rule(path_with_query, 0), ConfigError);

    RawRule bad_code = request_rule();
    bad_code.target = "Response";
    bad_code.actions.replace = RawReplaceAction{};
    bad_code.actions.replace->code = 1000;
    EXPECT_THROW(Translator::translate_rule(bad_code, 0), ConfigError);
}

TEST(TestTranslator, EmptyReplacementPathIsAccepted)
{
    RawRule raw = request_rule();
    raw.actions.replace = RawReplaceAction{};
    raw.actions.replace->path = "";

    auto rule = Translator::translate_rule(raw, 0);
    ASSERT_TRUE(rule.actions.replace->path);
    EXPECT_TRUE(rule.actions.replace->path->empty());
}

TEST(TestTranslator, IrrelevantFieldsAreKept)
{
    RawRule raw = request_rule();
    raw.selector.code = 404;

    auto rule = Translator::translate_rule(raw, 0);
    ASSERT_TRUE(rule.selector.code);
    EXPECT_EQ(*rule.selector.code, 404);
}

} // namespace
