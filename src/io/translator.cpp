#include "../../include/io/translator.hpp"
#include "../../include/core/errors.hpp"
#include "../../include/http/token.hpp"
#include "../../include/utils/logger.hpp"
#include "../../include/config.hpp"

#include <chrono>
#include <limits>
#include <boost/algorithm/string/predicate.hpp>

namespace ctp::io {

    namespace {
        constexpr uint64_t NANOS_PER_SEC = 1000000000ULL;

        std::string rule_prefix(std::size_t index) {
            return "rule #" + std::to_string(index) + ": ";
        }

        // http::StatusCode accepte 100..999
        void check_status(uint16_t code, std::size_t index, const char* field) {
            if (code < 100 || code > 999) {
                throw ConfigError(rule_prefix(index) + field + " " + std::to_string(code)
                                  + " is not a valid status code");
            }
        }

        void check_method(const std::string& method, std::size_t index, const char* field) {
            if (!http::is_token(method)) {
                throw ConfigError(rule_prefix(index) + field + " \"" + method + "\" is not a valid HTTP method");
            }
        }

        http::HeaderMap to_header_map(const std::map<std::string, std::string>& raw,
                                      std::size_t index, const char* field) {
            http::HeaderMap headers;
            for (const auto& [name, value] : raw) {
                if (!http::is_valid_header_name(name)) {
                    throw ConfigError(rule_prefix(index) + field + ": invalid header name \"" + name + "\"");
                }
                if (!http::is_valid_header_value(value)) {
                    throw ConfigError(rule_prefix(index) + field + ": invalid value for header \"" + name + "\"");
                }
                headers.append(name, value);
            }
            return headers;
        }
    }

    Config Translator::translate(const core::RawConfig& raw) {
        Config config;

        if (raw.proxy_ports.empty()) {
            throw ConfigError("proxy_ports must list at least one port");
        }

        config.proxy.listen_port = raw.listen_port.value_or(ctp::config::DEFAULT_LISTEN_PORT);
        config.proxy.proxy_ports = raw.proxy_ports;
        config.proxy.proxy_mark  = raw.proxy_mark.value_or(ctp::config::DEFAULT_PROXY_MARK);
        config.proxy.ignore_mark = raw.ignore_mark.value_or(ctp::config::DEFAULT_IGNORE_MARK);
        config.proxy.route_table = raw.route_table.value_or(ctp::config::DEFAULT_ROUTE_TABLE);

        if (raw.rules) {
            config.rules.reserve(raw.rules->size());
            for (std::size_t i = 0; i < raw.rules->size(); ++i) {
                config.rules.push_back(translate_rule((*raw.rules)[i], i));
            }
        }

        return config;
    }

    core::Rule Translator::translate_rule(const core::RawRule& raw, std::size_t index) {
        core::Rule rule;
        rule.target = parse_target(raw.target, index);
        rule.selector = translate_selector(raw.selector, index);
        rule.actions = translate_actions(raw.actions, index);
        report_ignored_fields(rule, index);
        return rule;
    }

    core::Target Translator::parse_target(const std::string& raw, std::size_t index) {
        if (boost::algorithm::iequals(raw, "request")) return core::Target::REQUEST;
        if (boost::algorithm::iequals(raw, "response")) return core::Target::RESPONSE;
        throw ConfigError(rule_prefix(index) + "unknown target \"" + raw + "\" (expected Request or Response)");
    }

    core::Selector Translator::translate_selector(const core::RawSelector& raw, std::size_t index) {
        core::Selector selector;
        selector.port = raw.port;

        if (raw.path) {
            try {
                selector.path = http::PathAndQuery::parse(*raw.path);
            } catch (const InvalidUri& e) {
                throw ConfigError(rule_prefix(index) + "selector.path: " + e.what());
            }
        }

        if (raw.method) {
            check_method(*raw.method, index, "selector.method");
            selector.method = raw.method;
        }

        if (raw.headers) {
            selector.headers = to_header_map(*raw.headers, index, "selector.headers");
        }

        if (raw.code) {
            check_status(*raw.code, index, "selector.code");
            selector.code = raw.code;
        }

        if (raw.response_headers) {
            selector.response_headers = to_header_map(*raw.response_headers, index, "selector.response_headers");
        }

        return selector;
    }

    core::Actions Translator::translate_actions(const core::RawActions& raw, std::size_t index) {
        core::Actions actions;
        actions.abort = raw.abort.value_or(false);

        if (raw.delay) {
            if (raw.delay->nanos >= NANOS_PER_SEC) {
                throw ConfigError(rule_prefix(index) + "actions.delay.nanos must be below 1e9");
            }
            constexpr uint64_t max_secs =
                static_cast<uint64_t>(std::numeric_limits<std::chrono::nanoseconds::rep>::max()) / NANOS_PER_SEC - 1;
            if (raw.delay->secs > max_secs) {
                throw ConfigError(rule_prefix(index) + "actions.delay is out of range");
            }
            actions.delay = std::chrono::seconds(raw.delay->secs) + std::chrono::nanoseconds(raw.delay->nanos);
        }

        if (raw.append) {
            core::AppendAction append;
            if (raw.append->queries) {
                // Le fragment est concaténé tel quel : on vérifie dès le chargement qu'il tient dans une query
                try {
                    http::PathAndQuery::parse("/?" + *raw.append->queries);
                } catch (const InvalidUri& e) {
                    throw ConfigError(rule_prefix(index) + "actions.append.queries: " + e.what());
                }
                append.queries = raw.append->queries;
            }
            if (raw.append->headers) {
                append.headers = to_header_map(*raw.append->headers, index, "actions.append.headers");
            }
            actions.append = std::move(append);
        }

        if (raw.replace) {
            core::ReplaceAction replace;
            if (raw.replace->path) {
                const std::string& path = *raw.replace->path;
                try {
                    if (path.find('?') != std::string::npos) {
                        throw InvalidUri("replacement path carries a query: \"" + path + "\"");
                    }
                    http::PathAndQuery::parse(path);
                } catch (const InvalidUri& e) {
                    throw ConfigError(rule_prefix(index) + "actions.replace.path: " + e.what());
                }
                replace.path = path;
            }
            if (raw.replace->method) {
                check_method(*raw.replace->method, index, "actions.replace.method");
                replace.method = raw.replace->method;
            }
            replace.body = raw.replace->body;
            if (raw.replace->code) {
                check_status(*raw.replace->code, index, "actions.replace.code");
                replace.code = raw.replace->code;
            }
            replace.queries = raw.replace->queries;
            if (raw.replace->headers) {
                replace.headers = to_header_map(*raw.replace->headers, index, "actions.replace.headers");
            }
            actions.replace = std::move(replace);
        }

        return actions;
    }

    // Champs sans effet pour la cible de la règle : acceptés mais signalés
    void Translator::report_ignored_fields(const core::Rule& rule, std::size_t index) {
        std::vector<std::string> ignored;
        const auto& sel = rule.selector;
        const auto& act = rule.actions;

        if (rule.target == core::Target::REQUEST) {
            if (sel.code) ignored.emplace_back("selector.code");
            if (sel.response_headers) ignored.emplace_back("selector.response_headers");
            if (act.replace && act.replace->code) ignored.emplace_back("actions.replace.code");
        } else {
            if (act.append && act.append->queries) ignored.emplace_back("actions.append.queries");
            if (act.replace && act.replace->path) ignored.emplace_back("actions.replace.path");
            if (act.replace && act.replace->method) ignored.emplace_back("actions.replace.method");
            if (act.replace && act.replace->queries) ignored.emplace_back("actions.replace.queries");
        }

        if (act.abort && (act.delay || act.append || act.replace)) {
            ignored.emplace_back("actions.{delay,append,replace} (abort set)");
        }

        for (const auto& field : ignored) {
            log::info(rule_prefix(index) + field + " has no effect on a " + to_string(rule.target) + " rule");
        }
    }
}
