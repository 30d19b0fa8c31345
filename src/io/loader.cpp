#include "../../include/io/loader.hpp"
#include "../../include/core/errors.hpp"
#include "../../include/utils/logger.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>
#include <msgpack.hpp>
#include <yaml-cpp/yaml.h>
#include <boost/algorithm/string/case_conv.hpp>

namespace ctp::io {

    namespace {

        bool present(const YAML::Node& node) {
            return node && !node.IsNull();
        }

        // as<uint8_t>() lirait un caractère : on passe par un entier borné
        template <typename Int>
        Int as_int(const YAML::Node& node, const char* field) {
            if constexpr (std::is_same_v<Int, uint64_t>) {
                return node.as<uint64_t>();
            } else {
                auto value = node.as<int64_t>();
                if (value < static_cast<int64_t>(std::numeric_limits<Int>::min()) ||
                    value > static_cast<int64_t>(std::numeric_limits<Int>::max())) {
                    throw ConfigError(std::string(field) + " out of range: " + std::to_string(value));
                }
                return static_cast<Int>(value);
            }
        }

        template <typename Int>
        std::optional<Int> opt_int(const YAML::Node& parent, const char* field) {
            YAML::Node node = parent[field];
            if (!present(node)) return std::nullopt;
            return as_int<Int>(node, field);
        }

        std::optional<std::string> opt_string(const YAML::Node& parent, const char* field) {
            YAML::Node node = parent[field];
            if (!present(node)) return std::nullopt;
            return node.as<std::string>();
        }

        std::optional<std::map<std::string, std::string>> opt_map(const YAML::Node& parent, const char* field) {
            YAML::Node node = parent[field];
            if (!present(node)) return std::nullopt;
            return node.as<std::map<std::string, std::string>>();
        }

        core::RawSelector read_selector(const YAML::Node& node) {
            core::RawSelector s;
            if (!present(node)) return s;
            s.port = opt_int<uint16_t>(node, "port");
            s.path = opt_string(node, "path");
            s.method = opt_string(node, "method");
            s.headers = opt_map(node, "headers");
            s.code = opt_int<uint16_t>(node, "code");
            s.response_headers = opt_map(node, "response_headers");
            return s;
        }

        core::RawActions read_actions(const YAML::Node& node) {
            core::RawActions a;
            if (!present(node)) return a;

            if (present(node["abort"])) a.abort = node["abort"].as<bool>();

            if (YAML::Node delay = node["delay"]; present(delay)) {
                core::RawDuration d;
                d.secs = opt_int<uint64_t>(delay, "secs").value_or(0);
                d.nanos = opt_int<uint32_t>(delay, "nanos").value_or(0);
                a.delay = d;
            }

            if (YAML::Node append = node["append"]; present(append)) {
                core::RawAppendAction ap;
                ap.queries = opt_string(append, "queries");
                ap.headers = opt_map(append, "headers");
                a.append = std::move(ap);
            }

            if (YAML::Node replace = node["replace"]; present(replace)) {
                core::RawReplaceAction rp;
                rp.path = opt_string(replace, "path");
                rp.method = opt_string(replace, "method");
                rp.body = opt_string(replace, "body");
                rp.code = opt_int<uint16_t>(replace, "code");
                rp.queries = opt_map(replace, "queries");
                rp.headers = opt_map(replace, "headers");
                a.replace = std::move(rp);
            }

            return a;
        }
    }

    core::RawConfig Loader::parse_yaml(const std::string& text) {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap()) {
            throw ConfigError("configuration root must be a mapping");
        }

        core::RawConfig raw;
        raw.listen_port = opt_int<uint16_t>(root, "listen_port");
        if (YAML::Node ports = root["proxy_ports"]; present(ports)) {
            for (const auto& port : ports) {
                raw.proxy_ports.push_back(as_int<uint16_t>(port, "proxy_ports"));
            }
        }
        raw.proxy_mark = opt_int<int32_t>(root, "proxy_mark");
        raw.ignore_mark = opt_int<int32_t>(root, "ignore_mark");
        raw.route_table = opt_int<uint8_t>(root, "route_table");

        if (YAML::Node rules = root["rules"]; present(rules)) {
            std::vector<core::RawRule> parsed;
            for (const auto& node : rules) {
                core::RawRule rule;
                rule.target = node["target"].as<std::string>();
                rule.selector = read_selector(node["selector"]);
                rule.actions = read_actions(node["actions"]);
                parsed.push_back(std::move(rule));
            }
            raw.rules = std::move(parsed);
        }

        return raw;
    }

    core::RawConfig Loader::parse_msgpack(std::string_view data) {
        // Désérialisation msgpack
        msgpack::object_handle oh = msgpack::unpack(data.data(), data.size());
        msgpack::object obj = oh.get();

        core::RawConfig raw;
        obj.convert(raw);
        return raw;
    }

    bool Loader::read_file(const std::string& path, std::string& out) {
        std::ifstream ifs(path, std::ifstream::in | std::ifstream::binary);
        if (!ifs) {
            log::error("Cannot open rules config: " + path);
            return false;
        }

        // Lecture intégrale du fichier dans un buffer
        std::stringstream buffer;
        buffer << ifs.rdbuf();
        out = buffer.str();
        return true;
    }

    bool Loader::load(const std::string& path, Config& out) {
        log::info(">>> Loading configuration from " + path);

        std::string ext = boost::algorithm::to_lower_copy(std::filesystem::path(path).extension().string());
        bool is_msgpack = (ext == ".msgpack");
        bool is_yaml = (ext == ".yaml" || ext == ".yml" || ext == ".json");
        if (!is_msgpack && !is_yaml) {
            log::error("Invalid config file extension \"" + ext + "\" (expected .yaml, .yml, .json or .msgpack)");
            return false;
        }

        std::string data;
        if (!read_file(path, data)) {
            return false;
        }

        try {
            core::RawConfig raw = is_msgpack ? parse_msgpack(data) : parse_yaml(data);
            Config config = Translator::translate(raw);

            log::info("Parsed " + std::to_string(config.rules.size()) + " rules, "
                      + std::to_string(config.proxy.proxy_ports.size()) + " proxied ports, listen port "
                      + std::to_string(config.proxy.listen_port));
            out = std::move(config);

        } catch (const ConfigError& e) {
            log::error(std::string("Invalid configuration: ") + e.what());
            return false;
        } catch (const YAML::Exception& e) {
            log::error(std::string("YAML parsing failed: ") + e.what());
            return false;
        } catch (const msgpack::type_error& e) {
            log::error(std::string("Msgpack conversion failed: ") + e.what());
            return false;
        } catch (const msgpack::unpack_error& e) {
            log::error(std::string("Msgpack unpacking failed: ") + e.what());
            return false;
        }

        log::info(">>> Configuration ready.");
        return true;
    }
}
