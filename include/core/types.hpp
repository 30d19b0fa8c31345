#ifndef CTP_CORE_TYPES_HPP
#define CTP_CORE_TYPES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <msgpack.hpp>

namespace ctp::core {

    /**
     * DTOs (Data Transfer Objects) du fichier de configuration.
     * Tout est encore du texte brut : la validation et la conversion vers
     * le modèle de règles typé sont faites par io::Translator.
     *
     * Les noms de champs sont ceux du fichier (msgpack, yaml et json partagent
     * le même schéma). Clé absente ou nil -> std::nullopt.
     */

    // Même forme que la sérialisation d'une durée : {secs, nanos}
    struct RawDuration {
        uint64_t secs = 0;
        uint32_t nanos = 0;

        MSGPACK_DEFINE_MAP(secs, nanos);
    };

    struct RawSelector {
        std::optional<uint16_t> port;
        std::optional<std::string> path;
        std::optional<std::string> method;
        std::optional<std::map<std::string, std::string>> headers;
        std::optional<uint16_t> code;
        std::optional<std::map<std::string, std::string>> response_headers;

        MSGPACK_DEFINE_MAP(port, path, method, headers, code, response_headers);
    };

    struct RawAppendAction {
        std::optional<std::string> queries;
        std::optional<std::map<std::string, std::string>> headers;

        MSGPACK_DEFINE_MAP(queries, headers);
    };

    struct RawReplaceAction {
        std::optional<std::string> path;
        std::optional<std::string> method;
        std::optional<std::string> body; // str ou bin côté msgpack
        std::optional<uint16_t> code;
        std::optional<std::map<std::string, std::string>> queries;
        std::optional<std::map<std::string, std::string>> headers;

        MSGPACK_DEFINE_MAP(path, method, body, code, queries, headers);
    };

    struct RawActions {
        std::optional<bool> abort;
        std::optional<RawDuration> delay;
        std::optional<RawAppendAction> append;
        std::optional<RawReplaceAction> replace;

        MSGPACK_DEFINE_MAP(abort, delay, append, replace);
    };

    struct RawRule {
        std::string target; // "Request" | "Response"
        RawSelector selector;
        RawActions actions;

        MSGPACK_DEFINE_MAP(target, selector, actions);
    };

    /**
     * Racine du fichier. Les réglages réseau ne sont pas utilisés par le moteur,
     * ils sont validés puis transmis à la couche transport.
     */
    struct RawConfig {
        std::optional<uint16_t> listen_port;
        std::vector<uint16_t> proxy_ports;
        std::optional<int32_t> proxy_mark;
        std::optional<int32_t> ignore_mark;
        std::optional<uint8_t> route_table;
        std::optional<std::vector<RawRule>> rules;

        MSGPACK_DEFINE_MAP(listen_port, proxy_ports, proxy_mark, ignore_mark, route_table, rules);
    };
}

#endif // CTP_CORE_TYPES_HPP
