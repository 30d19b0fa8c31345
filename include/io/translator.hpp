#ifndef CTP_IO_TRANSLATOR_HPP
#define CTP_IO_TRANSLATOR_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "../core/rule.hpp"
#include "../core/types.hpp"

namespace ctp::io {

    // Réglages de la couche transport (marks, table de routage, ports interceptés)
    struct ProxySettings {
        uint16_t listen_port = 0;
        std::vector<uint16_t> proxy_ports;
        int32_t proxy_mark = 0;
        int32_t ignore_mark = 0;
        uint8_t route_table = 0;
    };

    struct Config {
        ProxySettings proxy;
        core::RuleSet rules;
    };

    /**
     * Conversion RawConfig (texte brut) -> Config (modèle typé et validé).
     * Lève ConfigError en nommant la règle fautive ; rien n'est deviné.
     */
    class Translator {
    public:
        static Config translate(const core::RawConfig& raw);

        static core::Rule translate_rule(const core::RawRule& raw, std::size_t index);

    private:
        static core::Target parse_target(const std::string& raw, std::size_t index);
        static core::Selector translate_selector(const core::RawSelector& raw, std::size_t index);
        static core::Actions translate_actions(const core::RawActions& raw, std::size_t index);
        static void report_ignored_fields(const core::Rule& rule, std::size_t index);
    };
}

#endif // CTP_IO_TRANSLATOR_HPP
