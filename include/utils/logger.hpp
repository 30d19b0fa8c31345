#ifndef CTP_LOGGER_HPP
#define CTP_LOGGER_HPP

#include <iostream>
#include <string_view>
#include <string>
#include <sstream>
#include <cstddef>
#include <cstdint>
#include "../config.hpp"

namespace ctp::log {

    // Log critique : Toujours affiché (stderr)
    inline void error(std::string_view msg) {
        std::cerr << "[CRITICAL] " << msg << std::endl;
    }

    // Log info : Pour les étapes majeures
    inline void info(std::string_view msg) {
        std::cout << "[INFO] " << msg << std::endl;
    }

    // Log debug : Contrôlé par DEBUG_MODE dans config.hpp
    inline void debug(std::string_view msg) {
        if constexpr (ctp::config::DEBUG_MODE) {
            std::cout << "[DEBUG] " << msg << std::endl;
        }
    }

    // Log exchange : Une ligne par échange entrant (si DEBUG_MODE actif)
    inline void exchange(uint64_t id, uint16_t port, std::string_view side, std::string_view summary) {
        if constexpr (ctp::config::DEBUG_MODE) {
            std::ostringstream oss;
            oss << "[EXCHANGE] #" << id << " port=" << port << " " << side << " " << summary;
            std::cout << oss.str() << std::endl;
        }
    }

    // Log rule match : Index de la règle retenue (first match)
    inline void rule_match(std::size_t rule_index, std::string_view target) {
        if constexpr (ctp::config::DEBUG_MODE) {
            std::cout << "[RULE] match rule=" << rule_index << " target=" << target << std::endl;
        }
    }

    // Log verdict : Affiche la décision prise
    // Un ABORT est une issue voulue par la règle, pas une erreur -> jamais sur stderr
    inline void verdict(const char* decision, std::string_view detail = "") {
        if constexpr (ctp::config::DEBUG_MODE) {
            std::ostringstream oss;
            oss << "[VERDICT] " << decision;
            if (!detail.empty()) oss << " " << detail;
            std::cout << oss.str() << std::endl;
        }
    }
}

#endif // CTP_LOGGER_HPP
