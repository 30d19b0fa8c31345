#ifndef CTP_CLI_HPP
#define CTP_CLI_HPP

#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>
#include "../config.hpp"

namespace ctp::utils {

    // Valeur de -t : entier décimal dans [0, MAX_WORKER_THREADS], 0 = auto.
    // nullopt si vide, non numérique, suivi de déchets ou hors borne.
    inline std::optional<uint32_t> parse_thread_count(std::string_view text) {
        uint32_t value = 0;
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (text.empty() || ec != std::errc{} || ptr != end) return std::nullopt;
        if (value > config::MAX_WORKER_THREADS) return std::nullopt;
        return value;
    }
}

#endif // CTP_CLI_HPP
