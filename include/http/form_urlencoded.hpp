#ifndef CTP_HTTP_FORM_URLENCODED_HPP
#define CTP_HTTP_FORM_URLENCODED_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ctp::http::form {

    using Pairs = std::vector<std::pair<std::string, std::string>>;

    /**
     * Décode une query application/x-www-form-urlencoded.
     * '+' -> espace, %XX -> octet ; segments vides ignorés ; "k" seul -> ("k", "").
     * Toutes les occurrences sont conservées, dans l'ordre.
     * Lève InvalidUri sur un échappement %XX mal formé.
     */
    Pairs decode(std::string_view query);

    /**
     * Comme decode() mais une clé n'apparaît qu'une fois :
     * position de sa première occurrence, valeur de sa DERNIÈRE occurrence.
     */
    Pairs decode_collapsed(std::string_view query);

    // Encodage inverse : [A-Za-z0-9*-._] tels quels, espace -> '+', reste en %XX.
    std::string encode(const Pairs& pairs);

    std::string encode_component(std::string_view raw);
}

#endif // CTP_HTTP_FORM_URLENCODED_HPP
