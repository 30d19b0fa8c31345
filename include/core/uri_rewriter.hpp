#ifndef CTP_CORE_URI_REWRITER_HPP
#define CTP_CORE_URI_REWRITER_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include "../http/uri.hpp"

namespace ctp::core {

    /**
     * Réécritures d'URI. Fonctions pures : ancienne URI -> nouvelle URI.
     * Toutes lèvent InvalidUri si le résultat n'est pas ré-encodable ;
     * dans ce cas l'URI d'entrée n'est évidemment pas touchée.
     */
    class UriRewriter {
    public:
        /**
         * Concatène un fragment déjà encodé à la query existante
         * ('&' si une query existe, '?' sinon, path "/" si aucun path).
         * Aucun décodage : les clés dupliquées s'accumulent.
         * Fragment absent ou vide -> URI inchangée.
         */
        static http::Uri append_queries(const http::Uri& uri, std::optional<std::string_view> fragment);

        /**
         * Remplace le path en conservant la query. "" vaut "/".
         * Une URI authority-form (sans path possible) est laissée telle quelle ;
         * une forme absolue sans path est traitée comme ayant le path "/".
         */
        static http::Uri replace_path(const http::Uri& uri, std::optional<std::string_view> new_path);

        /**
         * Décode la query (dernière occurrence gagnante), fusionne overrides
         * par clé, ré-encode dans l'ordre d'insertion (clés existantes puis
         * nouvelles) et rattache au path courant ("/" par défaut).
         */
        static http::Uri replace_queries(const http::Uri& uri,
                                         const std::optional<std::map<std::string, std::string>>& overrides);
    };
}

#endif // CTP_CORE_URI_REWRITER_HPP
