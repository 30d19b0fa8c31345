#ifndef CTP_HTTP_URI_HPP
#define CTP_HTTP_URI_HPP

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace ctp::http {

    /**
     * Composant "path[?query]" d'une request-target HTTP.
     * Valeur immuable : les réécritures fabriquent une nouvelle instance.
     *
     * Invariants après parse():
     *  - path non vide, commence par '/' (ou vaut exactement "*")
     *  - path ne contient ni '?' ni '#', query ne contient pas '#'
     *  - uniquement de l'ASCII visible (0x21..0x7E)
     */
    class PathAndQuery {
    public:
        // Lève InvalidUri si le texte n'est pas un composant valide.
        // "" est normalisé en "/".
        static PathAndQuery parse(std::string_view raw);

        const std::string& path() const { return _path; }
        const std::optional<std::string>& query() const { return _query; }

        std::string to_string() const;

        bool operator==(const PathAndQuery& other) const = default;

    private:
        PathAndQuery(std::string path, std::optional<std::string> query)
            : _path(std::move(path)), _query(std::move(query)) {}

        std::string _path;
        std::optional<std::string> _query;
    };

    /**
     * Request-target d'une requête interceptée.
     *
     * Formes acceptées :
     *  - origin-form    "/a/b?x=1"              (cas normal en proxy transparent)
     *  - absolute-form  "http://host:80/a?x=1"
     *  - authority-form "host:443"              (CONNECT, pas de path_and_query)
     *  - asterisk-form  "*"
     * Le fragment éventuel est ignoré au parse (jamais transmis sur le fil).
     */
    class Uri {
    public:
        Uri() = default;

        static Uri parse(std::string_view raw);

        // Nouvelle URI identique à *this sauf le composant path-and-query.
        Uri with_path_and_query(PathAndQuery paq) const;

        const std::string& scheme() const { return _scheme; }
        const std::string& authority() const { return _authority; }
        const std::optional<PathAndQuery>& path_and_query() const { return _path_and_query; }

        // Chemin décodé tel que vu par les sélecteurs ("/" pour une forme absolue sans path).
        std::string_view path() const;
        std::optional<std::string_view> query() const;

        std::string to_string() const;

        bool operator==(const Uri& other) const = default;

    private:
        std::string _scheme;
        std::string _authority;
        std::optional<PathAndQuery> _path_and_query;
    };

    std::ostream& operator<<(std::ostream& os, const Uri& uri);
}

#endif // CTP_HTTP_URI_HPP
