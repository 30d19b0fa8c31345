#ifndef CTP_HTTP_HEADERS_HPP
#define CTP_HTTP_HEADERS_HPP

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ctp::http {

    /**
     * Multimap ordonnée de champs d'en-tête.
     *
     * Les noms sont insensibles à la casse : ils sont stockés en minuscules.
     * L'ordre d'insertion est conservé, y compris pour les occurrences répétées
     * d'un même nom (Set-Cookie, Via, ...).
     *
     * Deux mutations distinctes :
     *  - append()  : ajoute une occurrence, ne touche jamais aux existantes
     *  - set_all() : remplace TOUTES les occurrences du nom par une seule valeur
     */
    class HeaderMap {
    public:
        using Field = std::pair<std::string, std::string>;
        using const_iterator = std::vector<Field>::const_iterator;

        HeaderMap() = default;
        HeaderMap(std::initializer_list<std::pair<std::string_view, std::string_view>> fields);

        void append(std::string_view name, std::string_view value);
        void set_all(std::string_view name, std::string_view value);

        // Supprime toutes les occurrences, retourne le nombre retiré.
        std::size_t erase(std::string_view name);

        std::vector<std::string_view> get_all(std::string_view name) const;

        // Vrai si AU MOINS une occurrence de name vaut exactement value.
        bool has_value(std::string_view name, std::string_view value) const;

        bool contains(std::string_view name) const;

        std::size_t size() const { return _fields.size(); }
        bool empty() const { return _fields.empty(); }

        const_iterator begin() const { return _fields.begin(); }
        const_iterator end() const { return _fields.end(); }

        bool operator==(const HeaderMap& other) const = default;

    private:
        std::vector<Field> _fields;
    };

    // Validation syntaxique (RFC 9110 token / field-value) pour la traduction de config.
    bool is_valid_header_name(std::string_view name);
    bool is_valid_header_value(std::string_view value);
}

#endif // CTP_HTTP_HEADERS_HPP
