#include "../../include/http/uri.hpp"
#include "../../include/core/errors.hpp"

#include <algorithm>
#include <cctype>

namespace ctp::http {

    namespace {
        // ASCII visible uniquement ; '#' ouvrirait un fragment.
        bool is_target_char(char c) {
            auto u = static_cast<unsigned char>(c);
            return u >= 0x21 && u <= 0x7E && c != '#';
        }

        bool is_scheme_char(char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
        }

        // authority = [ userinfo "@" ] host [ ":" port ]
        bool is_authority_char(char c) {
            return is_target_char(c) && c != '/' && c != '?';
        }

        void check_chars(std::string_view text, std::string_view what, bool (*pred)(char)) {
            auto bad = std::find_if_not(text.begin(), text.end(), pred);
            if (bad != text.end()) {
                throw InvalidUri(std::string(what) + " contains invalid character at offset "
                                 + std::to_string(bad - text.begin()) + ": \"" + std::string(text) + "\"");
            }
        }
    }

    PathAndQuery PathAndQuery::parse(std::string_view raw) {
        if (raw.empty()) {
            return PathAndQuery("/", std::nullopt);
        }

        check_chars(raw, "path-and-query", is_target_char);

        size_t qmark = raw.find('?');
        std::string_view path = raw.substr(0, qmark);
        std::optional<std::string> query;
        if (qmark != std::string_view::npos) {
            query = std::string(raw.substr(qmark + 1));
        }

        // "?x=1" tout seul : pas de path, on ancre sur la racine
        if (path.empty()) {
            return PathAndQuery("/", std::move(query));
        }

        if (path != "*" && path.front() != '/') {
            throw InvalidUri("path must start with '/': \"" + std::string(raw) + "\"");
        }
        if (path == "*" && query) {
            throw InvalidUri("asterisk-form target cannot carry a query");
        }

        return PathAndQuery(std::string(path), std::move(query));
    }

    std::string PathAndQuery::to_string() const {
        if (!_query) return _path;
        return _path + "?" + *_query;
    }

    Uri Uri::parse(std::string_view raw) {
        // Le fragment n'est jamais envoyé sur le fil : on le coupe
        raw = raw.substr(0, raw.find('#'));

        if (raw.empty()) {
            throw InvalidUri("empty request target");
        }

        Uri uri;

        // origin-form / asterisk-form
        if (raw.front() == '/' || raw == "*") {
            uri._path_and_query = PathAndQuery::parse(raw);
            return uri;
        }

        size_t sep = raw.find("://");
        if (sep != std::string_view::npos) {
            // absolute-form
            std::string_view scheme = raw.substr(0, sep);
            if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
                throw InvalidUri("malformed scheme: \"" + std::string(raw) + "\"");
            }
            check_chars(scheme, "scheme", is_scheme_char);

            std::string_view rest = raw.substr(sep + 3);
            size_t end = rest.find_first_of("/?");
            std::string_view authority = rest.substr(0, end);
            if (authority.empty()) {
                throw InvalidUri("missing authority: \"" + std::string(raw) + "\"");
            }
            check_chars(authority, "authority", is_authority_char);

            uri._scheme = std::string(scheme);
            std::transform(uri._scheme.begin(), uri._scheme.end(), uri._scheme.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            uri._authority = std::string(authority);
            if (end != std::string_view::npos) {
                uri._path_and_query = PathAndQuery::parse(rest.substr(end));
            }
            return uri;
        }

        // authority-form (CONNECT host:port)
        check_chars(raw, "authority", is_authority_char);
        uri._authority = std::string(raw);
        return uri;
    }

    Uri Uri::with_path_and_query(PathAndQuery paq) const {
        if (_scheme.empty() && !_authority.empty()) {
            throw InvalidUri("authority-form target cannot carry a path: \"" + _authority + "\"");
        }
        Uri copy = *this;
        copy._path_and_query = std::move(paq);
        return copy;
    }

    std::string_view Uri::path() const {
        if (_path_and_query) return _path_and_query->path();
        return _scheme.empty() ? std::string_view{} : std::string_view{"/"};
    }

    std::optional<std::string_view> Uri::query() const {
        if (!_path_and_query || !_path_and_query->query()) return std::nullopt;
        return std::string_view{*_path_and_query->query()};
    }

    std::string Uri::to_string() const {
        std::string out;
        if (!_scheme.empty()) {
            out += _scheme;
            out += "://";
        }
        out += _authority;
        if (_path_and_query) {
            out += _path_and_query->to_string();
        } else if (!_scheme.empty()) {
            out += '/';
        }
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const Uri& uri) {
        return os << uri.to_string();
    }
}
