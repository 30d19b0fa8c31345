#include "../../include/core/uri_rewriter.hpp"
#include "../../include/core/errors.hpp"
#include "../../include/http/form_urlencoded.hpp"

#include <algorithm>

namespace ctp::core {

    http::Uri UriRewriter::append_queries(const http::Uri& uri, std::optional<std::string_view> fragment) {
        if (!fragment || fragment->empty()) {
            return uri;
        }

        std::string raw;
        if (const auto& paq = uri.path_and_query()) {
            raw = paq->to_string();
            raw += paq->query() ? '&' : '?';
        } else {
            raw = "/?";
        }
        raw += *fragment;

        return uri.with_path_and_query(http::PathAndQuery::parse(raw));
    }

    http::Uri UriRewriter::replace_path(const http::Uri& uri, std::optional<std::string_view> new_path) {
        if (!new_path) {
            return uri;
        }

        std::string_view path = new_path->empty() ? std::string_view{"/"} : *new_path;
        if (path.find('?') != std::string_view::npos) {
            throw InvalidUri("replacement path carries a query: \"" + std::string(path) + "\"");
        }

        // Rien où ancrer le nouveau path (CONNECT host:443).
        // Une forme absolue sans path a un path implicite "/" : on le remplace.
        const auto& paq = uri.path_and_query();
        if (!paq && uri.scheme().empty()) {
            return uri;
        }

        std::string raw(path);
        if (paq && paq->query()) {
            raw += '?';
            raw += *paq->query();
        }

        return uri.with_path_and_query(http::PathAndQuery::parse(raw));
    }

    http::Uri UriRewriter::replace_queries(const http::Uri& uri,
                                           const std::optional<std::map<std::string, std::string>>& overrides) {
        if (!overrides) {
            return uri;
        }

        // Collapse volontaire des doublons : replace = une valeur canonique par clé
        http::form::Pairs merged = http::form::decode_collapsed(uri.query().value_or(""));

        for (const auto& [key, value] : *overrides) {
            auto it = std::find_if(merged.begin(), merged.end(),
                                   [&](const auto& p) { return p.first == key; });
            if (it == merged.end()) {
                merged.emplace_back(key, value);
            } else {
                it->second = value;
            }
        }

        const auto& paq = uri.path_and_query();
        std::string raw = paq ? paq->path() : std::string("/");
        std::string query = http::form::encode(merged);
        if (!query.empty()) {
            raw += '?';
            raw += query;
        }

        return uri.with_path_and_query(http::PathAndQuery::parse(raw));
    }
}
