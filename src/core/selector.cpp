#include "../../include/core/selector.hpp"

namespace ctp::core {

    bool SelectorMatcher::match_port(uint16_t port, const Selector& selector) {
        return !selector.port || *selector.port == port;
    }

    // Préfixe sur le path seul : la query de la cible n'entre pas en compte
    bool SelectorMatcher::match_path(const http::Uri& uri, const Selector& selector) {
        if (!selector.path) return true;
        return uri.path().starts_with(selector.path->path());
    }

    bool SelectorMatcher::match_method(const std::string& method, const Selector& selector) {
        return !selector.method || *selector.method == method;
    }

    // Existentiel par occurrence : X: a + X: b satisfait {X: b}.
    // Les en-têtes non listés sont ignorés.
    bool SelectorMatcher::match_headers(const http::HeaderMap& actual,
                                        const std::optional<http::HeaderMap>& expected) {
        if (!expected) return true;
        for (const auto& [name, value] : *expected) {
            if (!actual.has_value(name, value)) return false;
        }
        return true;
    }

    bool SelectorMatcher::match_request(uint16_t port, const http::HttpRequest& request, const Selector& selector) {
        return match_port(port, selector)
            && match_path(request.uri, selector)
            && match_method(request.method, selector)
            && match_headers(request.headers, selector.headers);
    }

    bool SelectorMatcher::match_response(uint16_t port,
                                         const http::Uri& uri,
                                         const std::string& method,
                                         const http::HeaderMap& request_headers,
                                         const http::HttpResponse& response,
                                         const Selector& selector) {
        return match_port(port, selector)
            && match_path(uri, selector)
            && match_method(method, selector)
            && (!selector.code || *selector.code == response.status)
            && match_headers(request_headers, selector.headers)
            && match_headers(response.headers, selector.response_headers);
    }
}
