#ifndef CTP_CORE_SELECTOR_HPP
#define CTP_CORE_SELECTOR_HPP

#include <cstdint>
#include <string>
#include "../http/headers.hpp"
#include "../http/message.hpp"
#include "../http/uri.hpp"
#include "rule.hpp"

namespace ctp::core {

    /**
     * État de la requête d'origine, capturé AVANT toute action côté requête.
     * Copie indépendante : une règle Request qui réécrit les en-têtes
     * ne change pas ce que voit une règle Response.
     */
    struct RequestContext {
        http::Uri uri;
        std::string method;
        http::HeaderMap headers;

        static RequestContext capture(const http::HttpRequest& request) {
            return RequestContext{request.uri, request.method, request.headers};
        }
    };

    /**
     * Prédicats purs, totaux, sans effet de bord.
     * Chaque champ présent du Selector est une condition ; absent = vrai.
     */
    class SelectorMatcher {
    public:
        static bool match_request(uint16_t port, const http::HttpRequest& request, const Selector& selector);

        static bool match_response(uint16_t port,
                                   const http::Uri& uri,
                                   const std::string& method,
                                   const http::HeaderMap& request_headers,
                                   const http::HttpResponse& response,
                                   const Selector& selector);

        static bool match_response(uint16_t port,
                                   const RequestContext& context,
                                   const http::HttpResponse& response,
                                   const Selector& selector) {
            return match_response(port, context.uri, context.method, context.headers, response, selector);
        }

    private:
        static bool match_port(uint16_t port, const Selector& selector);
        static bool match_path(const http::Uri& uri, const Selector& selector);
        static bool match_method(const std::string& method, const Selector& selector);
        static bool match_headers(const http::HeaderMap& actual, const std::optional<http::HeaderMap>& expected);
    };
}

#endif // CTP_CORE_SELECTOR_HPP
