#ifndef CTP_HTTP_MESSAGE_HPP
#define CTP_HTTP_MESSAGE_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include "headers.hpp"
#include "uri.hpp"

namespace ctp::http {

    /**
     * Requête déjà décodée par la couche transport.
     * Possédée par un seul échange : passée par valeur (move) au moteur.
     */
    struct HttpRequest {
        std::string method = "GET";
        Uri uri = Uri::parse("/");
        HeaderMap headers;
        std::string body; // octets bruts, pas forcément du texte
    };

    struct HttpResponse {
        uint16_t status = 200;
        HeaderMap headers;
        std::string body;
    };

    // Résumé lisible pour les logs (corps tronqué)
    std::string describe(const HttpRequest& request);
    std::string describe(const HttpResponse& response);

    std::ostream& operator<<(std::ostream& os, const HttpRequest& request);
    std::ostream& operator<<(std::ostream& os, const HttpResponse& response);
}

#endif // CTP_HTTP_MESSAGE_HPP
