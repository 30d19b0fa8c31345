#include "../../include/http/message.hpp"

#include <algorithm>
#include <sstream>

namespace ctp::http {

    namespace {
        constexpr size_t MAX_LOGGED_BODY = 64;

        void write_headers(std::ostream& os, const HeaderMap& headers) {
            os << " headers={";
            bool first = true;
            for (const auto& [name, value] : headers) {
                if (!first) os << ", ";
                os << name << ": " << value;
                first = false;
            }
            os << "}";
        }

        // Affiche les caractères imprimables, '.' sinon (comme payload_ascii)
        void write_body(std::ostream& os, const std::string& body) {
            os << " body=" << body.size() << "B";
            if (body.empty()) return;
            os << " \"";
            size_t n = std::min(body.size(), MAX_LOGGED_BODY);
            for (size_t i = 0; i < n; ++i) {
                char c = body[i];
                os << ((c >= 32 && c < 127) ? c : '.');
            }
            os << "\"";
            if (body.size() > MAX_LOGGED_BODY) os << " ...";
        }
    }

    std::ostream& operator<<(std::ostream& os, const HttpRequest& request) {
        os << request.method << " " << request.uri;
        write_headers(os, request.headers);
        write_body(os, request.body);
        return os;
    }

    std::ostream& operator<<(std::ostream& os, const HttpResponse& response) {
        os << response.status;
        write_headers(os, response.headers);
        write_body(os, response.body);
        return os;
    }

    std::string describe(const HttpRequest& request) {
        std::ostringstream oss;
        oss << request;
        return oss.str();
    }

    std::string describe(const HttpResponse& response) {
        std::ostringstream oss;
        oss << response;
        return oss.str();
    }
}
