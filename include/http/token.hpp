#ifndef CTP_HTTP_TOKEN_HPP
#define CTP_HTTP_TOKEN_HPP

#include <algorithm>
#include <cctype>
#include <string_view>

namespace ctp::http {

    // tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*" / "+" / "-" / "." /
    //         "^" / "_" / "`" / "|" / "~" / DIGIT / ALPHA      (RFC 9110 5.6.2)
    inline bool is_tchar(char c) {
        if (std::isalnum(static_cast<unsigned char>(c))) return true;
        switch (c) {
            case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
            case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
                return true;
            default:
                return false;
        }
    }

    // Méthodes HTTP et noms d'en-tête sont des tokens non vides.
    inline bool is_token(std::string_view s) {
        return !s.empty() && std::all_of(s.begin(), s.end(), is_tchar);
    }
}

#endif // CTP_HTTP_TOKEN_HPP
