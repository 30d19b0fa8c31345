#include "../../include/http/form_urlencoded.hpp"
#include "../../include/core/errors.hpp"

#include <algorithm>
#include <cctype>

namespace ctp::http::form {

    namespace {
        int hex_value(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        std::string decode_component(std::string_view raw) {
            std::string out;
            out.reserve(raw.size());
            for (size_t i = 0; i < raw.size(); ++i) {
                char c = raw[i];
                if (c == '+') {
                    out += ' ';
                } else if (c == '%') {
                    if (i + 2 >= raw.size()) {
                        throw InvalidUri("truncated percent escape in query: \"" + std::string(raw) + "\"");
                    }
                    int hi = hex_value(raw[i + 1]);
                    int lo = hex_value(raw[i + 2]);
                    if (hi < 0 || lo < 0) {
                        throw InvalidUri("malformed percent escape in query: \"" + std::string(raw) + "\"");
                    }
                    out += static_cast<char>((hi << 4) | lo);
                    i += 2;
                } else {
                    out += c;
                }
            }
            return out;
        }

        bool is_unreserved(char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '*' || c == '-' || c == '.' || c == '_';
        }
    }

    Pairs decode(std::string_view query) {
        Pairs pairs;
        while (!query.empty()) {
            size_t amp = query.find('&');
            std::string_view segment = query.substr(0, amp);
            query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);

            if (segment.empty()) continue;

            size_t eq = segment.find('=');
            if (eq == std::string_view::npos) {
                pairs.emplace_back(decode_component(segment), std::string());
            } else {
                pairs.emplace_back(decode_component(segment.substr(0, eq)),
                                   decode_component(segment.substr(eq + 1)));
            }
        }
        return pairs;
    }

    Pairs decode_collapsed(std::string_view query) {
        Pairs collapsed;
        for (auto& [key, value] : decode(query)) {
            auto it = std::find_if(collapsed.begin(), collapsed.end(),
                                   [&](const auto& p) { return p.first == key; });
            if (it == collapsed.end()) {
                collapsed.emplace_back(std::move(key), std::move(value));
            } else {
                it->second = std::move(value);
            }
        }
        return collapsed;
    }

    std::string encode_component(std::string_view raw) {
        static constexpr char HEX[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(raw.size());
        for (char c : raw) {
            if (is_unreserved(c)) {
                out += c;
            } else if (c == ' ') {
                out += '+';
            } else {
                auto u = static_cast<unsigned char>(c);
                out += '%';
                out += HEX[u >> 4];
                out += HEX[u & 0x0F];
            }
        }
        return out;
    }

    std::string encode(const Pairs& pairs) {
        std::string out;
        for (const auto& [key, value] : pairs) {
            if (!out.empty()) out += '&';
            out += encode_component(key);
            out += '=';
            out += encode_component(value);
        }
        return out;
    }
}
