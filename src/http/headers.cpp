#include "../../include/http/headers.hpp"
#include "../../include/http/token.hpp"

#include <algorithm>
#include <boost/algorithm/string/case_conv.hpp>

namespace ctp::http {

    namespace {
        std::string normalize(std::string_view name) {
            return boost::algorithm::to_lower_copy(std::string(name));
        }
    }

    HeaderMap::HeaderMap(std::initializer_list<std::pair<std::string_view, std::string_view>> fields) {
        _fields.reserve(fields.size());
        for (const auto& [name, value] : fields) {
            append(name, value);
        }
    }

    void HeaderMap::append(std::string_view name, std::string_view value) {
        _fields.emplace_back(normalize(name), std::string(value));
    }

    void HeaderMap::set_all(std::string_view name, std::string_view value) {
        std::string key = normalize(name);

        // La première occurrence garde sa position, les suivantes disparaissent
        auto first = std::find_if(_fields.begin(), _fields.end(),
                                  [&](const Field& f) { return f.first == key; });
        if (first == _fields.end()) {
            _fields.emplace_back(std::move(key), std::string(value));
            return;
        }

        first->second = std::string(value);
        auto tail = std::remove_if(std::next(first), _fields.end(),
                                   [&](const Field& f) { return f.first == key; });
        _fields.erase(tail, _fields.end());
    }

    std::size_t HeaderMap::erase(std::string_view name) {
        std::string key = normalize(name);
        auto before = _fields.size();
        _fields.erase(std::remove_if(_fields.begin(), _fields.end(),
                                     [&](const Field& f) { return f.first == key; }),
                      _fields.end());
        return before - _fields.size();
    }

    std::vector<std::string_view> HeaderMap::get_all(std::string_view name) const {
        std::string key = normalize(name);
        std::vector<std::string_view> values;
        for (const auto& [n, v] : _fields) {
            if (n == key) values.emplace_back(v);
        }
        return values;
    }

    bool HeaderMap::has_value(std::string_view name, std::string_view value) const {
        std::string key = normalize(name);
        return std::any_of(_fields.begin(), _fields.end(),
                           [&](const Field& f) { return f.first == key && f.second == value; });
    }

    bool HeaderMap::contains(std::string_view name) const {
        std::string key = normalize(name);
        return std::any_of(_fields.begin(), _fields.end(),
                           [&](const Field& f) { return f.first == key; });
    }

    bool is_valid_header_name(std::string_view name) {
        return is_token(name);
    }

    bool is_valid_header_value(std::string_view value) {
        // field-vchar / SP / HTAB, obs-text toléré ; pas de CR/LF/NUL
        return std::all_of(value.begin(), value.end(), [](char c) {
            auto u = static_cast<unsigned char>(c);
            return u == '\t' || (u >= 0x20 && u != 0x7F);
        });
    }
}
