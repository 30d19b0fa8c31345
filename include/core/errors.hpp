#ifndef CTP_CORE_ERRORS_HPP
#define CTP_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <type_traits>
#include <boost/system/error_code.hpp>

namespace ctp {

    /**
     * Une réécriture a produit (ou reçu) une URI non ré-encodable.
     * Problème de configuration ou d'entrée : jamais retenté, jamais ignoré.
     */
    class InvalidUri : public std::runtime_error {
    public:
        explicit InvalidUri(const std::string& what) : std::runtime_error("invalid uri: " + what) {}
    };

    /**
     * Configuration brute impossible à traduire en règles typées.
     */
    class ConfigError : public std::runtime_error {
    public:
        explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * Codes d'erreur remontés par l'API asynchrone (handlers asio).
     * L'abort n'en fait PAS partie : c'est un Verdict, pas une panne.
     */
    enum class errc {
        invalid_uri = 1
    };

    const boost::system::error_category& engine_category() noexcept;

    inline boost::system::error_code make_error_code(errc e) noexcept {
        return {static_cast<int>(e), engine_category()};
    }
}

namespace boost::system {
    template <>
    struct is_error_code_enum<ctp::errc> : std::true_type {};
}

#endif // CTP_CORE_ERRORS_HPP
