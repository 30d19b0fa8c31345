#ifndef CTP_CORE_RULE_HPP
#define CTP_CORE_RULE_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../http/headers.hpp"
#include "../http/uri.hpp"

namespace ctp::core {

    /**
     * Côté de l'échange visé par une règle.
     */
    enum class Target : uint8_t {
        REQUEST,
        RESPONSE
    };

    inline const char* to_string(Target t) {
        return t == Target::REQUEST ? "Request" : "Response";
    }

    /**
     * Prédicat conjonctif. Champ absent = dimension toujours satisfaite,
     * donc un Selector vide matche tout.
     */
    struct Selector {
        std::optional<uint16_t> port;
        std::optional<http::PathAndQuery> path;     // préfixe, seul path() compte
        std::optional<std::string> method;
        std::optional<http::HeaderMap> headers;     // en-têtes de la REQUÊTE
        std::optional<uint16_t> code;               // réponse uniquement
        std::optional<http::HeaderMap> response_headers;
    };

    struct AppendAction {
        std::optional<std::string> queries;         // fragment brut "k=v&..." déjà encodé
        std::optional<http::HeaderMap> headers;     // chaque entrée AJOUTÉE
    };

    struct ReplaceAction {
        std::optional<std::string> path;
        std::optional<std::string> method;
        std::optional<std::string> body;
        std::optional<uint16_t> code;               // réponse uniquement
        std::optional<std::map<std::string, std::string>> queries;
        std::optional<http::HeaderMap> headers;     // chaque entrée ÉCRASE le nom
    };

    /**
     * abort est prioritaire : s'il est vrai, aucun autre champ n'est lu.
     */
    struct Actions {
        bool abort = false;
        std::optional<std::chrono::nanoseconds> delay;
        std::optional<AppendAction> append;
        std::optional<ReplaceAction> replace;
    };

    struct Rule {
        Target target = Target::REQUEST;
        Selector selector;
        Actions actions;
    };

    // Évaluées dans l'ordre de déclaration, first match wins.
    using RuleSet = std::vector<Rule>;

    // Snapshot immuable partagé par tous les échanges en vol.
    using RuleSnapshot = std::shared_ptr<const RuleSet>;
}

#endif // CTP_CORE_RULE_HPP
