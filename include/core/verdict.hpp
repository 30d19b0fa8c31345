#ifndef CTP_VERDICT_HPP
#define CTP_VERDICT_HPP

#include <cstdint>
#include <optional>
#include <utility>

namespace ctp {

    /**
     * Décision finale rendue par le moteur pour un échange donné.
     * La couche transport choisit la réponse HTTP à produire sur ABORT.
     */
    enum class Verdict : uint8_t {
        FORWARD = 0, // Message (éventuellement muté) à transmettre
        ABORT   = 1  // La règle demande l'arrêt de l'échange
    };

    inline const char* to_string(Verdict v) {
        return v == Verdict::ABORT ? "ABORT" : "FORWARD";
    }

    /**
     * Résultat d'application d'actions sur une requête ou une réponse.
     * Sur ABORT, message est vide : rien ne doit être transmis.
     */
    template <typename Message>
    struct Decision {
        Verdict verdict = Verdict::FORWARD;
        std::optional<Message> message;

        static Decision forward(Message msg) {
            return Decision{Verdict::FORWARD, std::move(msg)};
        }

        static Decision abort() {
            return Decision{Verdict::ABORT, std::nullopt};
        }

        bool aborted() const { return verdict == Verdict::ABORT; }
    };
}

#endif //CTP_VERDICT_HPP
