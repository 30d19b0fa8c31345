#ifndef CTP_CORE_ACTION_HPP
#define CTP_CORE_ACTION_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include "../http/message.hpp"
#include "rule.hpp"
#include "verdict.hpp"

namespace ctp::core {

    /**
     * Poignée sur le délai en cours d'un échange.
     * cancel() doit être appelé depuis l'executor de l'échange (pas de strand interne).
     * Sans effet si le délai est déjà écoulé ou s'il n'y en a pas.
     */
    class DelayHandle {
    public:
        DelayHandle() = default;
        explicit DelayHandle(std::weak_ptr<boost::asio::steady_timer> timer) : _timer(std::move(timer)) {}

        bool pending() const { return !_timer.expired(); }

        void cancel() {
            if (auto timer = _timer.lock()) {
                timer->cancel();
            }
        }

    private:
        std::weak_ptr<boost::asio::steady_timer> _timer;
    };

    /**
     * Applique un Actions sur une requête ou une réponse, dans l'ordre fixe :
     *   1. abort   -> Verdict::ABORT immédiat, rien d'autre n'est lu
     *   2. append
     *   3. replace
     *   4. delay   -> attente asynchrone, ne bloque que l'échange concerné
     *
     * Toute la mutation est terminée avant le délai : une annulation pendant
     * l'attente ne laisse jamais d'état partiellement muté observable.
     */
    class ActionApplicator {
    public:
        // ec non nul (invalid_uri, operation_aborted) => decision vide, rien à transmettre
        using RequestHandler = std::function<void(boost::system::error_code, Decision<http::HttpRequest>)>;
        using ResponseHandler = std::function<void(boost::system::error_code, Decision<http::HttpResponse>)>;

        explicit ActionApplicator(boost::asio::any_io_executor executor) : _executor(std::move(executor)) {}

        // Étapes 1 à 3, synchrones. Lèvent InvalidUri.
        static Decision<http::HttpRequest> apply_request_action(http::HttpRequest request, const Actions& actions);
        static Decision<http::HttpResponse> apply_response_action(http::HttpResponse response, const Actions& actions);

        // Étapes 1 à 4. Le handler est toujours invoqué via l'executor, jamais en ligne.
        DelayHandle async_apply(http::HttpRequest request, const Actions& actions, RequestHandler handler) const;
        DelayHandle async_apply(http::HttpResponse response, const Actions& actions, ResponseHandler handler) const;

    private:
        template <typename Message, typename Handler>
        DelayHandle complete(Decision<Message> decision,
                             std::optional<std::chrono::nanoseconds> delay,
                             Handler handler) const;

        template <typename Message, typename Handler>
        void fail(boost::system::error_code ec, Handler handler) const;

        boost::asio::any_io_executor _executor;
    };
}

#endif // CTP_CORE_ACTION_HPP
