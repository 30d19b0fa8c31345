#ifndef CTP_CORE_ENGINE_HPP
#define CTP_CORE_ENGINE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>
#include "../utils/logger.hpp"
#include "../config.hpp"
#include "action.hpp"
#include "rule.hpp"
#include "selector.hpp"
#include "verdict.hpp"

namespace ctp::core {

    /**
     * Pilote du pipeline : pour chaque échange, parcourt le snapshot de règles
     * dans l'ordre de déclaration et applique la PREMIÈRE règle du bon côté qui matche.
     *
     * Le snapshot est immuable ; reload() remplace le pointeur partagé, les
     * échanges déjà en vol gardent celui avec lequel ils ont démarré.
     */
    class Engine {
    public:
        Engine(boost::asio::any_io_executor executor, RuleSnapshot rules)
            : _executor(executor), _applicator(executor), _rules(std::move(rules)) {
            if (!_rules) _rules = std::make_shared<const RuleSet>();
            log::info("Engine initialized with " + std::to_string(_rules->size()) + " rules");
        }

        Engine(const Engine&) = delete;
        Engine& operator=(const Engine&) = delete;

        void reload(RuleSnapshot rules) {
            if (!rules) rules = std::make_shared<const RuleSet>();
            auto count = rules->size();
            {
                std::lock_guard<std::mutex> lock(_rules_mutex);
                _rules = std::move(rules);
            }
            log::info("Rule snapshot swapped (" + std::to_string(count) + " rules)");
        }

        RuleSnapshot snapshot() const {
            std::lock_guard<std::mutex> lock(_rules_mutex);
            return _rules;
        }

        // Index de la première règle Request qui matche, nullopt sinon.
        static std::optional<std::size_t> find_request_rule(const RuleSet& rules,
                                                            uint16_t port,
                                                            const http::HttpRequest& request) {
            for (std::size_t i = 0; i < rules.size(); ++i) {
                const Rule& rule = rules[i];
                if (rule.target != Target::REQUEST) continue;
                if (SelectorMatcher::match_request(port, request, rule.selector)) return i;
            }
            return std::nullopt;
        }

        static std::optional<std::size_t> find_response_rule(const RuleSet& rules,
                                                             uint16_t port,
                                                             const RequestContext& context,
                                                             const http::HttpResponse& response) {
            for (std::size_t i = 0; i < rules.size(); ++i) {
                const Rule& rule = rules[i];
                if (rule.target != Target::RESPONSE) continue;
                if (SelectorMatcher::match_response(port, context, response, rule.selector)) return i;
            }
            return std::nullopt;
        }

        /**
         * Point d'entrée côté requête pour la couche transport.
         * Le contexte pour la réponse doit être capturé (RequestContext::capture)
         * AVANT cet appel, la requête étant cédée ici.
         */
        DelayHandle process_request(uint16_t port,
                                    http::HttpRequest request,
                                    ActionApplicator::RequestHandler handler) {
            uint64_t id = ++_exchange_count;
            bool verbose = is_verbose(id);
            auto rules = snapshot();

            if (verbose) log::exchange(id, port, "request", http::describe(request));

            auto index = find_request_rule(*rules, port, request);
            if (!index) {
                if (verbose) log::debug("No request rule matched -> FORWARD");
                forward(std::move(request), std::move(handler));
                return DelayHandle{};
            }

            log::rule_match(*index, to_string(Target::REQUEST));
            return _applicator.async_apply(std::move(request), (*rules)[*index].actions, std::move(handler));
        }

        DelayHandle process_response(uint16_t port,
                                     const RequestContext& context,
                                     http::HttpResponse response,
                                     ActionApplicator::ResponseHandler handler) {
            // Un échange = une requête : la réponse n'est pas recomptée
            uint64_t id = _exchange_count.load();
            bool verbose = is_verbose(id);
            auto rules = snapshot();

            if (verbose) log::exchange(id, port, "response", http::describe(response));

            auto index = find_response_rule(*rules, port, context, response);
            if (!index) {
                if (verbose) log::debug("No response rule matched -> FORWARD");
                forward(std::move(response), std::move(handler));
                return DelayHandle{};
            }

            log::rule_match(*index, to_string(Target::RESPONSE));
            return _applicator.async_apply(std::move(response), (*rules)[*index].actions, std::move(handler));
        }

        // Nombre de requêtes vues (une par échange)
        uint64_t exchange_count() const { return _exchange_count.load(); }

    private:
        boost::asio::any_io_executor _executor;
        ActionApplicator _applicator;

        mutable std::mutex _rules_mutex;
        RuleSnapshot _rules;

        std::atomic<uint64_t> _exchange_count{0};

        static bool is_verbose(uint64_t id) {
            return config::DEBUG_MODE &&
                   (id <= config::DEBUG_FIRST_N_EXCHANGES || config::DEBUG_FIRST_N_EXCHANGES == 0);
        }

        template <typename Message, typename Handler>
        void forward(Message message, Handler handler) {
            boost::asio::post(_executor, [handler = std::move(handler), message = std::move(message)]() mutable {
                handler(boost::system::error_code{}, Decision<Message>::forward(std::move(message)));
            });
        }
    };
}

#endif // CTP_CORE_ENGINE_HPP
