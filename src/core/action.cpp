#include "../../include/core/action.hpp"
#include "../../include/core/errors.hpp"
#include "../../include/core/uri_rewriter.hpp"
#include "../../include/utils/logger.hpp"

#include <boost/asio/post.hpp>

namespace ctp::core {

    Decision<http::HttpRequest> ActionApplicator::apply_request_action(http::HttpRequest request,
                                                                      const Actions& actions) {
        if (actions.abort) {
            log::verdict("ABORT", "request");
            return Decision<http::HttpRequest>::abort();
        }

        if (const auto& append = actions.append) {
            request.uri = UriRewriter::append_queries(request.uri, append->queries);
            if (append->headers) {
                for (const auto& [name, value] : *append->headers) {
                    request.headers.append(name, value);
                }
            }
        }

        if (const auto& replace = actions.replace) {
            // path AVANT queries : replace_queries se rattache au path courant
            request.uri = UriRewriter::replace_path(request.uri, replace->path);

            if (replace->method) request.method = *replace->method;
            if (replace->body) request.body = *replace->body;

            request.uri = UriRewriter::replace_queries(request.uri, replace->queries);

            if (replace->headers) {
                for (const auto& [name, value] : *replace->headers) {
                    request.headers.set_all(name, value);
                }
            }
        }

        if constexpr (config::DEBUG_MODE) {
            log::debug("action applied: " + http::describe(request));
        }
        return Decision<http::HttpRequest>::forward(std::move(request));
    }

    Decision<http::HttpResponse> ActionApplicator::apply_response_action(http::HttpResponse response,
                                                                        const Actions& actions) {
        if (actions.abort) {
            log::verdict("ABORT", "response");
            return Decision<http::HttpResponse>::abort();
        }

        // Pas de notion de path/query sur une réponse : en-têtes uniquement
        if (actions.append && actions.append->headers) {
            for (const auto& [name, value] : *actions.append->headers) {
                response.headers.append(name, value);
            }
        }

        if (const auto& replace = actions.replace) {
            if (replace->code) response.status = *replace->code;
            if (replace->body) response.body = *replace->body;
            if (replace->headers) {
                for (const auto& [name, value] : *replace->headers) {
                    response.headers.set_all(name, value);
                }
            }
        }

        if constexpr (config::DEBUG_MODE) {
            log::debug("action applied: " + http::describe(response));
        }
        return Decision<http::HttpResponse>::forward(std::move(response));
    }

    template <typename Message, typename Handler>
    DelayHandle ActionApplicator::complete(Decision<Message> decision,
                                           std::optional<std::chrono::nanoseconds> delay,
                                           Handler handler) const {
        // abort court-circuite aussi le délai
        if (decision.aborted() || !delay || delay->count() <= 0) {
            boost::asio::post(_executor, [handler = std::move(handler), decision = std::move(decision)]() mutable {
                handler(boost::system::error_code{}, std::move(decision));
            });
            return DelayHandle{};
        }

        auto timer = std::make_shared<boost::asio::steady_timer>(_executor, *delay);
        timer->async_wait([timer, handler = std::move(handler), decision = std::move(decision)](
                              const boost::system::error_code& ec) mutable {
            if (ec) {
                // Échange abandonné pendant l'attente : le message muté est simplement jeté
                handler(ec, Decision<Message>::abort());
                return;
            }
            handler(ec, std::move(decision));
        });
        return DelayHandle{timer};
    }

    template <typename Message, typename Handler>
    void ActionApplicator::fail(boost::system::error_code ec, Handler handler) const {
        boost::asio::post(_executor, [handler = std::move(handler), ec]() mutable {
            handler(ec, Decision<Message>::abort());
        });
    }

    DelayHandle ActionApplicator::async_apply(http::HttpRequest request,
                                              const Actions& actions,
                                              RequestHandler handler) const {
        try {
            auto decision = apply_request_action(std::move(request), actions);
            return complete(std::move(decision), actions.delay, std::move(handler));
        } catch (const InvalidUri& e) {
            log::error(std::string("Request rewrite failed: ") + e.what());
            fail<http::HttpRequest>(make_error_code(errc::invalid_uri), std::move(handler));
            return DelayHandle{};
        }
    }

    DelayHandle ActionApplicator::async_apply(http::HttpResponse response,
                                              const Actions& actions,
                                              ResponseHandler handler) const {
        // Pas de réécriture d'URI côté réponse : rien ne peut lever ici
        auto decision = apply_response_action(std::move(response), actions);
        return complete(std::move(decision), actions.delay, std::move(handler));
    }
}
