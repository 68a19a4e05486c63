#pragma once

#include "deepseek/http_client.hpp"
#include "deepseek/logging.hpp"
#include <boost/asio/ssl/context.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace deepseek {

/**
 * HttpSession over Boost.Beast, with TLS through Asio SSL.
 *
 * Keep-alive connections to the single configured endpoint are pooled and
 * reused between calls; at most pool_size idle connections are retained.
 * A session may be shared by several threads: each send() borrows its own
 * connection for the duration of the exchange.
 */
class BeastSession : public HttpSession {
public:
    BeastSession(Endpoint endpoint,
                 std::shared_ptr<Logger> logger,
                 std::size_t pool_size = 10,
                 std::string user_agent = "deepseek-client/1.0");
    ~BeastSession() override;

    BeastSession(const BeastSession&) = delete;
    BeastSession& operator=(const BeastSession&) = delete;

    HttpResponse send(const HttpRequest& request, std::chrono::seconds timeout) override;

    const Endpoint& endpoint() const { return endpoint_; }
    std::size_t idle_connections() const;

private:
    class Connection;

    std::unique_ptr<Connection> acquire();
    void release(std::unique_ptr<Connection> connection);
    std::unique_ptr<Connection> open_connection(std::chrono::seconds timeout);
    HttpResponse exchange(Connection& connection, const HttpRequest& request, std::chrono::seconds timeout);

    Endpoint endpoint_;
    std::shared_ptr<Logger> logger_;
    std::size_t pool_size_;
    std::string user_agent_;
    std::shared_ptr<boost::asio::ssl::context> ssl_context_;

    mutable std::mutex pool_mutex_;
    std::vector<std::unique_ptr<Connection>> idle_;
};

} // namespace deepseek
