#include "deepseek/beast_session.hpp"
#include "deepseek/error.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <cstdint>
#include <string>

namespace deepseek {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

constexpr std::uint64_t kMaxBodyBytes = 64ull * 1024 * 1024;

TransportError make_error(TransportFailure kind, const std::string& what, const Endpoint& endpoint,
                          const beast::error_code& ec) {
    return TransportError(kind, what + " " + endpoint.host_header() + ": " + ec.message(), 0,
                          endpoint.scheme + "://" + endpoint.host_header(),
                          ec == beast::error::timeout);
}

bool is_stale_connection_error(const beast::error_code& ec) {
    return ec == http::error::end_of_stream ||
           ec == asio::error::eof ||
           ec == asio::error::connection_reset ||
           ec == asio::error::broken_pipe ||
           ec == asio::ssl::error::stream_truncated;
}

} // namespace

class BeastSession::Connection {
public:
    asio::io_context ioc;
    std::unique_ptr<beast::tcp_stream> plain;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls;
    beast::flat_buffer buffer;
    bool keep_alive = true;
    bool stale = false;

    ~Connection() {
        if (plain || tls) {
            beast::error_code ec;
            tcp().socket().shutdown(tcp::socket::shutdown_both, ec);
            tcp().close();
        }
    }

    beast::tcp_stream& tcp() {
        return tls ? beast::get_lowest_layer(*tls) : *plain;
    }

    // Runs one asynchronous operation to completion on this connection's
    // io_context so that the stream's expiry acts as a timeout.
    template<typename Operation>
    beast::error_code run(Operation&& operation) {
        beast::error_code result = asio::error::would_block;
        operation([&result](beast::error_code ec, auto&&...) { result = ec; });
        ioc.restart();
        ioc.run();
        return result;
    }
};

BeastSession::BeastSession(Endpoint endpoint,
                           std::shared_ptr<Logger> logger,
                           std::size_t pool_size,
                           std::string user_agent)
    : endpoint_(std::move(endpoint)),
      logger_(std::move(logger)),
      pool_size_(pool_size),
      user_agent_(std::move(user_agent)) {
    if (endpoint_.use_ssl()) {
        ssl_context_ = std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
        ssl_context_->set_default_verify_paths();
        ssl_context_->set_verify_mode(asio::ssl::verify_peer);
    }
}

BeastSession::~BeastSession() = default;

std::size_t BeastSession::idle_connections() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return idle_.size();
}

std::unique_ptr<BeastSession::Connection> BeastSession::acquire() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (idle_.empty()) {
        return nullptr;
    }
    auto connection = std::move(idle_.back());
    idle_.pop_back();
    return connection;
}

void BeastSession::release(std::unique_ptr<Connection> connection) {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (idle_.size() < pool_size_) {
        idle_.push_back(std::move(connection));
    }
}

std::unique_ptr<BeastSession::Connection> BeastSession::open_connection(std::chrono::seconds timeout) {
    auto connection = std::make_unique<Connection>();

    beast::error_code ec;
    tcp::resolver resolver(connection->ioc);
    auto const results = resolver.resolve(endpoint_.host, std::to_string(endpoint_.port), ec);
    if (ec) {
        throw make_error(TransportFailure::CONNECT, "Failed to resolve", endpoint_, ec);
    }

    if (endpoint_.use_ssl()) {
        connection->tls = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(connection->ioc, *ssl_context_);
        if (!SSL_set_tlsext_host_name(connection->tls->native_handle(), endpoint_.host.c_str())) {
            throw TransportError(TransportFailure::CONNECT, "Failed to set TLS server name for " + endpoint_.host);
        }
        connection->tls->set_verify_callback(asio::ssl::host_name_verification(endpoint_.host));
    } else {
        connection->plain = std::make_unique<beast::tcp_stream>(connection->ioc);
    }

    auto& stream = connection->tcp();
    stream.expires_after(timeout);
    ec = connection->run([&](auto handler) { stream.async_connect(results, std::move(handler)); });
    if (ec) {
        throw make_error(TransportFailure::CONNECT, "Failed to connect to", endpoint_, ec);
    }

    if (connection->tls) {
        stream.expires_after(timeout);
        ec = connection->run([&](auto handler) {
            connection->tls->async_handshake(asio::ssl::stream_base::client, std::move(handler));
        });
        if (ec) {
            throw make_error(TransportFailure::CONNECT, "TLS handshake failed with", endpoint_, ec);
        }
    }

    logger_->debug("Opened connection to " + endpoint_.host_header());
    return connection;
}

HttpResponse BeastSession::exchange(Connection& connection, const HttpRequest& request,
                                    std::chrono::seconds timeout) {
    auto verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw InvalidArgumentError("Unsupported HTTP method: " + request.method);
    }

    http::request<http::string_body> req{verb, request.target, 11};
    req.set(http::field::host, endpoint_.host_header());
    req.set(http::field::user_agent, user_agent_);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.keep_alive(true);
    req.prepare_payload();

    connection.stale = false;
    auto& stream = connection.tcp();

    stream.expires_after(timeout);
    beast::error_code ec = connection.run([&](auto handler) {
        if (connection.tls) {
            http::async_write(*connection.tls, req, std::move(handler));
        } else {
            http::async_write(*connection.plain, req, std::move(handler));
        }
    });
    if (ec) {
        connection.keep_alive = false;
        connection.stale = ec != beast::error::timeout;
        throw make_error(TransportFailure::READ, "Failed to send request to", endpoint_, ec);
    }

    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxBodyBytes);

    stream.expires_after(timeout);
    ec = connection.run([&](auto handler) {
        if (connection.tls) {
            http::async_read(*connection.tls, connection.buffer, parser, std::move(handler));
        } else {
            http::async_read(*connection.plain, connection.buffer, parser, std::move(handler));
        }
    });
    if (ec) {
        connection.keep_alive = false;
        connection.stale = !parser.got_some() && is_stale_connection_error(ec);
        throw make_error(TransportFailure::READ, "Failed to read response from", endpoint_, ec);
    }
    stream.expires_never();

    auto res = parser.release();
    HttpResponse response;
    response.status = static_cast<int>(res.result_int());
    for (const auto& field : res) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    response.body = std::move(res.body());
    connection.keep_alive = res.keep_alive();
    return response;
}

HttpResponse BeastSession::send(const HttpRequest& request, std::chrono::seconds timeout) {
    auto connection = acquire();
    const bool reused = connection != nullptr;
    if (!connection) {
        connection = open_connection(timeout);
    }

    HttpResponse response;
    try {
        response = exchange(*connection, request, timeout);
    } catch (const TransportError&) {
        if (!reused || !connection->stale) {
            throw;
        }
        // The server closed the pooled connection while it sat idle.
        logger_->debug("Pooled connection to " + endpoint_.host_header() + " went stale, reconnecting");
        connection = open_connection(timeout);
        response = exchange(*connection, request, timeout);
    }

    if (connection->keep_alive) {
        release(std::move(connection));
    }
    return response;
}

} // namespace deepseek
