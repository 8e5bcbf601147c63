#include "http_server.hpp"

#include <algorithm>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logger.hpp"
#include "stream_types.hpp"


namespace beast = boost::beast;

/**
 * One client connection. Reads and writes are asynchronous on the server's
 * io_context; only the call into the control API runs on the pool.
 */
class HTTPServer::Session : public std::enable_shared_from_this<HTTPServer::Session>
{
public:
    Session(HTTPServer &server, tcp::socket socket)
        : server_(server), stream_(std::move(socket))
    {
    }

    void run() { do_read(); }

    void close()
    {
        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        stream_.close();
    }

private:
    void do_read()
    {
        if (!server_.running_)
            return;

        req_ = {};
        stream_.expires_after(server_.idle_timeout_);
        http::async_read(stream_, buffer_, req_,
                         [self = shared_from_this()](beast::error_code ec, std::size_t) {
                             self->on_read(ec);
                         });
    }

    void on_read(beast::error_code ec)
    {
        if (ec == http::error::end_of_stream)
        {
            shutdown_send();
            return;
        }
        if (ec)
        {
            if (ec != beast::error::timeout && ec != net::error::operation_aborted &&
                ec != net::error::connection_reset && ec != net::error::eof)
                LOG_DEBUG("Read failed: " + ec.message());
            return;
        }

        stream_.expires_never();
        auto executor = stream_.get_executor();
        net::post(server_.pool_, [self = shared_from_this(), executor] {
            self->res_ = self->server_.respond(self->req_);
            net::post(executor, [self] { self->do_write(); });
        });
    }

    void do_write()
    {
        if (!server_.running_)
            return;

        stream_.expires_after(server_.idle_timeout_);
        http::async_write(stream_, res_,
                          [self = shared_from_this()](beast::error_code ec, std::size_t) {
                              self->on_write(ec);
                          });
    }

    void on_write(beast::error_code ec)
    {
        if (ec)
        {
            if (ec != net::error::operation_aborted)
                LOG_DEBUG("Write failed: " + ec.message());
            return;
        }
        if (!res_.keep_alive())
        {
            shutdown_send();
            return;
        }
        do_read();
    }

    void shutdown_send()
    {
        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
    }

    HTTPServer &server_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    HttpRequest req_;
    HttpResponse res_;
};

HTTPServer::HTTPServer(const std::string &address, unsigned short port,
                       ControlApi &api, int threads, std::chrono::seconds idle_timeout)
    : address_(address),
      port_(port),
      api_(api),
      idle_timeout_(idle_timeout),
      acceptor_(ioc_),
      pool_(static_cast<std::size_t>(threads > 0 ? threads : 1))
{
}

HTTPServer::~HTTPServer()
{
    stop();
}

void HTTPServer::start()
{
    beast::error_code ec;

    auto const ip = net::ip::make_address(address_, ec);
    if (ec)
        throw SupervisorError(ErrorKind::LISTEN_FAILURE,
                              "invalid listen address " + address_ + ": " + ec.message());

    tcp::endpoint endpoint{ip, port_};

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec)
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec)
        acceptor_.bind(endpoint, ec);
    if (!ec)
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec)
    {
        beast::error_code ignored;
        acceptor_.close(ignored);
        throw SupervisorError(ErrorKind::LISTEN_FAILURE,
                              "cannot listen on " + address_ + ":" + std::to_string(port_) +
                                  ": " + ec.message());
    }

    bound_port_ = acceptor_.local_endpoint().port();
    running_ = true;

    do_accept();
    io_thread_ = std::thread([this] { ioc_.run(); });

    LOG_INFO("Stream Control UI: http://" + address_ + ":" + std::to_string(bound_port_));
}

void HTTPServer::stop()
{
    if (!running_)
        return;
    running_ = false;

    // Once every socket is closed the io_context runs out of work
    net::post(ioc_, [this] {
        beast::error_code ignored;
        acceptor_.close(ignored);
        for (auto &weak : sessions_)
        {
            if (auto session = weak.lock())
                session->close();
        }
        sessions_.clear();
    });
    if (io_thread_.joinable())
        io_thread_.join();
    pool_.join();

    LOG_INFO("Control API stopped");
}

void HTTPServer::do_accept()
{
    acceptor_.async_accept(
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec)
            {
                if (ec != net::error::operation_aborted)
                    LOG_WARNING("Accept failed: " + ec.message());
                if (!acceptor_.is_open())
                    return;
            }
            else if (running_)
            {
                sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                               [](const std::weak_ptr<Session> &s) { return s.expired(); }),
                                sessions_.end());
                auto session = std::make_shared<Session>(*this, std::move(socket));
                sessions_.push_back(session);
                session->run();
            }
            do_accept();
        });
}

HttpResponse HTTPServer::respond(const HttpRequest &req)
{
    try
    {
        return api_.handle(req);
    }
    catch (const std::exception &e)
    {
        LOG_ERROR(std::string("Request ") + std::string(req.target()) + " failed: " + e.what());
        HttpResponse res{http::status::internal_server_error, req.version()};
        res.set(http::field::content_type, "application/json");
        res.body() = R"({"success":false,"error":"Internal error"})";
        res.keep_alive(false);
        res.prepare_payload();
        return res;
    }
}
