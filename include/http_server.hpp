#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include "control_api.hpp"

namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @class HTTPServer
 * @brief Listener feeding HTTP requests to the control API
 *
 * All socket I/O runs on a dedicated io_context thread; a parsed request is
 * handed to a small thread pool, so one slow stop request does not hold up
 * the others and idle keep-alive clients occupy no worker. Connections idle
 * for longer than @p idle_timeout are dropped.
 */
class HTTPServer
{
public:
    HTTPServer(const std::string &address, unsigned short port,
               ControlApi &api, int threads,
               std::chrono::seconds idle_timeout = std::chrono::seconds(30));
    ~HTTPServer();

    HTTPServer(const HTTPServer &) = delete;
    HTTPServer &operator=(const HTTPServer &) = delete;

    /**
     * @brief Bind, listen and start accepting
     * @throw SupervisorError (LISTEN_FAILURE) if the address cannot be bound
     */
    void start();

    /** Stop accepting, drop open connections and join the workers */
    void stop();

    /** Port actually bound; differs from the requested one when that was 0 */
    unsigned short port() const noexcept { return bound_port_; }

private:
    class Session;

    void do_accept();
    HttpResponse respond(const HttpRequest &req);

    std::string address_;
    unsigned short port_;
    unsigned short bound_port_{0};
    ControlApi &api_;
    std::chrono::seconds idle_timeout_;

    net::io_context ioc_{1};
    tcp::acceptor acceptor_;
    net::thread_pool pool_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};

    // Touched only on the io_context thread
    std::vector<std::weak_ptr<Session>> sessions_;
};
