#include "supervisor.hpp"

#include <chrono>
#include <csignal>
#include <initializer_list>
#include <thread>

#include <glib-unix.h>
#include <boost/asio/connect.hpp>

#include "logger.hpp"

namespace
{
    gboolean quit_loop(gpointer user_data)
    {
        g_main_loop_quit(static_cast<GMainLoop *>(user_data));
        return G_SOURCE_REMOVE;
    }

    void unref_loop(gpointer data)
    {
        g_main_loop_unref(static_cast<GMainLoop *>(data));
    }
}

Supervisor::Supervisor(const AppSettings &settings)
    : settings_(settings)
{
    loop_ = g_main_loop_new(nullptr, FALSE);
    registry_ = std::make_unique<StreamRegistry>(settings_);
    watcher_ = std::make_unique<DirectoryWatcher>(settings_, *registry_);
    api_ = std::make_unique<ControlApi>(*registry_);
}

Supervisor::~Supervisor()
{
    shutdown();
    if (loop_)
    {
        g_main_loop_unref(loop_);
        loop_ = nullptr;
    }
}

bool Supervisor::wait_for_media_server()
{
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::seconds(settings_.media_server_wait_s);
    const std::string port = std::to_string(settings_.rtsp_port);

    LOG_INFO("Waiting for media server at " + settings_.rtsp_host + ":" + port);

    net::io_context ioc;
    tcp::resolver resolver(ioc);

    while (!stop_requested_)
    {
        boost::system::error_code ec;
        auto endpoints = resolver.resolve(settings_.rtsp_host, port, ec);
        if (!ec)
        {
            tcp::socket socket(ioc);
            net::connect(socket, endpoints, ec);
            if (!ec)
            {
                socket.close(ec);
                LOG_INFO("Media server is ready");
                return true;
            }
        }
        LOG_DEBUG("Media server not reachable yet: " + ec.message());

        if (settings_.media_server_wait_s > 0 && clock::now() >= deadline)
            return false;

        // Let a pending SIGINT/SIGTERM source run while the loop is not up yet
        const auto retry_at = clock::now() + std::chrono::seconds(1);
        while (!stop_requested_ && clock::now() < retry_at)
        {
            while (g_main_context_iteration(nullptr, FALSE))
                ;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    return false;
}

int Supervisor::run()
{
    LOG_INFO("Starting stream supervisor, videos in " + settings_.videos_dir);

    // Installed before any relay exists and kept until the last one is
    // stopped; a signal that arrives meanwhile is handled once the loop runs
    sigint_id_ = g_unix_signal_add(SIGINT, on_signal, this);
    sigterm_id_ = g_unix_signal_add(SIGTERM, on_signal, this);

    if (settings_.wait_for_media_server && !wait_for_media_server())
    {
        shutdown();
        if (stop_requested_)
            return 0;
        LOG_CRITICAL("Media server at " + settings_.rtsp_host + ":" +
                     std::to_string(settings_.rtsp_port) + " did not come up");
        return 1;
    }

    try
    {
        watcher_->start();
    }
    catch (const SupervisorError &e)
    {
        LOG_CRITICAL(std::string(error_kind_name(e.kind())) + ": " + e.what());
        shutdown();
        return 1;
    }

    if (settings_.auto_start)
    {
        size_t started = 0;
        for (const auto &result : registry_->start_all())
        {
            if (result.ok())
                ++started;
        }
        LOG_INFO("Initial sync complete: " + std::to_string(started) + " streams started");
    }

    server_ = std::make_unique<HTTPServer>(settings_.api_bind_address,
                                           static_cast<unsigned short>(settings_.api_port),
                                           *api_, settings_.api_threads);
    try
    {
        server_->start();
    }
    catch (const SupervisorError &e)
    {
        LOG_CRITICAL(std::string(error_kind_name(e.kind())) + ": " + e.what());
        server_.reset();
        shutdown();
        return 1;
    }
    api_port_ = server_->port();

    reconcile_id_ = g_timeout_add(static_cast<guint>(settings_.reconcile_interval_ms),
                                  on_reconcile_tick, this);

    serving_ = true;
    if (!stop_requested_)
        g_main_loop_run(loop_);

    LOG_INFO("Shutting down...");
    shutdown();
    LOG_INFO("Shutdown complete");
    return 0;
}

void Supervisor::request_shutdown()
{
    stop_requested_ = true;
    // Idle source, so a quit issued before g_main_loop_run is not lost
    g_idle_add_full(G_PRIORITY_DEFAULT, quit_loop, g_main_loop_ref(loop_), unref_loop);
}

gboolean Supervisor::on_signal(gpointer user_data)
{
    auto *self = static_cast<Supervisor *>(user_data);
    LOG_INFO("Received shutdown signal");
    self->stop_requested_ = true;
    g_main_loop_quit(self->loop_);
    return G_SOURCE_CONTINUE;
}

gboolean Supervisor::on_reconcile_tick(gpointer user_data)
{
    auto *self = static_cast<Supervisor *>(user_data);
    size_t changed = self->registry_->reconcile();
    if (changed > 0)
        LOG_DEBUG("Reconciled " + std::to_string(changed) + " streams");
    return G_SOURCE_CONTINUE;
}

void Supervisor::shutdown()
{
    serving_ = false;

    if (reconcile_id_)
    {
        g_source_remove(reconcile_id_);
        reconcile_id_ = 0;
    }

    if (server_)
        server_->stop();
    if (watcher_)
        watcher_->stop();
    if (registry_)
    {
        for (const auto &result : registry_->stop_all())
        {
            if (!result.ok())
                LOG_WARNING("Stopping " + result.id + " failed: " + result.message);
        }
    }

    // Removing the last source restores the default action, so a repeated
    // signal during the stop grace period above must still land here
    for (guint *id : {&sigint_id_, &sigterm_id_})
    {
        if (*id)
        {
            g_source_remove(*id);
            *id = 0;
        }
    }
}
