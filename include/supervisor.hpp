#pragma once

#include <atomic>
#include <memory>

#include <glib.h>

#include "app_setting.hpp"
#include "control_api.hpp"
#include "directory_watcher.hpp"
#include "http_server.hpp"
#include "stream_registry.hpp"

/**
 * @class Supervisor
 * @brief Wires registry, watcher and control API together and owns the
 * GLib main loop they run on
 *
 * run() blocks until SIGINT, SIGTERM or request_shutdown(), then tears
 * everything down so that no relay outlives the supervisor.
 */
class Supervisor
{
public:
    explicit Supervisor(const AppSettings &settings);
    ~Supervisor();

    Supervisor(const Supervisor &) = delete;
    Supervisor &operator=(const Supervisor &) = delete;

    /** @return process exit code: 0 after a clean shutdown, 1 if startup failed */
    int run();

    /** Safe to call from any thread, also before run() reached its loop */
    void request_shutdown();

    /**
     * @brief Retry a TCP connect to the RTSP port once a second
     * @return false if media_server_wait_s elapsed first
     */
    bool wait_for_media_server();

    StreamRegistry &registry() noexcept { return *registry_; }

    /** Port of the control API once it is listening, 0 before */
    unsigned short api_port() const noexcept { return api_port_; }

    bool serving() const noexcept { return serving_; }

private:
    static gboolean on_signal(gpointer user_data);
    static gboolean on_reconcile_tick(gpointer user_data);

    void shutdown();

    AppSettings settings_;
    GMainLoop *loop_{nullptr};
    guint sigint_id_{0};
    guint sigterm_id_{0};
    guint reconcile_id_{0};

    std::unique_ptr<StreamRegistry> registry_;
    std::unique_ptr<DirectoryWatcher> watcher_;
    std::unique_ptr<ControlApi> api_;
    std::unique_ptr<HTTPServer> server_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> serving_{false};
    std::atomic<unsigned short> api_port_{0};
};
