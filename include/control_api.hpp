#ifndef CONTROL_API_HPP
#define CONTROL_API_HPP

#include <map>
#include <string>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "stream_registry.hpp"
#include "stream_types.hpp"

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

/**
 * @class ControlApi
 * @brief REST handlers in front of the stream registry
 *
 * Routes:
 *   GET  /                                  control page
 *   GET  /api/streams                       all streams
 *   GET  /api/streams/{id}                  one stream
 *   POST /api/streams/{id}/start?loop=N     start (no-op when running)
 *   POST /api/streams/{id}/stop             stop (no-op when stopped)
 *   POST /api/streams/{id}/restart?loop=N   stop then start
 *   POST /api/streams/start-all
 *   POST /api/streams/stop-all
 *
 * Holds no state of its own and is safe to call from several threads.
 */
class ControlApi
{
public:
    explicit ControlApi(StreamRegistry &registry);

    HttpResponse handle(const HttpRequest &req);

    nlohmann::json record_to_json(const StreamRecord &record) const;
    nlohmann::json result_to_json(const StreamResult &result) const;

    /**
     * @brief Loop count from the query string, a form body or a JSON body,
     * in that order; -1 when none of them carries one
     * @throw SupervisorError (BAD_REQUEST) for a non-integer or a value < -1
     */
    static int parse_loop(const HttpRequest &req,
                          const std::map<std::string, std::string> &query);

    static std::map<std::string, std::string> parse_query(const std::string &query);

private:
    HttpResponse route_post(const HttpRequest &req,
                            const std::string &path,
                            const std::map<std::string, std::string> &query);

    HttpResponse list_streams(const HttpRequest &req);
    HttpResponse get_stream(const HttpRequest &req, const std::string &id);
    HttpResponse stream_action(const HttpRequest &req, const StreamResult &result);
    HttpResponse aggregate_action(const HttpRequest &req, const std::vector<StreamResult> &results);

    HttpResponse json_response(const HttpRequest &req, http::status status,
                               const nlohmann::json &body) const;
    HttpResponse error_response(const HttpRequest &req, ErrorKind kind,
                                const std::string &message,
                                const std::string &id = "") const;
    HttpResponse html_response(const HttpRequest &req, const std::string &html) const;
    HttpResponse options_response(const HttpRequest &req) const;

    static http::status status_for(ErrorKind kind);

    StreamRegistry &registry_;
};

#endif // CONTROL_API_HPP
