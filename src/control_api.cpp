#include "control_api.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>


#include "logger.hpp"

using json = nlohmann::json;

namespace
{
    constexpr const char *SERVER_NAME = "stream-supervisor";

    const char *CONTROL_PAGE = R"HTML(<!DOCTYPE html>
<html>
<head>
<title>Stream Control</title>
<meta name="viewport" content="width=device-width, initial-scale=1">
<style>
  body { font-family: sans-serif; max-width: 800px; margin: 0 auto; padding: 20px; background: #1a1a2e; color: #eee; }
  h1 { color: #00d4ff; }
  .stream { background: #16213e; border-radius: 8px; padding: 12px; margin: 10px 0; display: flex; flex-wrap: wrap; gap: 10px; align-items: center; }
  .name { font-weight: bold; flex: 1; min-width: 150px; }
  .running { color: #00c853; } .stopped { color: #ff5252; }
  .url { font-size: 0.8em; color: #888; width: 100%; }
  .error { font-size: 0.8em; color: #ff9800; width: 100%; }
</style>
</head>
<body>
<h1>Stream Control</h1>
<button onclick="post('/api/streams/stop-all')">Stop All</button>
<button onclick="post('/api/streams/start-all')">Start All</button>
<div id="streams"></div>
<script>
const loops = [[-1, 'Loop: Infinite'], [0, 'Play: 1x'], [1, 'Play: 2x'], [2, 'Play: 3x'], [4, 'Play: 5x'], [9, 'Play: 10x']];
async function load() {
  const box = document.getElementById('streams');
  try {
    const streams = await (await fetch('/api/streams')).json();
    if (!streams.length) { box.innerHTML = '<p>No streams found</p>'; return; }
    box.innerHTML = streams.map(s => `
      <div class="stream">
        <span class="name">${s.id}</span>
        <span class="${s.status}">${s.status}</span>
        <select id="loop-${s.id}">${loops.map(([v, t]) => `<option value="${v}" ${s.loop_count === v ? 'selected' : ''}>${t}</option>`).join('')}</select>
        <button onclick="start('${s.id}')" ${s.running ? 'disabled' : ''}>Start</button>
        <button onclick="post('/api/streams/${s.id}/stop')" ${s.running ? '' : 'disabled'}>Stop</button>
        <div class="url">${s.rtsp_url}</div>
        ${s.last_error ? `<div class="error">${s.last_error}</div>` : ''}
      </div>`).join('');
  } catch (err) {
    box.innerHTML = '<p class="stopped">Error loading streams: ' + err.message + '</p>';
  }
}
function start(id) { post('/api/streams/' + id + '/start?loop=' + document.getElementById('loop-' + id).value); }
async function post(url) { await fetch(url, {method: 'POST'}); load(); }
load();
setInterval(load, 5000);
</script>
</body>
</html>
)HTML";

    std::vector<std::string> split_path(const std::string &path)
    {
        std::vector<std::string> parts;
        std::stringstream ss(path);
        std::string part;
        while (std::getline(ss, part, '/'))
        {
            if (!part.empty())
                parts.push_back(part);
        }
        return parts;
    }

    std::string url_decode(const std::string &text)
    {
        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i)
        {
            if (text[i] == '+')
            {
                out.push_back(' ');
            }
            else if (text[i] == '%' && i + 2 < text.size() &&
                     std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                     std::isxdigit(static_cast<unsigned char>(text[i + 2])))
            {
                out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
                i += 2;
            }
            else
            {
                out.push_back(text[i]);
            }
        }
        return out;
    }

    int to_loop_count(const std::string &text)
    {
        try
        {
            size_t used = 0;
            int value = std::stoi(text, &used);
            if (used == text.size() && value >= -1)
                return value;
        }
        catch (const std::exception &)
        {
        }
        throw SupervisorError(ErrorKind::BAD_REQUEST,
                              "loop must be an integer >= -1, got '" + text + "'");
    }

    std::string format_time(std::chrono::system_clock::time_point tp)
    {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm utc{};
        gmtime_r(&t, &utc);

        std::ostringstream ss;
        ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }
}

ControlApi::ControlApi(StreamRegistry &registry)
    : registry_(registry)
{
}

std::map<std::string, std::string> ControlApi::parse_query(const std::string &query)
{
    std::map<std::string, std::string> params;
    std::stringstream ss(query);
    std::string pair;
    while (std::getline(ss, pair, '&'))
    {
        if (pair.empty())
            continue;
        size_t eq = pair.find('=');
        if (eq == std::string::npos)
            params[url_decode(pair)] = "";
        else
            params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
    }
    return params;
}

int ControlApi::parse_loop(const HttpRequest &req,
                           const std::map<std::string, std::string> &query)
{
    auto it = query.find("loop");
    if (it != query.end())
        return to_loop_count(it->second);

    if (req.body().empty())
        return -1;

    const std::string content_type(req[http::field::content_type]);

    if (content_type.find("application/x-www-form-urlencoded") != std::string::npos)
    {
        auto form = parse_query(req.body());
        auto field = form.find("loop");
        return field == form.end() ? -1 : to_loop_count(field->second);
    }

    if (content_type.find("application/json") != std::string::npos)
    {
        json body = json::parse(req.body(), nullptr, false);
        if (body.is_discarded() || !body.is_object())
            throw SupervisorError(ErrorKind::BAD_REQUEST, "request body is not a JSON object");
        if (!body.contains("loop"))
            return -1;
        const json &loop = body["loop"];
        if (!loop.is_number_integer())
            throw SupervisorError(ErrorKind::BAD_REQUEST, "loop must be an integer");
        // Unsigned values above LLONG_MAX would wrap through long long
        if (loop.is_number_unsigned())
            return to_loop_count(std::to_string(loop.get<unsigned long long>()));
        return to_loop_count(std::to_string(loop.get<long long>()));
    }

    return -1;
}

json ControlApi::record_to_json(const StreamRecord &record) const
{
    const bool running = record.status == StreamStatus::RUNNING;

    json j = {
        {"id", record.id},
        {"name", record.id},
        {"status", stream_status_name(record.status)},
        {"running", running},
        {"loop_count", record.loop_count},
        {"video_path", record.source_path},
        {"rtsp_url", registry_.settings().rtsp_public_url(record.id)},
        {"pid", record.pid},
        {"last_error", record.last_error}};

    if (record.started_at.time_since_epoch().count() != 0)
        j["started_at"] = format_time(record.started_at);
    else
        j["started_at"] = nullptr;
    return j;
}

json ControlApi::result_to_json(const StreamResult &result) const
{
    json j = {{"id", result.id}, {"success", result.ok()}};
    if (result.error != ErrorKind::NOT_FOUND)
    {
        j["status"] = stream_status_name(result.record.status);
        j["loop_count"] = result.record.loop_count;
    }
    if (!result.ok())
    {
        j["error"] = error_kind_name(result.error);
        j["message"] = result.message;
    }
    return j;
}

http::status ControlApi::status_for(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::NONE:             return http::status::ok;
    case ErrorKind::NOT_FOUND:        return http::status::not_found;
    case ErrorKind::BAD_REQUEST:      return http::status::bad_request;
    case ErrorKind::NAMING_COLLISION: return http::status::conflict;
    default:                          return http::status::internal_server_error;
    }
}

HttpResponse ControlApi::json_response(const HttpRequest &req, http::status status,
                                       const json &body) const
{
    HttpResponse res{status, req.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

HttpResponse ControlApi::error_response(const HttpRequest &req, ErrorKind kind,
                                        const std::string &message,
                                        const std::string &id) const
{
    json body = {{"success", false}, {"error", error_kind_name(kind)}, {"message", message}};
    if (!id.empty())
        body["id"] = id;
    return json_response(req, status_for(kind), body);
}

HttpResponse ControlApi::html_response(const HttpRequest &req, const std::string &html) const
{
    HttpResponse res{http::status::ok, req.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, "text/html");
    res.keep_alive(req.keep_alive());
    res.body() = html;
    res.prepare_payload();
    return res;
}

HttpResponse ControlApi::options_response(const HttpRequest &req) const
{
    HttpResponse res{http::status::ok, req.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

HttpResponse ControlApi::handle(const HttpRequest &req)
{
    const std::string target(req.target());
    const size_t qmark = target.find('?');
    const std::string path = target.substr(0, qmark);
    const auto query = parse_query(qmark == std::string::npos ? "" : target.substr(qmark + 1));

    LOG_DEBUG(std::string(req.method_string()) + " " + target);

    try
    {
        switch (req.method())
        {
        case http::verb::options:
            return options_response(req);

        case http::verb::get:
        {
            if (path == "/" || path == "/index.html")
                return html_response(req, CONTROL_PAGE);

            auto parts = split_path(path);
            if (parts.size() == 2 && parts[0] == "api" && parts[1] == "streams")
                return list_streams(req);
            if (parts.size() == 3 && parts[0] == "api" && parts[1] == "streams")
                return get_stream(req, parts[2]);
            break;
        }

        case http::verb::post:
            return route_post(req, path, query);

        default:
            return json_response(req, http::status::method_not_allowed,
                                 {{"success", false}, {"error", "Method not allowed"}});
        }
    }
    catch (const SupervisorError &e)
    {
        return error_response(req, e.kind(), e.what());
    }

    return json_response(req, http::status::not_found, {{"error", "Not found"}});
}

HttpResponse ControlApi::route_post(const HttpRequest &req,
                                    const std::string &path,
                                    const std::map<std::string, std::string> &query)
{
    auto parts = split_path(path);
    if (parts.size() < 3 || parts[0] != "api" || parts[1] != "streams")
        return json_response(req, http::status::not_found, {{"error", "Not found"}});

    const std::string &id = parts[2];

    if (parts.size() == 3 && id == "start-all")
        return aggregate_action(req, registry_.start_all());
    if (parts.size() == 3 && id == "stop-all")
        return aggregate_action(req, registry_.stop_all());

    if (parts.size() != 4)
        return json_response(req, http::status::bad_request, {{"error", "Unknown action"}});

    const std::string &action = parts[3];

    if (action == "start")
    {
        int loop_count = parse_loop(req, query);
        LOG_INFO("API: start " + id + " (loop " + std::to_string(loop_count) + ")");
        return stream_action(req, registry_.start(id, loop_count));
    }
    if (action == "stop")
    {
        LOG_INFO("API: stop " + id);
        return stream_action(req, registry_.stop(id));
    }
    if (action == "restart")
    {
        int loop_count = parse_loop(req, query);
        LOG_INFO("API: restart " + id + " (loop " + std::to_string(loop_count) + ")");
        return stream_action(req, registry_.restart(id, loop_count));
    }

    return json_response(req, http::status::bad_request, {{"error", "Unknown action"}});
}

HttpResponse ControlApi::list_streams(const HttpRequest &req)
{
    json streams = json::array();
    for (const auto &record : registry_.list())
        streams.push_back(record_to_json(record));
    return json_response(req, http::status::ok, streams);
}

HttpResponse ControlApi::get_stream(const HttpRequest &req, const std::string &id)
{
    StreamResult result = registry_.get(id);
    if (!result.ok())
        return error_response(req, result.error, result.message, id);
    return json_response(req, http::status::ok, record_to_json(result.record));
}

HttpResponse ControlApi::stream_action(const HttpRequest &req, const StreamResult &result)
{
    if (result.error == ErrorKind::NOT_FOUND)
        return error_response(req, result.error, result.message, result.id);

    json body = {{"success", result.ok()}, {"stream", record_to_json(result.record)}};
    if (!result.ok())
    {
        body["error"] = error_kind_name(result.error);
        body["message"] = result.message;
        body["id"] = result.id;
    }
    return json_response(req, status_for(result.error), body);
}

HttpResponse ControlApi::aggregate_action(const HttpRequest &req, const std::vector<StreamResult> &results)
{
    bool all_ok = true;
    json items = json::array();
    for (const auto &result : results)
    {
        all_ok = all_ok && result.ok();
        items.push_back(result_to_json(result));
    }
    return json_response(req, http::status::ok, {{"success", all_ok}, {"results", items}});
}
