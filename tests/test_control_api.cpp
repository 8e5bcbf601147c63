#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "control_api.hpp"
#include "stream_registry.hpp"
#include "test_util.hpp"

using json = nlohmann::json;
using test_util::TempDir;

namespace
{
    class ControlApiTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            settings_ = test_util::make_settings(dir_.path());
            settings_.public_host = "media-box";
            registry_ = std::make_unique<StreamRegistry>(settings_);
            api_ = std::make_unique<ControlApi>(*registry_);

            for (const char *name : {"sailboat.mp4", "Ocean View.mov"})
            {
                std::string path = dir_.file(name);
                test_util::write_file(path);
                registry_->upsert(path);
            }
        }

        void TearDown() override
        {
            api_.reset();
            registry_.reset();
        }

        HttpResponse call(http::verb method, const std::string &target,
                          const std::string &body = "", const std::string &content_type = "")
        {
            HttpRequest req{method, target, 11};
            req.set(http::field::host, "localhost");
            if (!content_type.empty())
                req.set(http::field::content_type, content_type);
            req.body() = body;
            req.prepare_payload();
            return api_->handle(req);
        }

        static json body_of(const HttpResponse &res)
        {
            return json::parse(res.body());
        }

        TempDir dir_;
        AppSettings settings_;
        std::unique_ptr<StreamRegistry> registry_;
        std::unique_ptr<ControlApi> api_;
    };
}

TEST_F(ControlApiTest, ListsStreamsOrderedById)
{
    HttpResponse res = call(http::verb::get, "/api/streams");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");
    EXPECT_EQ(res[http::field::access_control_allow_origin], "*");

    json streams = body_of(res);
    ASSERT_TRUE(streams.is_array());
    ASSERT_EQ(streams.size(), 2u);
    EXPECT_EQ(streams[0]["id"], "ocean_view");
    EXPECT_EQ(streams[1]["id"], "sailboat");

    const json &sailboat = streams[1];
    EXPECT_EQ(sailboat["status"], "stopped");
    EXPECT_EQ(sailboat["running"], false);
    EXPECT_EQ(sailboat["loop_count"], -1);
    EXPECT_EQ(sailboat["rtsp_url"], "rtsp://media-box:8554/sailboat");
    EXPECT_EQ(sailboat["video_path"], dir_.file("sailboat.mp4"));
    EXPECT_TRUE(sailboat["started_at"].is_null());
}

TEST_F(ControlApiTest, GetsSingleStream)
{
    HttpResponse res = call(http::verb::get, "/api/streams/sailboat");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(body_of(res)["id"], "sailboat");
}

TEST_F(ControlApiTest, UnknownStreamIsNotFound)
{
    HttpResponse res = call(http::verb::get, "/api/streams/ghost");
    EXPECT_EQ(res.result(), http::status::not_found);
    json body = body_of(res);
    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["error"], "NotFound");
    EXPECT_EQ(body["id"], "ghost");

    res = call(http::verb::post, "/api/streams/ghost/start");
    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(body_of(res)["error"], "NotFound");

    res = call(http::verb::post, "/api/streams/ghost/stop");
    EXPECT_EQ(res.result(), http::status::not_found);
}

TEST_F(ControlApiTest, StartTakesLoopFromQuery)
{
    HttpResponse res = call(http::verb::post, "/api/streams/sailboat/start?loop=2");
    ASSERT_EQ(res.result(), http::status::ok);

    json body = body_of(res);
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["stream"]["status"], "running");
    EXPECT_EQ(body["stream"]["running"], true);
    EXPECT_EQ(body["stream"]["loop_count"], 2);
    EXPECT_GT(body["stream"]["pid"].get<int>(), 0);
    EXPECT_TRUE(body["stream"]["started_at"].is_string());
}

TEST_F(ControlApiTest, StartOnRunningStreamIsNoOp)
{
    json first = body_of(call(http::verb::post, "/api/streams/sailboat/start"));
    json second = body_of(call(http::verb::post, "/api/streams/sailboat/start?loop=0"));

    EXPECT_EQ(second["success"], true);
    EXPECT_EQ(second["stream"]["pid"], first["stream"]["pid"]);
    EXPECT_EQ(second["stream"]["loop_count"], -1);
}

TEST_F(ControlApiTest, StartTakesLoopFromFormAndJsonBodies)
{
    json form = body_of(call(http::verb::post, "/api/streams/sailboat/start", "loop=3",
                             "application/x-www-form-urlencoded"));
    EXPECT_EQ(form["stream"]["loop_count"], 3);

    json js = body_of(call(http::verb::post, "/api/streams/ocean_view/start", R"({"loop": 0})",
                           "application/json"));
    EXPECT_EQ(js["stream"]["loop_count"], 0);
}

TEST_F(ControlApiTest, InvalidLoopIsBadRequest)
{
    for (const char *target : {"/api/streams/sailboat/start?loop=abc",
                               "/api/streams/sailboat/start?loop=-2",
                               "/api/streams/sailboat/start?loop=1.5"})
    {
        HttpResponse res = call(http::verb::post, target);
        EXPECT_EQ(res.result(), http::status::bad_request) << target;
        EXPECT_EQ(body_of(res)["error"], "BadRequest") << target;
    }

    HttpResponse res = call(http::verb::post, "/api/streams/sailboat/start", R"({"loop": "x"})",
                            "application/json");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(registry_->get("sailboat").record.status, StreamStatus::STOPPED);
}

TEST_F(ControlApiTest, OversizedJsonLoopIsBadRequest)
{
    for (const char *body : {R"({"loop": 18446744073709551615})",
                             R"({"loop": 2147483648})",
                             R"({"loop": -9223372036854775808})"})
    {
        HttpResponse res = call(http::verb::post, "/api/streams/sailboat/start", body,
                                "application/json");
        EXPECT_EQ(res.result(), http::status::bad_request) << body;
        EXPECT_EQ(body_of(res)["error"], "BadRequest") << body;
    }
    EXPECT_EQ(registry_->get("sailboat").record.status, StreamStatus::STOPPED);

    HttpResponse res = call(http::verb::post, "/api/streams/sailboat/start",
                            R"({"loop": 2147483647})", "application/json");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(body_of(res)["stream"]["loop_count"], 2147483647);
}

TEST_F(ControlApiTest, StopReturnsStoppedRecord)
{
    call(http::verb::post, "/api/streams/sailboat/start");
    HttpResponse res = call(http::verb::post, "/api/streams/sailboat/stop");

    ASSERT_EQ(res.result(), http::status::ok);
    json body = body_of(res);
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["stream"]["status"], "stopped");
    EXPECT_EQ(body["stream"]["pid"], 0);

    res = call(http::verb::post, "/api/streams/sailboat/stop");
    EXPECT_EQ(res.result(), http::status::ok);
}

TEST_F(ControlApiTest, RestartReplacesRelay)
{
    json first = body_of(call(http::verb::post, "/api/streams/sailboat/start"));
    json restarted = body_of(call(http::verb::post, "/api/streams/sailboat/restart?loop=4"));

    EXPECT_EQ(restarted["success"], true);
    EXPECT_EQ(restarted["stream"]["loop_count"], 4);
    EXPECT_NE(restarted["stream"]["pid"], first["stream"]["pid"]);
}

TEST_F(ControlApiTest, SpawnFailureIsServerError)
{
    AppSettings broken = settings_;
    broken.relay_command = {"/nonexistent/relay-binary"};
    StreamRegistry registry(broken);
    registry.upsert(dir_.file("sailboat.mp4"));
    ControlApi api(registry);

    HttpRequest req{http::verb::post, "/api/streams/sailboat/start", 11};
    HttpResponse res = api.handle(req);

    EXPECT_EQ(res.result(), http::status::internal_server_error);
    json body = json::parse(res.body());
    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["error"], "ProcessSpawnFailure");
    EXPECT_EQ(body["id"], "sailboat");
    EXPECT_EQ(body["stream"]["status"], "stopped");
}

TEST_F(ControlApiTest, AggregateActionsReportEveryStream)
{
    json started = body_of(call(http::verb::post, "/api/streams/start-all"));
    EXPECT_EQ(started["success"], true);
    ASSERT_EQ(started["results"].size(), 2u);
    for (const auto &item : started["results"])
    {
        EXPECT_EQ(item["success"], true);
        EXPECT_EQ(item["status"], "running");
    }

    json stopped = body_of(call(http::verb::post, "/api/streams/stop-all"));
    EXPECT_EQ(stopped["success"], true);
    for (const auto &item : stopped["results"])
        EXPECT_EQ(item["status"], "stopped");
}

TEST_F(ControlApiTest, UnknownRoutesAndMethods)
{
    HttpResponse res = call(http::verb::get, "/api/nothing");
    EXPECT_EQ(res.result(), http::status::not_found);

    res = call(http::verb::post, "/api/streams/sailboat/jump");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(body_of(res)["error"], "Unknown action");

    res = call(http::verb::delete_, "/api/streams/sailboat");
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
}

TEST_F(ControlApiTest, ServesControlPage)
{
    HttpResponse res = call(http::verb::get, "/");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "text/html");
    EXPECT_NE(res.body().find("Stream Control"), std::string::npos);
}

TEST_F(ControlApiTest, AnswersCorsPreflight)
{
    HttpResponse res = call(http::verb::options, "/api/streams/sailboat/start");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
    EXPECT_NE(std::string(res[http::field::access_control_allow_methods]).find("POST"),
              std::string::npos);
}

TEST(ControlApiParsing, QueryStringIsUrlDecoded)
{
    auto params = ControlApi::parse_query("loop=2&name=Ocean%20View&flag&x=a+b");
    EXPECT_EQ(params["loop"], "2");
    EXPECT_EQ(params["name"], "Ocean View");
    EXPECT_EQ(params["flag"], "");
    EXPECT_EQ(params["x"], "a b");
}

TEST(ControlApiParsing, LoopDefaultsToInfinite)
{
    HttpRequest req{http::verb::post, "/api/streams/a/start", 11};
    EXPECT_EQ(ControlApi::parse_loop(req, {}), -1);
    EXPECT_EQ(ControlApi::parse_loop(req, {{"loop", "-1"}}), -1);
    EXPECT_EQ(ControlApi::parse_loop(req, {{"loop", "9"}}), 9);
}
