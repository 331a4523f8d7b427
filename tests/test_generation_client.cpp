// tests/test_generation_client.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "fakes.h"
#include "core/types/errors.h"
#include "protocol/generation_client.h"
#include <stop_token>

using namespace comfyflow;
using namespace comfyflow::testing;
using namespace std::chrono_literals;
using Catch::Approx;
using nlohmann::json;

namespace {

struct ClientFixture {
    std::shared_ptr<FakeClock> clock = std::make_shared<FakeClock>();
    std::shared_ptr<ChannelScript> script = std::make_shared<ChannelScript>();
    json history = json::object();
    std::shared_ptr<FakeHttpTransport> transport;
    std::unique_ptr<GenerationClient> client;

    explicit ClientFixture(std::chrono::milliseconds run_timeout = 300s) {
        transport = std::make_shared<FakeHttpTransport>([this](const RecordedRequest& r) -> HttpResponse {
            if (r.method == "POST" && ends_with(r.url, "/prompt")) {
                return {200, R"({"prompt_id": "p-1", "number": 0, "node_errors": {}})"};
            }
            if (r.method == "GET" && ends_with(r.url, "/history/p-1")) {
                return {200, history.dump()};
            }
            if (r.method == "GET" && r.url.find("/view?") != std::string::npos) {
                return {200, "PNGDATA"};
            }
            throw TransportError("unexpected request " + r.method + " " + r.url, 404);
        });

        GenerationClient::Config config;
        config.base_url = "http://engine:8188/";
        config.api_key = "secret";
        config.event_timeout = 2s;
        config.run_timeout = run_timeout;
        client = std::make_unique<GenerationClient>(config, transport, fake_channel_factory(script, clock),
                                                    FakeClock::bind(clock));
    }
};

const json kGraph = json::parse(R"({
    "3": {"class_type": "KSampler", "inputs": {"seed": 1}},
    "9": {"class_type": "SaveImage", "inputs": {"images": ["8", 0]}}
})");

} // namespace

TEST_CASE("Successful run yields artifacts and timings", "[client][scenario]") {
    ClientFixture f;
    f.history = json::parse(R"({"p-1": {"outputs": {"9": {"images": [{"filename": "out.png", "subfolder": "", "type": "output"}]}}}})");
    f.script->steps.push_back({0ms, EventFrame{true, "preview-bytes"}});
    f.script->push(0ms, executing_frame("someone-else", std::nullopt));
    f.script->push(1000ms, executing_frame("p-1", std::string("3")));
    f.script->push(2500ms, executing_frame("p-1", std::nullopt));

    auto result = f.client->submit_and_track(kGraph);

    REQUIRE(result.artifacts.size() == 1);
    REQUIRE(result.artifacts[0].kind == MediaKind::IMAGE);
    REQUIRE(result.artifacts[0].url == "http://engine:8188/view?filename=out.png&subfolder=&type=output");
    REQUIRE(result.queue_duration_sec == Approx(1.0));
    REQUIRE(result.exec_duration_sec == Approx(2.5));

    REQUIRE(f.script->connected);
    REQUIRE(f.script->closed);
    REQUIRE(f.script->url.rfind("ws://engine:8188/ws?clientId=", 0) == 0);
    REQUIRE(std::find(f.script->headers.begin(), f.script->headers.end(), "Authorization: Bearer secret") != f.script->headers.end());

    auto requests = f.transport->requests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[0].url == "http://engine:8188/prompt");
    REQUIRE(requests[0].has_header("Authorization: Bearer secret"));
    auto payload = json::parse(requests[0].body);
    REQUIRE(payload["prompt"] == kGraph);
    REQUIRE(f.script->url.find(payload["client_id"].get<std::string>()) != std::string::npos);

    REQUIRE(f.client->fetch_artifact_bytes(result.artifacts[0].url) == "PNGDATA");
}

TEST_CASE("Execution error surfaces the engine message", "[client][scenario]") {
    ClientFixture f;
    f.script->push(100ms, executing_frame("p-1", std::string("3")));
    f.script->push(100ms, error_frame("p-1", "OOM"));

    try {
        f.client->submit_and_track(kGraph);
        FAIL("expected ProtocolError");
    } catch (const ProtocolError& e) {
        REQUIRE(std::string(e.what()) == "OOM");
    }
    REQUIRE(f.script->closed);
    // history is never fetched
    REQUIRE(f.transport->requests().size() == 1);
}

TEST_CASE("Silent engine hits the run timeout", "[client][timeout]") {
    ClientFixture f(5s);

    REQUIRE_THROWS_AS(f.client->submit_and_track(kGraph), TimeoutError);
    REQUIRE(f.script->closed);
    REQUIRE(f.clock->now - std::chrono::steady_clock::time_point{} == 5s);
}

TEST_CASE("Stop request cancels the wait", "[client][cancel]") {
    ClientFixture f;
    std::stop_source stop;
    stop.request_stop();

    REQUIRE_THROWS_AS(f.client->submit_and_track(kGraph, stop.get_token()), CanceledError);
    REQUIRE(f.script->closed);
}

TEST_CASE("Channel is closed when connecting fails", "[client]") {
    ClientFixture f;
    f.script->fail_connect = true;

    REQUIRE_THROWS_AS(f.client->submit_and_track(kGraph), TransportError);
    REQUIRE(f.script->closed);
    REQUIRE(f.transport->requests().empty());
}

TEST_CASE("Rejected prompt and missing history are protocol errors", "[client]") {
    auto clock = std::make_shared<FakeClock>();
    auto script = std::make_shared<ChannelScript>();
    bool reject = true;
    auto transport = std::make_shared<FakeHttpTransport>([&](const RecordedRequest& r) -> HttpResponse {
        if (ends_with(r.url, "/prompt")) {
            if (reject) throw TransportError("HTTP 400: {\"error\": \"invalid prompt\"}", 400);
            return {200, R"({"prompt_id": "p-1"})"};
        }
        return {200, "{}"};
    });
    GenerationClient client({"http://engine", "", 2s, 300s, {}}, transport, fake_channel_factory(script, clock),
                            FakeClock::bind(clock));

    REQUIRE_THROWS_AS(client.submit_and_track(kGraph), ProtocolError);
    REQUIRE(script->closed);

    reject = false;
    script->closed = false;
    script->push(0ms, executing_frame("p-1", std::nullopt));
    REQUIRE_THROWS_AS(client.submit_and_track(kGraph), ProtocolError);
    REQUIRE(script->closed);
}

TEST_CASE("Upload sends a multipart body and returns the stored name", "[client][upload]") {
    auto clock = std::make_shared<FakeClock>();
    auto script = std::make_shared<ChannelScript>();
    auto transport = std::make_shared<FakeHttpTransport>([](const RecordedRequest& r) -> HttpResponse {
        if (ends_with(r.url, "/upload/image")) {
            return {200, R"({"name": "in (1).png", "subfolder": "", "type": "input"})"};
        }
        throw TransportError("down");
    });
    GenerationClient client({"http://engine", "k", 2s, 300s, {}}, transport, fake_channel_factory(script, clock));

    REQUIRE(client.upload_input_asset("BYTES", "in.png") == "in (1).png");

    auto req = transport->requests().at(0);
    REQUIRE(req.method == "POST");
    REQUIRE(req.has_header("Authorization: Bearer k"));
    auto ct = std::find_if(req.headers.begin(), req.headers.end(), [](const std::string& h) {
        return h.rfind("Content-Type: multipart/form-data; boundary=", 0) == 0;
    });
    REQUIRE(ct != req.headers.end());
    const std::string boundary = ct->substr(std::string("Content-Type: multipart/form-data; boundary=").size());
    REQUIRE(req.body.find("--" + boundary + "\r\n") == 0);
    REQUIRE(req.body.find("name=\"image\"; filename=\"in.png\"") != std::string::npos);
    REQUIRE(req.body.find("Content-Type: image/png\r\n\r\nBYTES\r\n") != std::string::npos);
    REQUIRE(req.body.find("name=\"type\"\r\n\r\ninput\r\n") != std::string::npos);
    REQUIRE(ends_with(req.body, "--" + boundary + "--\r\n"));
}

TEST_CASE("Upload failures become UploadError and health check never throws", "[client][upload]") {
    auto clock = std::make_shared<FakeClock>();
    auto script = std::make_shared<ChannelScript>();
    auto transport = std::make_shared<FakeHttpTransport>([](const RecordedRequest&) -> HttpResponse {
        throw TransportError("connection reset");
    });
    GenerationClient client({"http://engine", "", 2s, 300s, {}}, transport, fake_channel_factory(script, clock));

    REQUIRE_THROWS_AS(client.upload_input_asset("B", "x.jpg"), UploadError);
    REQUIRE_FALSE(client.health_check());
}

TEST_CASE("Client ids are version 4 UUIDs", "[client]") {
    auto id = make_client_id();
    REQUIRE(id.size() == 36);
    REQUIRE(id[8] == '-');
    REQUIRE(id[14] == '4');
    REQUIRE(std::string("89ab").find(id[19]) != std::string::npos);
    REQUIRE(make_client_id() != id);
}
