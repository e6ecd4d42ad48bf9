#include <catch2/catch_test_macros.hpp>
#include "delivery/DeliveryRouter.hpp"
#include "TestHelpers.hpp"

using namespace coderun::delivery;
using coderun::testing::TempDir;
using json = nlohmann::json;

namespace {

// Strategy that fails for file names containing "bad"
class FlakyStrategy : public DeliveryStrategy {
public:
    std::string name() const override { return "flaky"; }

    std::string deliver(const FileMessage& message) override {
        if (message.name.find("bad") != std::string::npos) {
            throw DeliveryError("upload rejected");
        }
        if (message.name.find("crash") != std::string::npos) {
            throw std::runtime_error("socket closed");
        }
        delivered.push_back(message.name);
        return "ok";
    }

    std::vector<std::string> delivered;
};

} // namespace

// =============================================================================
// Targets
// =============================================================================

TEST_CASE("DeliveryTarget parses private and group targets", "[Delivery]") {
    auto priv = DeliveryTarget::parse("private:1001");
    REQUIRE(priv.scope == DeliveryScope::Private);
    REQUIRE(priv.recipientId == "1001");
    REQUIRE(priv.toString() == "private:1001");

    auto group = DeliveryTarget::parse("group:77");
    REQUIRE(group.scope == DeliveryScope::Group);
    REQUIRE(group.toString() == "group:77");

    REQUIRE_THROWS_AS(DeliveryTarget::parse("channel:1"), std::invalid_argument);
    REQUIRE_THROWS_AS(DeliveryTarget::parse("private:"), std::invalid_argument);
    REQUIRE_THROWS_AS(DeliveryTarget::parse("1001"), std::invalid_argument);
}

TEST_CASE("Image files are recognised by extension", "[Delivery]") {
    REQUIRE(isImageFile("/out/plot.PNG"));
    REQUIRE(isImageFile("photo.jpeg"));
    REQUIRE(isImageFile("anim.gif"));
    REQUIRE_FALSE(isImageFile("data.csv"));
    REQUIRE_FALSE(isImageFile("png"));
}

// =============================================================================
// Router
// =============================================================================

TEST_CASE("A failing file does not stop the others", "[DeliveryRouter]") {
    TempDir dir;
    auto good = dir.write("good.txt", "g");
    auto bad = dir.write("bad.txt", "b");
    auto crash = dir.write("crash.txt", "c");
    auto last = dir.write("last.png", "p");

    auto strategy = std::make_unique<FlakyStrategy>();
    auto* flaky = strategy.get();
    DeliveryRouter router(std::move(strategy));

    auto reports = router.deliverAll(
        {good.string(), bad.string(), (dir.path() / "missing.txt").string(), crash.string(), last.string()},
        DeliveryTarget::parse("private:1"));

    REQUIRE(reports.size() == 5);
    REQUIRE(reports[0].delivered);
    REQUIRE_FALSE(reports[1].delivered);
    REQUIRE(reports[1].detail == "upload rejected");
    REQUIRE_FALSE(reports[2].delivered);
    REQUIRE(reports[2].detail == "file does not exist");
    REQUIRE_FALSE(reports[3].delivered);
    REQUIRE(reports[3].detail.find("socket closed") != std::string::npos);
    REQUIRE(reports[4].delivered);
    REQUIRE(reports[4].strategy == "flaky");

    REQUIRE(flaky->delivered == std::vector<std::string>{"good.txt", "last.png"});
}

TEST_CASE("Router requires a strategy", "[DeliveryRouter]") {
    REQUIRE_THROWS_AS(DeliveryRouter(nullptr), std::invalid_argument);
}

// =============================================================================
// Native strategy
// =============================================================================

TEST_CASE("Native delivery hands the file to the sink", "[DeliveryRouter][native]") {
    TempDir dir;
    auto plot = dir.write("plot.png", "p");
    auto data = dir.write("data.csv", "d");

    std::vector<FileMessage> sent;
    DeliveryRouter router(std::make_unique<NativeDelivery>([&](const FileMessage& m) { sent.push_back(m); }));

    auto reports = router.deliverAll({plot.string(), data.string()}, DeliveryTarget::parse("group:9"));

    REQUIRE(sent.size() == 2);
    REQUIRE(sent[0].isImage);
    REQUIRE(sent[0].name == "plot.png");
    REQUIRE(sent[0].target.toString() == "group:9");
    REQUIRE_FALSE(sent[1].isImage);
    REQUIRE(reports[0].detail == "sent as image");
    REQUIRE(reports[1].detail == "sent as file");
}

// =============================================================================
// Local route strategy
// =============================================================================

TEST_CASE("Local route delivery builds a /files URL", "[DeliveryRouter][local-route]") {
    TempDir outputs;
    auto plot = outputs.write("run_1/my plot.png", "p");

    std::vector<FileMessage> sent;
    LocalRouteDelivery strategy(outputs.path(), "example.host", 10000,
                                [&](const FileMessage& m) { sent.push_back(m); });

    REQUIRE(strategy.urlFor(plot.string()) == "http://example.host:10000/files/run_1/my%20plot.png");

    DeliveryRouter router(std::make_unique<LocalRouteDelivery>(
        outputs.path(), "example.host", 10000, [&](const FileMessage& m) { sent.push_back(m); }));
    auto report = router.deliver(plot.string(), DeliveryTarget::parse("private:3"));

    REQUIRE(report.delivered);
    REQUIRE(report.detail == "http://example.host:10000/files/run_1/my%20plot.png");
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].url == report.detail);
}

TEST_CASE("Local route refuses files outside the output directory", "[DeliveryRouter][local-route]") {
    TempDir outputs;
    TempDir other;
    auto outside = other.write("secret.txt", "s");

    bool called = false;
    DeliveryRouter router(std::make_unique<LocalRouteDelivery>(
        outputs.path(), "localhost", 10000, [&](const FileMessage&) { called = true; }));
    auto report = router.deliver(outside.string(), DeliveryTarget::parse("private:3"));

    REQUIRE_FALSE(report.delivered);
    REQUIRE_FALSE(called);
    REQUIRE(report.detail.find("outside the output directory") != std::string::npos);
}

TEST_CASE("isWithinDirectory compares whole components", "[DeliveryRouter][local-route]") {
    REQUIRE(isWithinDirectory("/srv/out/a.png", "/srv/out"));
    REQUIRE(isWithinDirectory("/srv/out/sub/a.png", "/srv/out/"));
    REQUIRE_FALSE(isWithinDirectory("/srv/out2/a.png", "/srv/out"));
    REQUIRE_FALSE(isWithinDirectory("/srv/out/../etc/passwd", "/srv/out"));
    REQUIRE_FALSE(isWithinDirectory("/srv/out", "/srv/out"));
}

// =============================================================================
// Remote API strategy
// =============================================================================

TEST_CASE("Remote API posts to the endpoint for the target scope", "[DeliveryRouter][remote-api]") {
    TempDir dir;
    auto file = dir.write("result.csv", "r");

    std::vector<HttpPostRequest> requests;
    HttpPoster poster = [&](const HttpPostRequest& request) {
        requests.push_back(request);
        return HttpReply{200, R"({"status":"ok","retcode":0})"};
    };
    DeliveryRouter router(std::make_unique<RemoteApiDelivery>("bot.local", 5700, "secret", poster));

    auto groupReport = router.deliver(file.string(), DeliveryTarget::parse("group:55"));
    auto privateReport = router.deliver(file.string(), DeliveryTarget::parse("private:66"));

    REQUIRE(groupReport.delivered);
    REQUIRE(groupReport.detail == "uploaded via /upload_group_file");
    REQUIRE(privateReport.detail == "uploaded via /upload_private_file");

    REQUIRE(requests.size() == 2);
    REQUIRE(requests[0].host == "bot.local");
    REQUIRE(requests[0].port == 5700);
    REQUIRE(requests[0].headers.at("Authorization") == "Bearer secret");
    auto groupBody = json::parse(requests[0].body);
    REQUIRE(groupBody["group_id"] == "55");
    REQUIRE(groupBody["name"] == "result.csv");
    REQUIRE(groupBody["file"] == file.string());
    auto privateBody = json::parse(requests[1].body);
    REQUIRE(privateBody["user_id"] == "66");
    REQUIRE_FALSE(privateBody.contains("group_id"));
}

TEST_CASE("Remote API failures are reported per file", "[DeliveryRouter][remote-api]") {
    TempDir dir;
    auto file = dir.write("x.txt", "x");
    auto target = DeliveryTarget::parse("private:1");

    SECTION("HTTP error status") {
        DeliveryRouter router(std::make_unique<RemoteApiDelivery>("h", 1, "", [](const HttpPostRequest&) {
            return HttpReply{500, "oops"};
        }));
        auto report = router.deliver(file.string(), target);
        REQUIRE_FALSE(report.delivered);
        REQUIRE(report.detail.find("HTTP 500") != std::string::npos);
    }

    SECTION("failed status in the reply") {
        DeliveryRouter router(std::make_unique<RemoteApiDelivery>("h", 1, "", [](const HttpPostRequest&) {
            return HttpReply{200, R"({"status":"failed","retcode":100})"};
        }));
        REQUIRE_FALSE(router.deliver(file.string(), target).delivered);
    }

    SECTION("non-zero retcode") {
        DeliveryRouter router(std::make_unique<RemoteApiDelivery>("h", 1, "", [](const HttpPostRequest&) {
            return HttpReply{200, R"({"retcode":1})"};
        }));
        REQUIRE_FALSE(router.deliver(file.string(), target).delivered);
    }

    SECTION("no token, no Authorization header") {
        bool sawHeader = true;
        DeliveryRouter router(std::make_unique<RemoteApiDelivery>("h", 1, "", [&](const HttpPostRequest& r) {
            sawHeader = r.headers.count("Authorization") > 0;
            return HttpReply{200, "done"};
        }));
        REQUIRE(router.deliver(file.string(), target).delivered);
        REQUIRE_FALSE(sawHeader);
    }
}

TEST_CASE("postJson reports an unreachable host as DeliveryError", "[DeliveryRouter][remote-api]") {
    HttpPostRequest request;
    request.host = "127.0.0.1";
    request.port = 1;
    request.target = "/upload_private_file";
    request.body = "{}";
    request.timeout = std::chrono::seconds(5);

    REQUIRE_THROWS_AS(postJson(request), DeliveryError);
}

// =============================================================================
// Factory
// =============================================================================

TEST_CASE("makeStrategy selects by mode", "[DeliveryRouter]") {
    DeliverySettings settings;
    auto sink = [](const FileMessage&) {};

    settings.mode = "native";
    REQUIRE(makeStrategy(settings, sink)->name() == "native");
    settings.mode = "local-route";
    REQUIRE(makeStrategy(settings, sink)->name() == "local-route");
    settings.mode = "remote-api";
    REQUIRE(makeStrategy(settings, sink)->name() == "remote-api");
    settings.mode = "carrier-pigeon";
    REQUIRE_THROWS_AS(makeStrategy(settings, sink), std::invalid_argument);
}
