#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "TestUtils.hpp"
#include "core/server/HttpFrontend.hpp"

using namespace homestream;
using namespace homestream::core;
using namespace homestream::core::server;
using homestream::test::TempDir;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

/**
 * Every file is a compatible MPEG-2 program stream
 */
class CompatibleInspector : public MediaInspector {
public:
    std::optional<MediaInfo> inspect(const std::string&) override {
        MediaInfo info;
        info.container = "mpeg";
        info.videoCodec = "mpeg2video";
        info.width = 1280;
        info.height = 720;
        info.aspectRatio = 16.0 / 9.0;
        info.videoBitrate = 6000000;
        info.audioCodec = "ac3";
        info.audioBitrate = 192000;
        return info;
    }
};

class HttpFrontendTest : public ::testing::Test {
protected:
    void SetUp() override {
        root.write("Videos/clip.mpg", std::string(4096, 'v'));
        recording = root.write("Incoming/show.ts", test::makeTransportStream(100));

        MediaServerConfig serverConfig;
        serverConfig.name = "Den";
        serverConfig.shares.push_back(Share{"Videos", (root.path() / "Videos").string()});
        mediaServer = std::make_unique<MediaServer>(serverConfig, std::make_shared<CompatibleInspector>());

        downloader::DownloadManagerConfig managerConfig;
        managerConfig.retryDelay = 1ms;
        downloads = std::make_unique<downloader::DownloadManager>(managerConfig);

        HttpFrontendConfig config;
        config.address = "127.0.0.1";
        config.port = 0;
        config.threads = 2;
        config.destination = (root.path() / "Pulled").string();
        config.receiverNames["6520001234567890"] = "Living Room";
        frontend = std::make_unique<HttpFrontend>(config, *mediaServer, *downloads);
    }

    void TearDown() override {
        frontend->stop();
        downloads->shutdown();
    }

    httplib::Response command(const std::string& name,
                              std::initializer_list<std::pair<std::string, std::string>> params = {},
                              const std::string& body = "") {
        httplib::Request req;
        req.method = body.empty() ? "GET" : "POST";
        req.path = "/TiVoConnect";
        req.params.emplace("Command", name);
        for (const auto& [key, value] : params) {
            req.params.emplace(key, value);
        }
        req.headers.emplace("tsn", "6520001234567890");
        req.body = body;

        httplib::Response res;
        frontend->handleCommand(req, res);
        return res;
    }

    json pullRequest() const {
        return {
            {"recording", {
                {"id", "show-1"},
                {"title", "Show"},
                {"episodeTitle", "Pilot"},
                {"season", 1},
                {"episode", 1},
                {"dateRecorded", "2021-02-22"},
                {"source", {{"type", "local"}, {"path", recording.string()}}}
            }},
            {"errorMode", "all"}
        };
    }

    TempDir root;
    fs::path recording;
    std::unique_ptr<MediaServer> mediaServer;
    std::unique_ptr<downloader::DownloadManager> downloads;
    std::unique_ptr<HttpFrontend> frontend;
};

} // namespace

TEST_F(HttpFrontendTest, QueryServerAndFormats) {
    auto server = command("QueryServer");
    EXPECT_EQ(server.status, 200);
    EXPECT_NE(server.body.find("<InternalName>Den</InternalName>"), std::string::npos);
    EXPECT_EQ(server.get_header_value("Content-Type"), "text/xml");

    auto formats = command("QueryFormats", {{"SourceFormat", "video/x-tivo-mpeg"}});
    EXPECT_EQ(formats.status, 200);
    EXPECT_NE(formats.body.find("<TiVoFormats>"), std::string::npos);

    EXPECT_EQ(command("QueryFormats", {{"SourceFormat", "audio/mpeg"}}).status, 400);
}

TEST_F(HttpFrontendTest, QueryContainer) {
    auto shares = command("QueryContainer", {{"Container", "/"}});
    EXPECT_EQ(shares.status, 200);
    EXPECT_NE(shares.body.find("<Title>Videos</Title>"), std::string::npos);

    auto videos = command("QueryContainer", {{"Container", "Videos"}, {"ItemStart", "0"}, {"ItemCount", "8"}});
    EXPECT_EQ(videos.status, 200);
    EXPECT_NE(videos.body.find("<Title>clip</Title>"), std::string::npos);

    EXPECT_EQ(command("QueryContainer", {{"Container", "Nope"}}).status, 404);
}

TEST_F(HttpFrontendTest, UnsupportedCommand) {
    auto res = command("ResetTheWorld");
    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(res.body, "Unsupported Command");
    EXPECT_EQ(command("FlushServer").status, 200);
}

TEST_F(HttpFrontendTest, TransferCountStartsAtZero) {
    auto res = command("GetActiveTransferCount");
    EXPECT_EQ(json::parse(res.body)["count"], 0);
    EXPECT_TRUE(json::parse(command("GetTransferStatus").body).empty());
}

TEST_F(HttpFrontendTest, ToGoQueuesAPull) {
    auto res = command("ToGo", {}, pullRequest().dump());
    ASSERT_EQ(res.status, 202) << res.body;
    std::string id = json::parse(res.body)["id"];

    ASSERT_TRUE(downloads->waitFor(id, 10s));
    auto status = json::parse(command("ToGoStatus", {{"Id", id}}).body);
    EXPECT_EQ(status["state"], "complete") << status.dump();
    EXPECT_EQ(status["finalPath"], (root.path() / "Pulled" / "Show - s01e01 - Pilot (2021-02-22,).ts").string());
    // All mode keeps a report of the successful attempt too
    EXPECT_EQ(status["reports"].size(), 1u);

    auto list = json::parse(command("ToGoList").body);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0]["id"], id);

    EXPECT_FALSE(json::parse(command("ToGoStop", {{"Id", id}}).body)["cancelled"].get<bool>());
}

TEST_F(HttpFrontendTest, ToGoRejectsBadRequests) {
    EXPECT_EQ(command("ToGo", {}, "not json").status, 400);
    EXPECT_EQ(command("ToGo", {}, R"({"destination": "/tmp"})").status, 400);

    json bad = pullRequest();
    bad["errorMode"] = "sometimes";
    EXPECT_EQ(command("ToGo", {}, bad.dump()).status, 400);

    json badTs = pullRequest();
    badTs["tsErrorMode"] = "salvage";
    EXPECT_EQ(command("ToGo", {}, badTs.dump()).status, 400);

    EXPECT_EQ(command("ToGoStatus", {{"Id", "dl_missing"}}).status, 404);
    EXPECT_TRUE(downloads->list().empty());
}

TEST_F(HttpFrontendTest, ServesFilesOverTheWire) {
    ASSERT_TRUE(frontend->start());
    ASSERT_GT(frontend->port(), 0);

    httplib::Client client("127.0.0.1", frontend->port());
    client.set_read_timeout(10, 0);

    auto server = client.Get("/TiVoConnect?Command=QueryServer");
    ASSERT_TRUE(server);
    EXPECT_EQ(server->status, 200);

    httplib::Headers headers{{"tsn", "6520001234567890"}};
    auto file = client.Get("/Videos/clip.mpg", headers);
    ASSERT_TRUE(file);
    EXPECT_EQ(file->status, 200);
    EXPECT_EQ(file->body.size(), 4096u);

    auto missing = client.Get("/Videos/none.mpg");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);

    auto status = json::parse(client.Get("/TiVoConnect?Command=GetTransferStatus")->body);
    EXPECT_TRUE(status.contains("Living Room"));
}

TEST_F(HttpFrontendTest, TransferStatusSurvivesNonUtf8FileNames) {
    root.write("Videos/Caf\xE9.mpg", std::string(2048, 'v'));

    ServeRequest request;
    request.container = "Videos";
    request.path = "Caf\xE9.mpg";
    request.tsn = "6520001234567890";
    request.device = "Living Room";
    auto plan = mediaServer->prepare(request);
    auto result = mediaServer->stream(plan, [](const char*, size_t) { return true; });
    ASSERT_TRUE(result.success()) << result.error;

    auto res = command("GetTransferStatus");
    EXPECT_EQ(res.status, 200);
    auto status = json::parse(res.body);
    ASSERT_TRUE(status.contains("Living Room"));
    EXPECT_EQ(status["Living Room"].size(), 1u);
}

TEST_F(HttpFrontendTest, TvBusQueryDescribesAFile) {
    root.write("Videos/clip.mpg.txt", "title: Clip Show\nepisodeTitle: Part One\ncallsign: KQED\n");

    auto res = command("TVBusQuery", {{"Container", "Videos"}, {"File", "clip.mpg"}});
    ASSERT_EQ(res.status, 200);
    EXPECT_EQ(res.get_header_value("Content-Type"), "text/xml");
    EXPECT_NE(res.body.find("TvBusMarshalledStruct:TvBusEnvelope"), std::string::npos);
    EXPECT_NE(res.body.find("<title>Clip Show</title>"), std::string::npos);
    EXPECT_NE(res.body.find("<episodeTitle>Part One</episodeTitle>"), std::string::npos);
    EXPECT_NE(res.body.find("<callsign>KQED</callsign>"), std::string::npos);

    EXPECT_EQ(command("TVBusQuery", {{"Container", "Videos"}, {"File", "none.mpg"}}).status, 404);
    EXPECT_EQ(command("TVBusQuery", {{"Container", "Nope"}, {"File", "clip.mpg"}}).status, 404);
}

TEST_F(HttpFrontendTest, UnqueueCommands) {
    std::atomic<bool> blocking{false};
    std::atomic<bool> release{false};
    downloads->setSourceFactory([&](const downloader::DownloadTask& task) {
        auto source = std::make_unique<test::MemorySource>(test::makeTransportStream(4));
        if (task.recording.id == "blocker") {
            source->onPump = [&]() {
                blocking = true;
                while (!release) std::this_thread::sleep_for(1ms);
            };
        }
        return source;
    });

    Recording blocker;
    blocker.id = "blocker";
    blocker.title = "First";
    Recording waiting = blocker;
    waiting.id = "waiting";
    waiting.title = "Second";
    std::string dest = (root.path() / "Pulled").string();

    auto first = downloads->enqueue(blocker, dest, NamingConfig{}, downloader::ErrorMode::None);
    while (!blocking) std::this_thread::sleep_for(1ms);
    auto second = downloads->enqueue(waiting, dest, NamingConfig{}, downloader::ErrorMode::None);
    auto third = downloads->enqueue(waiting, dest, NamingConfig{}, downloader::ErrorMode::None);

    EXPECT_FALSE(json::parse(command("Unqueue", {{"Id", first}}).body)["removed"].get<bool>());
    EXPECT_TRUE(json::parse(command("Unqueue", {{"Id", second}}).body)["removed"].get<bool>());
    EXPECT_EQ(json::parse(command("UnqueueAll").body)["removed"], 1);
    EXPECT_FALSE(downloads->status(third).has_value());

    release = true;
    EXPECT_TRUE(downloads->waitFor(first, 10s));
    EXPECT_EQ(json::parse(command("ToGoList").body).size(), 1u);
}

TEST_F(HttpFrontendTest, ToGoShowsListsReceiverRecordings) {
    EXPECT_EQ(command("ToGoShows", {{"Unit", "7460001"}}).status, 503);

    std::map<std::string, downloader::ReceiverSettings> receivers;
    receivers["7460001"].address = "10.0.0.5";
    downloader::ShowListClient shows(receivers, [](const std::string& url, const std::string&) {
        std::string items;
        if (url.find("ItemCount=0") == std::string::npos) {
            items = "<Item><Details><Title>Show</Title></Details><Links><Content>"
                    "<Url>/download/Show.TiVo?id=9</Url></Content></Links></Item>";
        }
        return "<TiVoContainer><Details><TotalItems>1</TotalItems>"
               "<LastChangeDate>0x1</LastChangeDate></Details>"
               "<ItemCount>1</ItemCount>" + items + "</TiVoContainer>";
    });

    HttpFrontendConfig config;
    config.port = 0;
    HttpFrontend browsing(config, *mediaServer, *downloads, &shows);

    httplib::Request req;
    req.method = "GET";
    req.path = "/TiVoConnect";
    req.params.emplace("Command", "ToGoShows");
    req.params.emplace("Unit", "7460001");
    httplib::Response res;
    browsing.handleCommand(req, res);

    ASSERT_EQ(res.status, 200) << res.body;
    auto list = json::parse(res.body);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0]["recording"]["id"], "9");
    EXPECT_EQ(list[0]["recording"]["title"], "Show");

    httplib::Request unknown = req;
    unknown.params.clear();
    unknown.params.emplace("Command", "ToGoShows");
    unknown.params.emplace("Unit", "other");
    httplib::Response missing;
    browsing.handleCommand(unknown, missing);
    EXPECT_EQ(missing.status, 404);
}

TEST(HttpFrontendConfigTest, BadNamingTemplateStopsStartup) {
    auto togo = json::parse(R"({"naming": {"episode": "{bogus}"}})");
    EXPECT_THROW(HttpFrontendConfig::fromJson({}, togo, {}), ConfigError);
    EXPECT_THROW(HttpFrontendConfig::fromJson({}, togo, {}), TemplateFieldError);
}

TEST(HttpFrontendConfigTest, FromJson) {
    auto server = json::parse(R"({"address": "127.0.0.1", "port": 9033, "threads": 4})");
    auto togo = json::parse(R"({"destination": "/srv/pulled", "errorMode": "all",
                                "naming": {"movie": "{title}"}})");
    auto receivers = json::parse(R"({"7460001234567890": {"name": "Den"}})");

    auto config = HttpFrontendConfig::fromJson(server, togo, receivers);
    EXPECT_EQ(config.port, 9033);
    EXPECT_EQ(config.threads, 4);
    EXPECT_EQ(config.destination, "/srv/pulled");
    EXPECT_EQ(config.errorMode, downloader::ErrorMode::All);
    EXPECT_EQ(config.naming.movieTemplate, "{title}");
    EXPECT_EQ(config.receiverNames.at("7460001234567890"), "Den");

    EXPECT_THROW(HttpFrontendConfig::fromJson(json{{"port", 70000}}, {}, {}), ConfigError);
    EXPECT_THROW(HttpFrontendConfig::fromJson(json{{"threads", 0}}, {}, {}), ConfigError);
    EXPECT_THROW(HttpFrontendConfig::fromJson({}, json{{"errorMode", "loud"}}, {}), ConfigError);
}
