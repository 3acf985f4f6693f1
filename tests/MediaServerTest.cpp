#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>

#include "TestUtils.hpp"
#include "core/server/MediaServer.hpp"
#include "utils/FileUtils.hpp"
#include "utils/StringUtils.hpp"

using namespace homestream;
using namespace homestream::core;
using namespace homestream::core::server;
using homestream::test::TempDir;

namespace {

const char* kHdTsn = "6520001234567890";
const char* kSdTsn = "5400001234567890";

/**
 * Returns canned stream facts keyed by extension and counts inspections
 */
class FakeInspector : public MediaInspector {
public:
    std::optional<MediaInfo> inspect(const std::string& path) override {
        ++inspections;
        if (fail) return std::nullopt;

        MediaInfo info;
        info.width = 1920;
        info.height = 1080;
        info.aspectRatio = 16.0 / 9.0;
        info.videoBitrate = 8000000;
        info.audioCodec = "ac3";
        info.audioBitrate = 384000;
        info.durationMs = 10000;
        if (utils::StringUtils::endsWith(path, ".mkv")) {
            info.container = "matroska,webm";
            info.videoCodec = "h264";
        } else {
            info.container = "mpeg";
            info.videoCodec = "mpeg2video";
        }
        return info;
    }

    std::atomic<int> inspections{0};
    bool fail{false};
};

class MediaServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs::create_directories(root.path() / "Movies" / "Classics");
        root.write("Movies/b.mpg", std::string(2000, 'b'));
        root.write("Movies/a.mkv", std::string(1000, 'a'));
        root.write("Movies/.hidden.mpg", "hidden");
        root.write("Movies/notes.txt", "not a video");
        root.write("Movies/Classics/old.mpg", "old");

        MediaServerConfig config;
        config.name = "Den Server";
        config.shares.push_back(Share{"Movies", (root.path() / "Movies").string()});
        inspector = std::make_shared<FakeInspector>();
        server = std::make_unique<MediaServer>(config, inspector);
    }

    ServeRequest request(const std::string& path, const std::string& tsn = kHdTsn) {
        ServeRequest req;
        req.container = "Movies";
        req.path = path;
        req.tsn = tsn;
        req.device = "Living Room";
        return req;
    }

    int statusOf(const ServeRequest& req) {
        try {
            server->prepare(req);
        } catch (const ServeError& e) {
            return e.status();
        }
        return 200;
    }

    TempDir root;
    std::shared_ptr<FakeInspector> inspector;
    std::unique_ptr<MediaServer> server;
};

} // namespace

TEST_F(MediaServerTest, RootListsShares) {
    auto xml = server->queryContainer("/", kHdTsn, 0, -1);
    ASSERT_TRUE(xml.has_value());
    EXPECT_NE(xml->find("<Title>Den Server</Title>"), std::string::npos);
    EXPECT_NE(xml->find("x-container/tivo-server"), std::string::npos);
    EXPECT_NE(xml->find("<Title>Movies</Title>"), std::string::npos);
    EXPECT_NE(xml->find("Container=Movies"), std::string::npos);
}

TEST_F(MediaServerTest, ContainerListsFoldersFirstAndSkipsOtherFiles) {
    auto xml = server->queryContainer("Movies", kHdTsn, 0, -1);
    ASSERT_TRUE(xml.has_value());

    EXPECT_NE(xml->find("<TotalItems>3</TotalItems>"), std::string::npos);
    auto folder = xml->find("<Title>Classics</Title>");
    auto first = xml->find("<Title>a</Title>");
    auto second = xml->find("<Title>b</Title>");
    ASSERT_NE(folder, std::string::npos);
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(folder, first);
    EXPECT_LT(first, second);

    EXPECT_EQ(xml->find("hidden"), std::string::npos);
    EXPECT_EQ(xml->find("notes"), std::string::npos);
    EXPECT_NE(xml->find("<Url>/Movies/b.mpg</Url>"), std::string::npos);
    EXPECT_NE(xml->find("<SourceSize>2000</SourceSize>"), std::string::npos);
}

TEST_F(MediaServerTest, ContainerPaging) {
    auto xml = server->queryContainer("Movies", kHdTsn, 1, 1);
    ASSERT_TRUE(xml.has_value());
    EXPECT_NE(xml->find("<ItemStart>1</ItemStart>"), std::string::npos);
    EXPECT_NE(xml->find("<ItemCount>1</ItemCount>"), std::string::npos);
    EXPECT_NE(xml->find("<Title>a</Title>"), std::string::npos);
    EXPECT_EQ(xml->find("<Title>b</Title>"), std::string::npos);
}

TEST_F(MediaServerTest, UnknownContainersAndEscapes) {
    EXPECT_FALSE(server->queryContainer("Music", kHdTsn, 0, -1).has_value());
    EXPECT_FALSE(server->queryContainer("Movies/Nope", kHdTsn, 0, -1).has_value());
    EXPECT_FALSE(server->resolvePath("Movies", "../secret").has_value());
    EXPECT_EQ(statusOf(request("missing.mpg")), 404);
    EXPECT_EQ(statusOf(request("Classics")), 404);
}

TEST_F(MediaServerTest, QueryFormatsFollowsProfile) {
    EXPECT_EQ(server->queryFormats(kSdTsn).find("x-tivo-mpeg-ts"), std::string::npos);
    EXPECT_NE(server->queryFormats("7460001234567890").find("x-tivo-mpeg-ts"), std::string::npos);
    EXPECT_NE(server->queryServer().find("<InternalName>Den Server</InternalName>"), std::string::npos);
}

TEST_F(MediaServerTest, DecisionsAreCachedPerFingerprint) {
    auto plan = server->prepare(request("b.mpg"));
    EXPECT_TRUE(plan.passThrough());
    EXPECT_EQ(plan.contentLength, 2000u);
    server->prepare(request("b.mpg"));

    EXPECT_EQ(inspector->inspections.load(), 1);
    EXPECT_EQ(server->decisionHits(), 1u);

    // Another profile is another decision
    server->prepare(request("b.mpg", kSdTsn));
    EXPECT_EQ(inspector->inspections.load(), 2);

    // A file changed in place gets a new fingerprint
    root.write("Movies/b.mpg", std::string(3000, 'b'));
    server->prepare(request("b.mpg"));
    EXPECT_EQ(inspector->inspections.load(), 3);

    server->invalidate(server->resolvePath("Movies", "b.mpg").value());
    EXPECT_EQ(server->cachedDecisions(), 0u);
}

TEST_F(MediaServerTest, ItemsLinkToTheirDetails) {
    auto xml = server->queryContainer("Movies", kHdTsn, 0, -1);
    ASSERT_TRUE(xml.has_value());
    EXPECT_NE(xml->find("<TiVoVideoDetails>"), std::string::npos);
    EXPECT_NE(xml->find("Command=TVBusQuery&amp;Container=Movies&amp;File=b.mpg"), std::string::npos);
}

TEST_F(MediaServerTest, MetadataSidecarOverridesFileFacts) {
    root.write("Movies/b.mpg.txt", "title: Bravo\nepisodeTitle: Origins\ndescription: How it started.\n");

    auto xml = server->queryContainer("Movies", kHdTsn, 0, -1);
    ASSERT_TRUE(xml.has_value());
    EXPECT_NE(xml->find("<Title>Bravo</Title>"), std::string::npos);
    EXPECT_NE(xml->find("<EpisodeTitle>Origins</EpisodeTitle>"), std::string::npos);
    EXPECT_NE(xml->find("<Description>How it started.</Description>"), std::string::npos);
    EXPECT_EQ(xml->find("<Title>b</Title>"), std::string::npos);
    // The sidecar itself is not listed
    EXPECT_NE(xml->find("<TotalItems>3</TotalItems>"), std::string::npos);
}

TEST_F(MediaServerTest, TvBusDetailsAreCachedPerReceiver) {
    auto first = server->tvBusQuery("Movies", "b.mpg", kHdTsn);
    ASSERT_TRUE(first.has_value());
    EXPECT_NE(first->find("TvBusMarshalledStruct:TvBusEnvelope"), std::string::npos);
    EXPECT_NE(first->find("<recordedDuration>PT0H0M10S</recordedDuration>"), std::string::npos);
    EXPECT_NE(first->find("<title>b</title>"), std::string::npos);
    int seen = inspector->inspections.load();

    EXPECT_EQ(server->tvBusQuery("Movies", "b.mpg", kHdTsn), first);
    EXPECT_EQ(inspector->inspections.load(), seen);

    server->tvBusQuery("Movies", "b.mpg", kSdTsn);
    EXPECT_EQ(inspector->inspections.load(), seen + 1);

    EXPECT_FALSE(server->tvBusQuery("Movies", "missing.mpg", kHdTsn).has_value());
    EXPECT_FALSE(server->tvBusQuery("Movies", "Classics", kHdTsn).has_value());
    EXPECT_FALSE(server->tvBusQuery("Movies", "../b.mpg", kHdTsn).has_value());
}

TEST_F(MediaServerTest, UninspectableFilesHaveEmptyDetails) {
    inspector->fail = true;
    auto details = server->tvBusQuery("Movies", "a.mkv", kHdTsn);
    ASSERT_TRUE(details.has_value());
    EXPECT_NE(details->find("TvBusEnvelope"), std::string::npos);
    EXPECT_EQ(details->find("<showing>"), std::string::npos);
}

TEST_F(MediaServerTest, TranscodePlanCarriesCommand) {
    auto plan = server->prepare(request("a.mkv"));
    EXPECT_FALSE(plan.passThrough());
    EXPECT_FALSE(plan.contentLength.has_value());
    ASSERT_FALSE(plan.command.empty());
    EXPECT_EQ(plan.command.front(), "ffmpeg");
    EXPECT_NE(std::find(plan.command.begin(), plan.command.end(), plan.path), plan.command.end());
}

TEST_F(MediaServerTest, UnreadableMediaIsUnsupported) {
    inspector->fail = true;
    EXPECT_EQ(statusOf(request("b.mpg")), 415);
}

TEST_F(MediaServerTest, FormatNegotiation) {
    ServeRequest req = request("b.mpg", kSdTsn);
    req.mime = "video/x-tivo-mpeg-ts";
    EXPECT_EQ(server->prepare(req).mime, kMimeTivoPs);

    req.mime = "audio/mpeg";
    EXPECT_EQ(statusOf(req), 415);
}

TEST_F(MediaServerTest, ReceiverRecordingsGoBackUntouched) {
    std::string recording = test::makeTivoHeader(64) + test::makeTransportStream(4);
    root.write("Movies/show.TiVo", recording);

    auto plan = server->prepare(request("show.TiVo", "7460001234567890"));
    EXPECT_TRUE(plan.passThrough());
    EXPECT_EQ(plan.mime, kMimeTivoTs);
    EXPECT_EQ(inspector->inspections.load(), 0);

    ServeRequest decrypt = request("show.TiVo");
    decrypt.mime = "video/mpeg";
    EXPECT_EQ(statusOf(decrypt), 415);
}

TEST_F(MediaServerTest, StreamsFromOffsetAndRejectsRepeats) {
    ServeRequest req = request("b.mpg");
    req.offset = 500;
    auto plan = server->prepare(req);
    EXPECT_EQ(plan.contentLength, 1500u);

    std::string received;
    auto result = server->stream(plan, [&received](const char* data, size_t len) {
        received.append(data, len);
        return true;
    });
    ASSERT_TRUE(result.success()) << result.error;
    EXPECT_EQ(received.size(), 1500u);
    EXPECT_EQ(server->activeTransferCount(), 0u);

    // Same receiver asking for the same spot again
    EXPECT_EQ(statusOf(req), 416);
    auto status = server->transferStatus();
    EXPECT_EQ(status["Living Room"][plan.path]["error"], "Repeat offset call");
    EXPECT_EQ(status["Living Room"][plan.path]["output"], 1500);
}

TEST_F(MediaServerTest, BadOffsets) {
    ServeRequest past = request("b.mpg");
    past.offset = 2000;
    EXPECT_EQ(statusOf(past), 416);

    ServeRequest transcoded = request("a.mkv");
    transcoded.offset = 10;
    EXPECT_EQ(statusOf(transcoded), 416);
}

TEST_F(MediaServerTest, ClientDisconnectIsRecorded) {
    auto plan = server->prepare(request("b.mpg"));
    auto result = server->stream(plan, [](const char*, size_t) { return false; });

    EXPECT_FALSE(result.success());
    auto status = server->transferStatus();
    EXPECT_FALSE(status["Living Room"][plan.path]["active"].get<bool>());
    EXPECT_FALSE(status["Living Room"][plan.path]["error"].get<std::string>().empty());
}

TEST_F(MediaServerTest, PruneForgetsFinishedTransfers) {
    auto plan = server->prepare(request("b.mpg"));
    server->stream(plan, [](const char*, size_t) { return true; });

    EXPECT_EQ(server->pruneStatus(std::chrono::hours(24)), 0u);
    EXPECT_EQ(server->pruneStatus(std::chrono::seconds(0)), 1u);
    EXPECT_TRUE(server->transferStatus().empty());
}

TEST(MediaServerConfigTest, SharesFromJson) {
    auto shares = nlohmann::json::parse(R"({"Movies": "/srv/movies", "TV": {"path": "/srv/tv"}})");
    auto config = MediaServerConfig::fromJson(nlohmann::json{{"name", "Den"}}, shares, nlohmann::json::object());

    EXPECT_EQ(config.name, "Den");
    ASSERT_EQ(config.shares.size(), 2u);
    EXPECT_THROW(MediaServerConfig::fromJson({}, nlohmann::json{{"Empty", ""}}, {}), ConfigError);
}
