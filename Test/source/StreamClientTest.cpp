#include <chrono>

#include <gtest/gtest.h>

#include "FakeTransport.hpp"
#include "JsonCodec.hpp"
#include "StreamClient.hpp"

namespace {
    constexpr const char* kBase = "https://api.example.com/client/v4";
    constexpr const char* kStreamUrl = "https://api.example.com/client/v4/accounts/acc-1/stream";

    constexpr const char* kVideoJson = R"({
        "success": true,
        "errors": [],
        "messages": [],
        "result": {
            "uid": "vid-1",
            "readyToStream": true,
            "requireSignedURLs": true,
            "status": { "state": "ready", "pctComplete": "100.000000" },
            "meta": { "name": "clip.mp4" },
            "created": "2024-01-02T03:04:05.000000Z",
            "duration": 12.5,
            "size": 1048576,
            "input": { "width": 1920, "height": 1080 }
        }
    })";
}

class StreamClientTest : public ::testing::Test
{
protected:
    StreamClientTest()
        : client_(transport_, "acc-1", "tok-secret", kBase)
    {
    }

    const FakeTransport::Exchange& OnlyExchange() const
    {
        EXPECT_EQ(transport_.GetExchanges().size(), 1u);
        return transport_.GetExchanges().front();
    }

    FakeTransport transport_;
    StreamClient client_;
    RequestContext context_;
};

TEST_F(StreamClientTest, IsValidNeedsCredentials)
{
    EXPECT_TRUE(client_.IsValid());
    EXPECT_FALSE(StreamClient(transport_, "", "tok").IsValid());
    EXPECT_FALSE(StreamClient(transport_, "acc", "").IsValid());
}

TEST_F(StreamClientTest, OpenUploadSessionSendsTusCreation)
{
    transport_.Respond(201, "", { { "Location", "https://upload.example.com/tus/abc123?tusv2=true" } });

    UploadOptions options;
    options.name = "test.mp4";
    options.require_signed_urls = true;

    auto [ok, session, err] = client_.OpenUploadSession(1234, options, context_);
    ASSERT_TRUE(ok) << err.message;
    EXPECT_EQ(session.resource_id, "abc123");
    EXPECT_EQ(session.upload_url, "https://upload.example.com/tus/abc123?tusv2=true");

    const auto& exchange = OnlyExchange();
    EXPECT_EQ(exchange.method, "POST");
    EXPECT_EQ(exchange.url, kStreamUrl);
    EXPECT_EQ(FindHeader(exchange, "Authorization"), "Bearer tok-secret");
    EXPECT_EQ(FindHeader(exchange, "Tus-Resumable"), "1.0.0");
    EXPECT_EQ(FindHeader(exchange, "Upload-Length"), "1234");
    EXPECT_EQ(FindHeader(exchange, "Upload-Metadata"), "name dGVzdC5tcDQ=,requiresignedurls");
}

TEST_F(StreamClientTest, OpenUploadSessionResolvesRelativeLocation)
{
    transport_.Respond(201, "", { { "location", "/client/v4/accounts/acc-1/stream/xyz" } });

    auto [ok, session, err] = client_.OpenUploadSession(10, UploadOptions{}, context_);
    ASSERT_TRUE(ok) << err.message;
    EXPECT_EQ(session.resource_id, "xyz");
    EXPECT_EQ(session.upload_url, "https://api.example.com/client/v4/accounts/acc-1/stream/xyz");
    EXPECT_FALSE(FindHeader(OnlyExchange(), "Upload-Metadata"));
}

TEST_F(StreamClientTest, OpenUploadSessionWithoutLocationIsProtocolViolation)
{
    transport_.Respond(201);

    auto [ok, session, err] = client_.OpenUploadSession(10, UploadOptions{}, context_);
    EXPECT_FALSE(ok);
    EXPECT_EQ(err.kind, UploadError::Kind::ProtocolViolation);
}

TEST_F(StreamClientTest, OpenUploadSessionRejectsOtherStatus)
{
    transport_.Respond(401, R"({"success":false})");

    auto [ok, session, err] = client_.OpenUploadSession(10, UploadOptions{}, context_);
    EXPECT_FALSE(ok);
    EXPECT_EQ(err.kind, UploadError::Kind::TransportFailure);
    EXPECT_EQ(err.code, 401);
    EXPECT_NE(err.message.find("unauthorized"), std::string::npos);
}

TEST_F(StreamClientTest, SendChunkPatchesAtOffset)
{
    transport_.Respond(204);

    const Session session{ "abc", "https://upload.example.com/tus/abc" };
    auto err = client_.SendChunk(session, 52428800, "chunk-bytes", context_);
    ASSERT_FALSE(err) << err->message;

    const auto& exchange = OnlyExchange();
    EXPECT_EQ(exchange.method, "PATCH");
    EXPECT_EQ(exchange.url, session.upload_url);
    EXPECT_EQ(exchange.body, "chunk-bytes");
    EXPECT_TRUE(exchange.streamed);
    EXPECT_EQ(exchange.declared_size, 11u);
    EXPECT_EQ(FindHeader(exchange, "Upload-Offset"), "52428800");
    EXPECT_EQ(FindHeader(exchange, "Content-Length"), "11");
    EXPECT_EQ(FindHeader(exchange, "Content-Type"), "application/offset+octet-stream");
    EXPECT_EQ(FindHeader(exchange, "Tus-Resumable"), "1.0.0");
}

TEST_F(StreamClientTest, SendChunkNeeds204)
{
    transport_.Respond(200);

    auto err = client_.SendChunk(Session{ "abc", "https://upload.example.com/tus/abc" }, 0, "x", context_);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, UploadError::Kind::TransportFailure);
    EXPECT_EQ(err->code, 200);
}

TEST_F(StreamClientTest, SendChunkReportsNetworkError)
{
    transport_.Fail(28, "deadline exceeded");

    auto err = client_.SendChunk(Session{ "abc", "https://upload.example.com/tus/abc" }, 0, "x", context_);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, UploadError::Kind::TransportFailure);
    EXPECT_EQ(err->code, 28);
    EXPECT_NE(err->message.find("deadline exceeded"), std::string::npos);
}

TEST_F(StreamClientTest, GetDirectUploadURLPostsJsonRequest)
{
    transport_.Respond(200, R"({"success":true,"errors":[],"messages":[],
        "result":{"uid":"vid-9","uploadURL":"https://upload.example.com/direct/vid-9","expiry":"2030-01-01T00:00:00Z"}})");

    DirectUploadOptions options;
    options.max_duration_seconds = 21600;
    options.require_signed_urls = true;
    options.name = "clip.mp4";
    options.metadata["project"] = "demo";

    auto [ok, upload, err] = client_.GetDirectUploadURL(options, context_);
    ASSERT_TRUE(ok) << err.message;
    EXPECT_EQ(upload.resource_id, "vid-9");
    EXPECT_EQ(upload.upload_url, "https://upload.example.com/direct/vid-9");
    ASSERT_TRUE(upload.expiry);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(upload.expiry->time_since_epoch()).count(), 1893456000);

    const auto& exchange = OnlyExchange();
    EXPECT_EQ(exchange.method, "POST");
    EXPECT_EQ(exchange.url, std::string(kStreamUrl) + "/direct_upload");
    EXPECT_EQ(FindHeader(exchange, "Content-Type"), "application/json");

    DirectUploadRequest request;
    ASSERT_FALSE(JsonToMessage(exchange.body, &request));
    EXPECT_EQ(request.max_duration_seconds(), 21600);
    EXPECT_TRUE(request.require_signed_urls());
    EXPECT_EQ(request.meta().fields().at("name").string_value(), "clip.mp4");
    EXPECT_EQ(request.meta().fields().at("project").string_value(), "demo");
    EXPECT_FALSE(request.has_expiry());
    EXPECT_NE(exchange.body.find("\"requireSignedURLs\""), std::string::npos);
}

TEST_F(StreamClientTest, GetDirectUploadURLReportsApiError)
{
    transport_.Respond(200, R"({"success":false,"errors":[{"code":10005,"message":"Invalid maxDurationSeconds"}],"result":null})");

    auto [ok, upload, err] = client_.GetDirectUploadURL(DirectUploadOptions{}, context_);
    EXPECT_FALSE(ok);
    EXPECT_EQ(err.kind, UploadError::Kind::TransportFailure);
    EXPECT_EQ(err.code, 10005);
    EXPECT_NE(err.message.find("Invalid maxDurationSeconds"), std::string::npos);
}

TEST_F(StreamClientTest, GetDirectUploadURLWithoutUrlIsProtocolViolation)
{
    transport_.Respond(200, R"({"success":true,"result":{"uid":"vid-9"}})");

    auto [ok, upload, err] = client_.GetDirectUploadURL(DirectUploadOptions{}, context_);
    EXPECT_FALSE(ok);
    EXPECT_EQ(err.kind, UploadError::Kind::ProtocolViolation);
}

TEST_F(StreamClientTest, UndecodableBodyIsProtocolViolation)
{
    transport_.Respond(200, "<html>bad gateway</html>");

    auto [ok, upload, err] = client_.GetDirectUploadURL(DirectUploadOptions{}, context_);
    EXPECT_FALSE(ok);
    EXPECT_EQ(err.kind, UploadError::Kind::ProtocolViolation);
}

TEST_F(StreamClientTest, GetResourceParsesVideo)
{
    transport_.Respond(200, kVideoJson);

    auto [ok, video, err] = client_.GetResource("vid-1", context_);
    ASSERT_TRUE(ok) << err.message;

    EXPECT_EQ(OnlyExchange().method, "GET");
    EXPECT_EQ(OnlyExchange().url, std::string(kStreamUrl) + "/vid-1");
    EXPECT_EQ(FindHeader(OnlyExchange(), "Authorization"), "Bearer tok-secret");

    EXPECT_EQ(video.uid(), "vid-1");
    EXPECT_TRUE(video.ready_to_stream());
    EXPECT_TRUE(video.require_signed_urls());
    EXPECT_EQ(video.status().state(), "ready");
    EXPECT_EQ(video.status().pct_complete(), "100.000000");
    EXPECT_EQ(video.meta().fields().at("name").string_value(), "clip.mp4");
    EXPECT_DOUBLE_EQ(video.duration(), 12.5);
    EXPECT_EQ(video.size(), 1048576);
    EXPECT_TRUE(video.has_created());
}

TEST_F(StreamClientTest, GetResourceNotFound)
{
    transport_.Respond(404, R"({"success":false,"errors":[{"code":10003,"message":"Not Found"}]})");

    auto [ok, video, err] = client_.GetResource("missing", context_);
    EXPECT_FALSE(ok);
    EXPECT_EQ(err.code, 404);
    EXPECT_NE(err.message.find("video not found"), std::string::npos);
}

TEST_F(StreamClientTest, GetResourceNeedsId)
{
    auto [ok, video, err] = client_.GetResource("", context_);

    EXPECT_FALSE(ok);
    EXPECT_EQ(err.kind, UploadError::Kind::InvalidInput);
    EXPECT_TRUE(transport_.GetExchanges().empty());
}

TEST_F(StreamClientTest, TrailingSlashInBaseUrlIsIgnored)
{
    StreamClient client(transport_, "acc-1", "tok-secret", std::string(kBase) + "/");
    transport_.Respond(200, kVideoJson);

    auto [ok, video, err] = client.GetResource("vid-1", context_);
    ASSERT_TRUE(ok) << err.message;
    EXPECT_EQ(OnlyExchange().url, std::string(kStreamUrl) + "/vid-1");
}

TEST(UploadMetadataTest, EncodesPairsInKeyOrder)
{
    UploadOptions options;
    options.name = "My Video";
    options.metadata["b"] = "2";
    options.metadata["a"] = "1";

    EXPECT_EQ(BuildUploadMetadata(options), "name TXkgVmlkZW8=,a MQ==,b Mg==");
}

TEST(UploadMetadataTest, SkipsInvalidKeysAndShadowedName)
{
    UploadOptions options;
    options.name = "clip";
    options.metadata["name"] = "other";
    options.metadata["bad key"] = "x";
    options.metadata["bad,key"] = "x";

    EXPECT_EQ(BuildUploadMetadata(options), "name Y2xpcA==");
}

TEST(UploadMetadataTest, EmptyOptionsProduceNothing)
{
    EXPECT_EQ(BuildUploadMetadata(UploadOptions{}), "");

    UploadOptions options;
    options.require_signed_urls = true;
    EXPECT_EQ(BuildUploadMetadata(options), "requiresignedurls");
}
