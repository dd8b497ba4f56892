#include <thread>

#include <gtest/gtest.h>

#include "CurlTransport.hpp"
#include "RequestContext.hpp"

TEST(RequestContextTest, NoDeadlineByDefault)
{
    RequestContext context;

    EXPECT_FALSE(context.Remaining());
    EXPECT_FALSE(context.IsExpired());
    EXPECT_FALSE(context.ShouldAbort());
}

TEST(RequestContextTest, TimeoutSetsFutureDeadline)
{
    RequestContext context;
    context.SetTimeout(std::chrono::minutes(1));

    ASSERT_TRUE(context.Remaining());
    EXPECT_GT(context.Remaining()->count(), 0);
    EXPECT_LE(*context.Remaining(), std::chrono::minutes(1));
    EXPECT_FALSE(context.IsExpired());
}

TEST(RequestContextTest, PastDeadlineIsExpired)
{
    RequestContext context;
    context.SetDeadline(RequestContext::Clock::now() - std::chrono::seconds(1));

    EXPECT_TRUE(context.IsExpired());
    EXPECT_TRUE(context.ShouldAbort());
    EXPECT_EQ(context.Remaining(), std::chrono::milliseconds(0));
}

TEST(RequestContextTest, CancelFromAnotherThread)
{
    RequestContext context;

    std::thread canceller([&context] { context.TryCancel(); });
    canceller.join();

    EXPECT_TRUE(context.IsCancelled());
    EXPECT_TRUE(context.ShouldAbort());
}

TEST(CurlTransportTest, CancelledContextFailsWithoutResponse)
{
    CurlTransport transport;
    ASSERT_TRUE(transport.IsValid());

    RequestContext context;
    context.TryCancel();

    HttpRequest request;
    request.url = "http://127.0.0.1:9/";

    auto [ok, response, err] = transport.Perform(request, context);
    EXPECT_FALSE(ok);
    EXPECT_FALSE(err.message.empty());
}

TEST(HttpTransportTest, HeaderLookupIsCaseInsensitive)
{
    HttpResponse response;
    response.headers.emplace("location", "https://example.com/x");

    EXPECT_EQ(response.GetHeader("Location"), "https://example.com/x");
    EXPECT_FALSE(response.GetHeader("Upload-Offset"));
}

TEST(HttpTransportTest, MemoryBodyReadsCallerBytesInPieces)
{
    const std::string data = "0123456789";
    MemoryBody body(data);

    HttpRequest request;
    request.source = &body;
    EXPECT_EQ(request.BodySize(), 10u);

    char buffer[4];
    std::string out;
    for (int i = 0; i < 3; i++) {
        auto [ok, n, err] = body.Read(buffer, sizeof(buffer));
        ASSERT_TRUE(ok);
        out.append(buffer, n);
    }
    EXPECT_EQ(out, data);

    auto [ok, n, err] = body.Read(buffer, sizeof(buffer));
    EXPECT_TRUE(ok);
    EXPECT_EQ(n, 0u);
}

TEST(HttpTransportTest, EmptyMemoryBody)
{
    MemoryBody body{ std::string_view{} };
    char buffer[4];

    auto [ok, n, err] = body.Read(buffer, sizeof(buffer));
    EXPECT_TRUE(ok);
    EXPECT_EQ(n, 0u);
    EXPECT_EQ(body.Size(), 0u);
}
