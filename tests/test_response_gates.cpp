#include <catch2/catch_all.hpp>
#include "TestSupport.hpp"
#include "core/ResponseGates.hpp"
#include "network/GzipBodyStream.hpp"
#include "network/HttpRequest.hpp"

using namespace Unclutter;
using namespace UnclutterTest;

TEST_CASE("BuildRequest sets only the gzip Accept-Encoding header") {
    auto url = UrlUtil::ParseRequestUrl("http://example.com/article");
    REQUIRE(url.has_value());
    HttpRequest request = BuildRequest(*url);
    CHECK(request.method() == "GET");
    CHECK(request.url().href == "http://example.com/article");
    REQUIRE(request.headers().size() == 1);
    CHECK(request.headers()[0].first == "Accept-Encoding");
    CHECK(request.headers()[0].second == "gzip");
}

TEST_CASE("HttpRequest rejects headers that would break framing") {
    auto url = UrlUtil::ParseRequestUrl("http://example.com/");
    REQUIRE(url.has_value());
    HttpRequest request("GET", *url);

    try {
        request.SetHeader("X-Test", "a\r\nInjected: yes");
        FAIL("expected RequestBuildError");
    } catch (const AcquireError& e) {
        CHECK(e.kind() == ErrorKind::RequestBuildError);
    }
    CHECK_THROWS_AS(request.SetHeader("Bad Name", "x"), AcquireError);
    CHECK_THROWS_AS(request.SetHeader("", "x"), AcquireError);
    CHECK_THROWS_AS(HttpRequest("G ET", *url), AcquireError);

    request.SetHeader("accept-encoding", "identity");
    request.SetHeader("Accept-Encoding", "gzip");
    REQUIRE(request.headers().size() == 1);
    CHECK(request.headers()[0].second == "gzip");
}

TEST_CASE("IsHtmlContentType uses substring containment") {
    CHECK(IsHtmlContentType("text/html"));
    CHECK(IsHtmlContentType("text/html; charset=utf-8"));
    CHECK(IsHtmlContentType("text/html;charset=ISO-8859-1"));
    CHECK_FALSE(IsHtmlContentType("text/plain"));
    CHECK_FALSE(IsHtmlContentType("application/json"));
    CHECK_FALSE(IsHtmlContentType(""));
}

// Cases where substring matching disagrees with a structured media-type
// parse. Pinned so any change in policy is deliberate.
TEST_CASE("IsHtmlContentType divergent cases") {
    CHECK_FALSE(IsHtmlContentType("TEXT/HTML"));
    CHECK_FALSE(IsHtmlContentType("application/xhtml+xml"));
    CHECK(IsHtmlContentType("text/htmlx"));
    CHECK(IsHtmlContentType("application/octet-stream; note=text/html"));
}

TEST_CASE("IsGzipEncoding needs the exact token") {
    CHECK(IsGzipEncoding("gzip"));
    CHECK_FALSE(IsGzipEncoding(""));
    CHECK_FALSE(IsGzipEncoding("identity"));
    CHECK_FALSE(IsGzipEncoding("deflate"));
    // Divergent cases: treated as identity, not decoded
    CHECK_FALSE(IsGzipEncoding("GZIP"));
    CHECK_FALSE(IsGzipEncoding("x-gzip"));
    CHECK_FALSE(IsGzipEncoding("gzip, identity"));
}

TEST_CASE("NormalizeEncoding wraps gzip and passes everything else through") {
    auto stats = std::make_shared<StreamStats>();

    SECTION("gzip") {
        auto stream = NormalizeEncoding(std::make_unique<CountingBodyStream>(GzipCompress("<p>hi</p>"), stats), "gzip");
        CHECK(dynamic_cast<GzipBodyStream*>(stream.get()) != nullptr);
        CHECK(stats->reads == 0);
        CHECK(ReadAll(*stream) == "<p>hi</p>");
    }

    SECTION("identity, absent and unknown encodings") {
        for (const char* encoding : {"", "identity", "br", "x-gzip"}) {
            auto body = std::make_unique<CountingBodyStream>("<p>raw</p>", stats);
            IBodyStream* raw = body.get();
            auto stream = NormalizeEncoding(std::move(body), encoding);
            CHECK(stream.get() == raw);
            CHECK(ReadAll(*stream) == "<p>raw</p>");
        }
    }
}
