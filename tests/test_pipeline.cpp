#include <catch2/catch_all.hpp>
#include <sstream>
#include "TestSupport.hpp"
#include "core/ReadabilityPipeline.hpp"
#include "utils/BodyStreams.hpp"

using namespace Unclutter;
using namespace UnclutterTest;

namespace {

const std::string kPage = "<html><body><p>Hello pipeline</p></body></html>";

struct PipelineFixture {
    FakeTransport transport;
    std::shared_ptr<RecordingEngine> engine = std::make_shared<RecordingEngine>();
    int factory_calls = 0;
    ReadabilityPipeline pipeline{transport, [this]() -> std::shared_ptr<IExtractionEngine> {
        ++factory_calls;
        return engine;
    }};

    AcquireResult Fetch(const std::string& url = "http://example.com/a") {
        return pipeline.AcquireFromUrl(url, std::chrono::milliseconds(5000));
    }
};

} // anonymous namespace

TEST_CASE_METHOD(PipelineFixture, "Invalid URLs never reach the transport") {
    for (const char* url : {"", "not a url", "example.com/path", "http://", "http://host:99999/"}) {
        AcquireResult result = Fetch(url);
        CHECK_FALSE(result.ok());
        CHECK(result.error.kind == ErrorKind::InvalidURL);
    }
    CHECK(transport.calls == 0);
    CHECK(factory_calls == 0);
}

TEST_CASE_METHOD(PipelineFixture, "Request advertises gzip exactly once") {
    transport.response.body = kPage;
    AcquireResult result = pipeline.AcquireFromUrl("http://example.com/a", std::chrono::milliseconds(1234));
    REQUIRE(result.ok());

    REQUIRE(transport.calls == 1);
    CHECK(transport.last_url == "http://example.com/a");
    CHECK(transport.last_timeout == std::chrono::milliseconds(1234));
    int accept_encoding = 0;
    for (const auto& header : transport.last_headers) {
        if (header.first == "Accept-Encoding") {
            ++accept_encoding;
            CHECK(header.second == "gzip");
        }
    }
    CHECK(accept_encoding == 1);
}

TEST_CASE_METHOD(PipelineFixture, "Identity body reaches the engine unchanged") {
    transport.response.body = kPage;
    AcquireResult result = Fetch("http://example.com/a?b=1");
    REQUIRE(result.ok());
    CHECK(result.article->title == "recorded");
    CHECK(engine->seen_bytes == kPage);
    CHECK(engine->seen_url == "http://example.com/a?b=1");
    CHECK(transport.stats->close_calls == 1);
}

TEST_CASE_METHOD(PipelineFixture, "Gzip body is decoded before extraction") {
    transport.response.content_encoding = "gzip";
    transport.response.body = GzipCompress(kPage);
    AcquireResult result = Fetch();
    REQUIRE(result.ok());
    CHECK(engine->seen_bytes == kPage);
    CHECK(transport.stats->close_calls == 1);
}

TEST_CASE_METHOD(PipelineFixture, "Unknown encodings pass through as identity") {
    transport.response.content_encoding = "x-gzip";
    transport.response.body = kPage;
    AcquireResult result = Fetch();
    REQUIRE(result.ok());
    CHECK(engine->seen_bytes == kPage);
}

TEST_CASE_METHOD(PipelineFixture, "Corrupted gzip body is a decode error") {
    transport.response.content_encoding = "gzip";
    transport.response.body = "this is not gzip at all";
    AcquireResult result = Fetch();
    CHECK_FALSE(result.ok());
    CHECK(result.error.kind == ErrorKind::DecodeError);
    CHECK(transport.stats->close_calls == 1);
}

TEST_CASE_METHOD(PipelineFixture, "Non-HTML responses are rejected before any read") {
    transport.response.content_type = "text/plain";
    transport.response.body = kPage;

    SECTION("identity") {}
    SECTION("gzip declared but corrupt") {
        transport.response.content_encoding = "gzip";
        transport.response.body = "garbage";
    }

    AcquireResult result = Fetch();
    CHECK_FALSE(result.ok());
    CHECK(result.error.kind == ErrorKind::UnsupportedContentType);
    CHECK(result.error.message.find("text/plain") != std::string::npos);
    CHECK(transport.stats->reads == 0);
    CHECK(transport.stats->close_calls == 1);
    CHECK(engine->parse_calls == 0);
}

TEST_CASE_METHOD(PipelineFixture, "Content type parameters and missing header") {
    transport.response.body = kPage;

    SECTION("charset parameter accepted") {
        transport.response.content_type = "text/html;charset=windows-1252";
        CHECK(Fetch().ok());
    }
    SECTION("absent content type rejected") {
        transport.response.content_type = "";
        CHECK(Fetch().error.kind == ErrorKind::UnsupportedContentType);
    }
}

TEST_CASE_METHOD(PipelineFixture, "Transport errors pass through unchanged") {
    transport.fail_with = Error{ErrorKind::FetchError, "operation timed out", true};
    AcquireResult result = Fetch();
    CHECK_FALSE(result.ok());
    CHECK(result.error.kind == ErrorKind::FetchError);
    CHECK(result.error.timed_out);
    CHECK(result.error.message == "operation timed out");
    CHECK(factory_calls == 0);
}

TEST_CASE_METHOD(PipelineFixture, "Status codes do not gate extraction") {
    transport.response.body = kPage;
    for (long status : {404L, 500L, 204L}) {
        transport.response.status_code = status;
        CHECK(Fetch().ok());
    }
}

TEST_CASE_METHOD(PipelineFixture, "Body is closed exactly once on every path") {
    transport.response.body = kPage;

    SECTION("engine reports failure") {
        engine->fail_message = "nothing readable";
        AcquireResult result = Fetch();
        CHECK(result.error.kind == ErrorKind::ParseError);
        CHECK(result.error.message == "nothing readable");
    }
    SECTION("engine throws") {
        engine->throw_on_parse = true;
        AcquireResult result = Fetch();
        CHECK(result.error.kind == ErrorKind::ParseError);
        CHECK(result.error.message == "engine blew up");
    }
    SECTION("connection drops mid-body") {
        transport.response.fail_after = 10;
        AcquireResult result = Fetch();
        CHECK(result.error.kind == ErrorKind::FetchError);
        CHECK(transport.stats->bytes_read == 10);
    }
    SECTION("connection drops mid-body under gzip") {
        transport.response.content_encoding = "gzip";
        transport.response.body = GzipCompress(kPage);
        transport.response.fail_after = 12;
        AcquireResult result = Fetch();
        CHECK(result.error.kind == ErrorKind::FetchError);
    }

    CHECK(transport.stats->close_calls == 1);
}

TEST_CASE_METHOD(PipelineFixture, "Decoder is closed before the response body") {
    transport.response.content_encoding = "gzip";
    transport.response.body = GzipCompress(kPage);

    // A closed decoder refuses reads; an open one at end of stream returns 0.
    int decoder_closed_first = -1;
    transport.stats->on_close = [this, &decoder_closed_first]() {
        // Runs inside Close(), so record the outcome instead of throwing.
        if (engine->last_input == nullptr) return;
        char byte;
        try {
            engine->last_input->Read(&byte, 1);
            decoder_closed_first = 0;
        } catch (const AcquireError& e) {
            CHECK(e.kind() == ErrorKind::DecodeError);
            decoder_closed_first = 1;
        }
    };

    SECTION("success") {
        AcquireResult result = Fetch();
        REQUIRE(result.ok());
        CHECK(engine->seen_bytes == kPage);
    }
    SECTION("engine reports failure") {
        engine->fail_message = "nothing readable";
        CHECK(Fetch().error.kind == ErrorKind::ParseError);
    }
    SECTION("engine throws") {
        engine->throw_on_parse = true;
        CHECK(Fetch().error.kind == ErrorKind::ParseError);
    }

    CHECK(decoder_closed_first == 1);
    CHECK(transport.stats->close_calls == 1);
}

TEST_CASE_METHOD(PipelineFixture, "Engine factory is consulted per operation") {
    transport.response.body = kPage;
    REQUIRE(Fetch().ok());
    REQUIRE(Fetch().ok());

    StringBodyStream input("<p>x</p>");
    CHECK(pipeline.CheckStream(input));
    CHECK(factory_calls == 3);
}

TEST_CASE_METHOD(PipelineFixture, "Cancelled token stops the call") {
    CancellationToken token;
    token.Cancel();
    AcquireResult result = pipeline.AcquireFromUrl("http://example.com/", std::chrono::milliseconds(0), token);
    CHECK_FALSE(result.ok());
    CHECK(result.error.kind == ErrorKind::Cancelled);
    CHECK(engine->parse_calls == 0);
}

TEST_CASE_METHOD(PipelineFixture, "AcquireFromStream leaves the caller's stream open") {
    auto stats = std::make_shared<StreamStats>();
    CountingBodyStream input(kPage, stats);
    Url base = *UrlUtil::ParseRequestUrl("https://example.org/base/");

    AcquireResult result = pipeline.AcquireFromStream(input, base);
    REQUIRE(result.ok());
    CHECK(engine->seen_bytes == kPage);
    CHECK(engine->seen_url == "https://example.org/base/");
    CHECK(stats->close_calls == 0);
    CHECK(transport.calls == 0);
}

TEST_CASE_METHOD(PipelineFixture, "AcquireFromStream reports stream failures by kind") {
    auto stats = std::make_shared<StreamStats>();
    CountingBodyStream input(kPage, stats);
    input.FailAfter(3);
    AcquireResult result = pipeline.AcquireFromStream(input, *UrlUtil::ParseRequestUrl("http://example.com/"));
    CHECK(result.error.kind == ErrorKind::FetchError);
    CHECK(stats->close_calls == 0);
}

TEST_CASE_METHOD(PipelineFixture, "Document operations use the document entry points") {
    auto document = HtmlDocument::Parse(kPage);
    REQUIRE(document.has_value());

    AcquireResult result = pipeline.AcquireFromDocument(*document, *UrlUtil::ParseRequestUrl("http://example.com/doc"));
    REQUIRE(result.ok());
    CHECK(result.article->title == "from document");
    CHECK(engine->parse_document_calls == 1);
    CHECK(engine->parse_calls == 0);

    CHECK(pipeline.CheckDocument(*document));
    CHECK(engine->check_document_calls == 1);
}

TEST_CASE_METHOD(PipelineFixture, "CheckStream reads the stream and reports a verdict") {
    SECTION("readable") {
        StringBodyStream input(kPage);
        CHECK(pipeline.CheckStream(input));
    }
    SECTION("not readable") {
        std::istringstream in("<div>nothing</div>");
        IstreamBodyStream input(in);
        CHECK_FALSE(pipeline.CheckStream(input));
    }
    SECTION("stream failure is a negative verdict") {
        auto stats = std::make_shared<StreamStats>();
        CountingBodyStream input(kPage, stats);
        input.FailAfter(0);
        CHECK_FALSE(pipeline.CheckStream(input));
        CHECK(stats->close_calls == 0);
    }
    CHECK(engine->check_calls == 1);
}

TEST_CASE("Pipeline with the default engine extracts real content") {
    FakeTransport transport;
    transport.response.content_encoding = "gzip";
    std::string paragraph =
        "The committee met on Tuesday to review the proposal, and after a long discussion, "
        "the members agreed to continue the work through the winter. ";
    std::string html = "<html><head><title>Minutes</title></head><body><div class=\"content\">";
    for (int i = 0; i < 6; ++i) html += "<p>" + paragraph + "</p>";
    html += "</div></body></html>";
    transport.response.body = GzipCompress(html);

    ReadabilityPipeline pipeline(transport);
    AcquireResult result = pipeline.AcquireFromUrl("http://example.com/minutes", std::chrono::milliseconds(1000));
    REQUIRE(result.ok());
    CHECK(result.article->title == "Minutes");
    CHECK(result.article->text_content.find("committee met on Tuesday") != std::string::npos);
    CHECK(transport.stats->close_calls == 1);
}
