#include "CurlTransport.hpp"
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include "../utils/Logger.hpp"

namespace {

using Unclutter::AcquireError;
using Unclutter::CancellationToken;
using Unclutter::ErrorKind;

// Stop accepting body bytes from libcurl once this much is waiting to be read.
constexpr size_t kHighWaterBytes = 1 << 20;
constexpr int kPollIntervalMs = 100;

// State of one transfer, shared by Execute() and the body stream it returns.
struct CurlSession {
    explicit CurlSession(CancellationToken token) : cancel(std::move(token)) {}
    ~CurlSession();

    CurlSession(const CurlSession&) = delete;
    CurlSession& operator=(const CurlSession&) = delete;

    size_t Available() const { return pending.size() - pending_offset; }
    bool HeadersReady() const { return headers_done || body_started || done; }
    void Pump();
    AcquireError Failure() const;

    CURLM* multi = nullptr;
    CURL* easy = nullptr;
    curl_slist* request_headers = nullptr;
    bool attached = false;
    char error_buffer[CURL_ERROR_SIZE] = {0};
    CancellationToken cancel;

    std::string pending;
    size_t pending_offset = 0;
    bool headers_done = false;
    bool body_started = false;
    bool paused = false;
    bool done = false;
    CURLcode result = CURLE_OK;
    std::string multi_error;

    // Headers of the most recent response only; redirects reset them.
    std::map<std::string, std::string> response_headers;
};

CurlSession::~CurlSession() {
    if (multi && easy && attached) {
        curl_multi_remove_handle(multi, easy);
    }
    if (easy) curl_easy_cleanup(easy);
    if (multi) curl_multi_cleanup(multi);
    if (request_headers) curl_slist_free_all(request_headers);
}

void CurlSession::Pump() {
    int still_running = 0;
    CURLMcode mc = curl_multi_perform(multi, &still_running);
    if (mc != CURLM_OK) {
        multi_error = curl_multi_strerror(mc);
        done = true;
        result = CURLE_FAILED_INIT;
        return;
    }

    int msgs_in_queue;
    CURLMsg* msg;
    while ((msg = curl_multi_info_read(multi, &msgs_in_queue))) {
        if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy) {
            done = true;
            result = msg->data.result;
        }
    }

    if (!done && Available() == 0 && still_running > 0) {
        curl_multi_wait(multi, nullptr, 0, kPollIntervalMs, nullptr);
    }
}

AcquireError CurlSession::Failure() const {
    if (!multi_error.empty()) {
        return AcquireError(ErrorKind::FetchError, "curl multi error: " + multi_error);
    }
    if (result == CURLE_ABORTED_BY_CALLBACK && cancel.IsCancelled()) {
        return AcquireError(ErrorKind::Cancelled, "request cancelled");
    }
    std::string message = error_buffer;
    if (message.empty()) message = curl_easy_strerror(result);
    return AcquireError(ErrorKind::FetchError, "failed to fetch the page: " + message,
                        result == CURLE_OPERATION_TIMEDOUT);
}

size_t WriteCallback(char* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* session = static_cast<CurlSession*>(userp);
    if (!session) return 0;

    if (session->Available() >= kHighWaterBytes) {
        session->paused = true;
        return CURL_WRITEFUNC_PAUSE;
    }
    if (session->pending_offset == session->pending.size()) {
        session->pending.clear();
        session->pending_offset = 0;
    }
    try {
        session->pending.append(contents, chunk);
    } catch (const std::bad_alloc&) {
        return 0; // Indicates an error
    }
    session->body_started = true;
    return chunk;
}

size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    const size_t length = size * nitems;
    auto* session = static_cast<CurlSession*>(userp);
    if (!session) return 0;

    std::string line(buffer, length);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();

    if (line.compare(0, 5, "HTTP/") == 0) {
        session->response_headers.clear();
        session->headers_done = false;
        return length;
    }

    // Blank line ends a header block. Interim (1xx) responses and redirects
    // libcurl is about to follow are not the final response.
    if (line.empty()) {
        long status = 0;
        curl_easy_getinfo(session->easy, CURLINFO_RESPONSE_CODE, &status);
        const bool interim = status < 200;
        const bool followed = status >= 300 && status < 400 && session->response_headers.count("location") > 0;
        if (!interim && !followed) session->headers_done = true;
        return length;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return length;

    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    size_t start = colon + 1;
    while (start < line.size() && (line[start] == ' ' || line[start] == '\t')) ++start;
    size_t end = line.size();
    while (end > start && (line[end - 1] == ' ' || line[end - 1] == '\t')) --end;

    // First occurrence wins, matching a single-value header lookup.
    session->response_headers.emplace(std::move(name), line.substr(start, end - start));
    return length;
}

int ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* session = static_cast<CurlSession*>(clientp);
    return (session && session->cancel.IsCancelled()) ? 1 : 0;
}

class CurlBodyStream final : public Unclutter::IBodyStream {
public:
    explicit CurlBodyStream(std::unique_ptr<CurlSession> session) : session_(std::move(session)) {}
    ~CurlBodyStream() override { Close(); }

    size_t Read(char* buffer, size_t size) override {
        if (!session_) {
            throw AcquireError(ErrorKind::FetchError, "read from a closed response body");
        }
        if (size == 0) return 0;

        CurlSession& s = *session_;
        while (s.Available() == 0 && !s.done) {
            if (s.cancel.IsCancelled()) {
                throw AcquireError(ErrorKind::Cancelled, "request cancelled");
            }
            if (s.paused) {
                s.paused = false;
                curl_easy_pause(s.easy, CURLPAUSE_CONT);
            }
            s.Pump();
        }

        if (s.Available() > 0) {
            size_t n = std::min(size, s.Available());
            std::memcpy(buffer, s.pending.data() + s.pending_offset, n);
            s.pending_offset += n;
            return n;
        }
        if (s.result != CURLE_OK || !s.multi_error.empty()) {
            throw s.Failure();
        }
        return 0;
    }

    void Close() override {
        session_.reset();
    }

private:
    std::unique_ptr<CurlSession> session_;
};

} // anonymous namespace

namespace Unclutter {

CurlTransport::CurlTransport() : CurlTransport(Options{}) {}

CurlTransport::CurlTransport(const Options& options) : options_(options) {}

TransportResult CurlTransport::Execute(const HttpRequest& request,
                                       std::chrono::milliseconds timeout,
                                       const CancellationToken& cancel) {
    TransportResult out;
    auto fail = [&out](ErrorKind kind, const std::string& message, bool timed_out = false) {
        out.error = Error{kind, message, timed_out};
        return std::move(out);
    };

    if (cancel.IsCancelled()) {
        return fail(ErrorKind::Cancelled, "request cancelled");
    }

    auto session = std::make_unique<CurlSession>(cancel);
    session->easy = curl_easy_init();
    if (!session->easy) {
        return fail(ErrorKind::RequestBuildError, "failed to create request: curl_easy_init failed");
    }
    for (const auto& header : request.headers()) {
        std::string line = header.first + ": " + header.second;
        curl_slist* appended = curl_slist_append(session->request_headers, line.c_str());
        if (!appended) {
            return fail(ErrorKind::RequestBuildError, "failed to create request: cannot add header " + header.first);
        }
        session->request_headers = appended;
    }

    CURL* curl = session->easy;
    const std::string& href = request.url().href;
    if (curl_easy_setopt(curl, CURLOPT_URL, href.c_str()) != CURLE_OK) {
        return fail(ErrorKind::RequestBuildError, "failed to create request: curl rejected URL " + href);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, session->request_headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, session.get());
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, session.get());
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, session.get());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options_.max_redirects);
    if (timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    }
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, session->error_buffer);

    long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, allowed_protocols);
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, allowed_protocols);

    session->multi = curl_multi_init();
    if (!session->multi) {
        return fail(ErrorKind::RequestBuildError, "failed to create request: curl_multi_init failed");
    }
    if (curl_multi_add_handle(session->multi, curl) != CURLM_OK) {
        return fail(ErrorKind::RequestBuildError, "failed to create request: cannot attach easy handle");
    }
    session->attached = true;
    Logger::Log(LogLevel::Debug, "Sending " + request.method() + " " + href);

    while (!session->HeadersReady()) {
        if (cancel.IsCancelled()) {
            return fail(ErrorKind::Cancelled, "request cancelled");
        }
        session->Pump();
    }
    if (session->done && (session->result != CURLE_OK || !session->multi_error.empty())) {
        AcquireError failure = session->Failure();
        return fail(failure.kind(), failure.what(), failure.timed_out());
    }

    ResponseHandle response;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    char* effective_url = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
    if (effective_url) response.effective_url = effective_url;

    auto find_header = [&session](const char* name) -> std::string {
        auto it = session->response_headers.find(name);
        return it != session->response_headers.end() ? it->second : std::string();
    };
    response.content_encoding = find_header("content-encoding");
    response.content_type = find_header("content-type");
    Logger::Log(LogLevel::Debug, "Response " + std::to_string(response.status_code) + " from " +
                                     response.effective_url + " (type: " + response.content_type +
                                     ", encoding: " + response.content_encoding + ")");

    response.body = std::make_unique<CurlBodyStream>(std::move(session));
    out.response = std::move(response);
    return out;
}

}
