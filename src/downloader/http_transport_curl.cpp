/*
 * http_transport_curl.cpp
 *
 * Notes
 * - ITransport over the libcurl easy API: HEAD, streamed GET with optional Range,
 *   and whole-body download into a file.
 * - Cancellation is polled from the transfer-info callback and the write callback.
 * - Connect and overall timeouts map to CURLOPT_CONNECTTIMEOUT_MS / CURLOPT_TIMEOUT_MS;
 *   the send/receive budgets become a low-speed stall guard.
 */

#include <chartfetch/downloader/downloader.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <mutex>
#include <string_view>

namespace chartfetch::downloader {

namespace {

std::string trim_copy(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

void ensure_curl_global() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_WRITE_ERROR:
            err.code = ErrorCode::IoError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

// Collects status and headers; a redirect or 100-continue resets the list so only
// the final response survives.
size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (userdata == nullptr)
        return 0;
    auto* resp = static_cast<HttpResponse*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    if (line.rfind("HTTP/", 0) == 0) {
        resp->headers.clear();
        auto sp = line.find(' ');
        if (sp != std::string_view::npos) {
            int status = 0;
            auto rest = line.substr(sp + 1);
            std::from_chars(rest.data(), rest.data() + rest.size(), status);
            resp->statusCode = status;
        }
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;
    resp->headers.push_back(
        Header{trim_copy(line.substr(0, colon)), trim_copy(line.substr(colon + 1))});
    return total;
}

struct WriteContext {
    const ByteSink* sink{nullptr};
    std::ofstream* file{nullptr};
    const TransferProgress* onProgress{nullptr};
    const CancellationToken* cancel{nullptr};
    const HttpResponse* response{nullptr};
    std::uint64_t received{0};
    bool cancelRequested{false};
    std::optional<Error> sinkError;
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr || total == 0)
        return 0;
    auto* ctx = static_cast<WriteContext*>(userdata);

    if (ctx->cancel && ctx->cancel->isCancelled()) {
        ctx->cancelRequested = true;
        return 0; // CURLE_WRITE_ERROR
    }
    // Error bodies are never delivered to sinks or files
    if (ctx->response && ctx->response->statusCode >= 400) {
        return total;
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    if (ctx->sink && *ctx->sink && ctx->response) {
        auto r = (*ctx->sink)(*ctx->response, bytes);
        if (!r) {
            ctx->sinkError = r.error();
            return 0;
        }
    } else if (ctx->file) {
        ctx->file->write(ptr, static_cast<std::streamsize>(total));
        if (!*ctx->file) {
            ctx->sinkError = Error{ErrorCode::IoError, "Failed writing download body"};
            return 0;
        }
    }

    ctx->received += static_cast<std::uint64_t>(total);
    if (ctx->onProgress && *ctx->onProgress) {
        std::optional<std::uint64_t> expected;
        if (ctx->response)
            expected = ctx->response->contentLength();
        (*ctx->onProgress)(ctx->received, expected);
    }
    return total;
}

int xferinfo_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(clientp);
    if (ctx && ctx->cancel && ctx->cancel->isCancelled()) {
        ctx->cancelRequested = true;
        return 1; // CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

// RAII holder for an easy handle and its header list
class EasyHandle {
public:
    EasyHandle() : curl_(curl_easy_init()) {}
    ~EasyHandle() {
        if (list_)
            curl_slist_free_all(list_);
        if (curl_)
            curl_easy_cleanup(curl_);
    }
    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;

    CURL* get() const { return curl_; }
    void addHeader(const std::string& line) {
        list_ = curl_slist_append(list_, line.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, list_);
    }

private:
    CURL* curl_{nullptr};
    curl_slist* list_{nullptr};
};

void configure_common(CURL* curl, const TransportTimeouts& timeouts, WriteContext& wctx,
                      HttpResponse& resp) {
    const auto limits = transferDeadlines(timeouts);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(limits.connect.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(limits.overall.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(limits.stallWindow.count()));

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &wctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
}

Result<void> finish(CURLcode rc, const WriteContext& wctx, std::string_view where) {
    if (wctx.cancelRequested) {
        return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
    }
    if (wctx.sinkError) {
        return *wctx.sinkError;
    }
    if (rc != CURLE_OK) {
        return makeCurlError(rc, where);
    }
    return {};
}

} // namespace

class CurlTransport final : public ITransport {
public:
    CurlTransport() { ensure_curl_global(); }

    Result<HttpResponse> head(std::string_view url, const TransportTimeouts& timeouts,
                              const CancellationToken& cancel) override {
        EasyHandle h;
        if (!h.get()) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        HttpResponse resp;
        WriteContext wctx;
        wctx.cancel = &cancel;
        wctx.response = &resp;

        const std::string u(url);
        curl_easy_setopt(h.get(), CURLOPT_URL, u.c_str());
        curl_easy_setopt(h.get(), CURLOPT_NOBODY, 1L);
        configure_common(h.get(), timeouts, wctx, resp);

        const CURLcode rc = curl_easy_perform(h.get());
        if (auto r = finish(rc, wctx, "HEAD"); !r) {
            return r.error();
        }
        long status = 0;
        curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &status);
        resp.statusCode = static_cast<int>(status);
        spdlog::debug("HEAD {} -> {}", u, resp.statusCode);
        return resp;
    }

    Result<HttpResponse> get(std::string_view url, const std::optional<std::string>& rangeHeader,
                             const ByteSink& sink, const TransportTimeouts& timeouts,
                             const CancellationToken& cancel) override {
        EasyHandle h;
        if (!h.get()) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        HttpResponse resp;
        WriteContext wctx;
        wctx.sink = &sink;
        wctx.cancel = &cancel;
        wctx.response = &resp;

        const std::string u(url);
        curl_easy_setopt(h.get(), CURLOPT_URL, u.c_str());
        curl_easy_setopt(h.get(), CURLOPT_HTTPGET, 1L);
        if (rangeHeader && !rangeHeader->empty()) {
            h.addHeader("Range: " + *rangeHeader);
        }
        configure_common(h.get(), timeouts, wctx, resp);

        const CURLcode rc = curl_easy_perform(h.get());
        if (auto r = finish(rc, wctx, "GET"); !r) {
            return r.error();
        }
        long status = 0;
        curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &status);
        resp.statusCode = static_cast<int>(status);
        spdlog::debug("GET {} (range: {}) -> {} [{} bytes]", u, rangeHeader.value_or("none"),
                      resp.statusCode, wctx.received);
        return resp;
    }

    Result<void> downloadFile(std::string_view url, const std::filesystem::path& destPath,
                              const TransferProgress& onProgress,
                              const TransportTimeouts& timeouts,
                              const CancellationToken& cancel) override {
        EasyHandle h;
        if (!h.get()) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "Cannot open " + destPath.string() + " for writing"};
        }

        HttpResponse resp;
        WriteContext wctx;
        wctx.file = &out;
        wctx.onProgress = &onProgress;
        wctx.cancel = &cancel;
        wctx.response = &resp;

        const std::string u(url);
        curl_easy_setopt(h.get(), CURLOPT_URL, u.c_str());
        curl_easy_setopt(h.get(), CURLOPT_HTTPGET, 1L);
        configure_common(h.get(), timeouts, wctx, resp);

        const CURLcode rc = curl_easy_perform(h.get());
        out.flush();
        out.close();

        if (auto r = finish(rc, wctx, "download"); !r) {
            return r;
        }
        long status = 0;
        curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &status);
        if (const auto code = classifyHttpStatus(static_cast<int>(status));
            code != ErrorCode::Success) {
            return Error{code, "HTTP " + std::to_string(status) + " for " + u};
        }
        spdlog::debug("Downloaded {} -> {} ({} bytes)", u, destPath.string(), wctx.received);
        return {};
    }
};

std::unique_ptr<ITransport> makeCurlTransport() {
    return std::make_unique<CurlTransport>();
}

} // namespace chartfetch::downloader
