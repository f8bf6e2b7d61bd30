/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - probe() and fetchRange() on top of the libcurl easy API.
 * - Honors timeouts, TLS verify/CA, proxy, headers, redirects, and Range.
 * - Reports the offset the server actually honored (206 vs 200) before the first body byte
 *   so the caller can restart a staging file instead of appending duplicate bytes.
 * - Cooperative cancellation from both the write and the transfer-info callbacks, so a
 *   stalled connection still notices a pause or cancel.
 */

#include <modelflux/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace modelflux::downloader {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

std::optional<std::uint64_t> parse_u64(std::string_view sv) {
    std::uint64_t v{0};
    auto res = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    if (res.ec != std::errc())
        return std::nullopt;
    return v;
}

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::PermissionDenied;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// curl_global_init is not thread-safe; run it once before the first easy handle
void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct HeaderParseContext {
    bool acceptRangesBytes{false};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::uint64_t> rangeTotal{}; // from Content-Range: bytes a-b/total
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // A new status line starts a new response (redirect hop); forget earlier headers
    if (line.size() >= 5 && line.substr(0, 5) == "HTTP/") {
        *ctx = HeaderParseContext{};
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "accept-ranges") {
        if (to_lower(val) == "bytes") {
            ctx->acceptRangesBytes = true;
        }
    } else if (key == "content-length") {
        ctx->contentLength = parse_u64(val);
    } else if (key == "content-range") {
        // bytes 100-999/1000
        auto slash = val.rfind('/');
        if (slash != std::string::npos) {
            ctx->rangeTotal = parse_u64(std::string_view(val).substr(slash + 1));
        }
        ctx->acceptRangesBytes = true;
    } else if (key == "etag") {
        auto v = val;
        if (v.size() >= 2 && v.front() == 'W' && v[1] == '/') {
            v = v.substr(2);
        }
        if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
            v = v.substr(1, v.size() - 2);
        }
        ctx->etag = std::move(v);
    } else if (key == "last-modified") {
        ctx->lastModified = val;
    }

    return total;
}

struct WriteContext {
    CURL* curl{nullptr};
    std::uint64_t requestedOffset{0};
    const HeaderParseContext* headers{nullptr};
    const ResponseStart* onStart{nullptr};
    const ByteSink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    bool started{false};
    bool cancelRequested{false};
    std::optional<Error> sinkError;
};

bool cancelled(const WriteContext& ctx) {
    return ctx.shouldCancel && *ctx.shouldCancel && (*ctx.shouldCancel)();
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr || total == 0)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (cancelled(*ctx)) {
        ctx->cancelRequested = true;
        return 0; // CURLE_WRITE_ERROR
    }

    if (!ctx->started) {
        ctx->started = true;
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        const bool partial = status == 206;
        const std::uint64_t effective = partial ? ctx->requestedOffset : 0;
        const std::optional<std::uint64_t> objectSize =
            partial ? ctx->headers->rangeTotal : ctx->headers->contentLength;
        if (ctx->onStart && *ctx->onStart) {
            auto r = (*ctx->onStart)(effective, objectSize);
            if (!r) {
                ctx->sinkError = r.error();
                return 0;
            }
        }
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink)(bytes);
    if (!r) {
        ctx->sinkError = r.error();
        return 0;
    }
    return total;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx && cancelled(*ctx)) {
        ctx->cancelRequested = true;
        return 1; // CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

size_t discard_cb(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

void configure_common(CURL* curl, const TransferOptions& options) {
    // Timeouts; a stalled transfer (<1 B/s for 60s) is treated as a timeout
    if (options.timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
    }
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options.connectTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);

    // Model hubs redirect to CDN storage
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.tls.insecure ? 0L : 2L);
    if (!options.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.tls.caPath.c_str());
    }

    if (options.proxy && !options.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy->c_str());
    }

    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "modelflux/1.0");
}

// Owns an easy handle and its header list
struct CurlRequest {
    CURL* curl{nullptr};
    curl_slist* headers{nullptr};

    CurlRequest() : curl(curl_easy_init()) {}
    ~CurlRequest() {
        if (headers)
            curl_slist_free_all(headers);
        if (curl)
            curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;
};

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensureCurlGlobalInit(); }
    ~CurlHttpAdapter() override = default;

    Result<ProbeResult> probe(std::string_view url, const TransferOptions& options) override {
        CurlRequest req;
        if (!req.curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        req.headers = build_header_list(options.headers);
        HeaderParseContext hctx{};
        const std::string urlStr(url);

        curl_easy_setopt(req.curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(req.curl, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(req.curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(req.curl, CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.headers);
        curl_easy_setopt(req.curl, CURLOPT_FAILONERROR, 1L);
        configure_common(req.curl, options);

        CURLcode rc = curl_easy_perform(req.curl);
        long status = 0;
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &status);
        const bool headRejected =
            rc == CURLE_HTTP_RETURNED_ERROR && (status == 405 || status == 501 || status == 403);
        if (rc != CURLE_OK && !headRejected) {
            if (rc == CURLE_HTTP_RETURNED_ERROR)
                return httpStatusError(status);
            return makeCurlError(rc, "probe(HEAD)");
        }
        if (headRejected) {
            // Some servers (presigned CDN URLs) reject HEAD; try GET range 0-0 instead
            spdlog::debug("[HttpAdapter] HEAD probe rejected ({}), attempting GET Range 0-0",
                          status);
            hctx = HeaderParseContext{};
            curl_easy_setopt(req.curl, CURLOPT_NOBODY, 0L);
            curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
            curl_easy_setopt(req.curl, CURLOPT_RANGE, "0-0");
            curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, discard_cb);
            rc = curl_easy_perform(req.curl);
            curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &status);
            if (rc != CURLE_OK) {
                if (rc == CURLE_HTTP_RETURNED_ERROR)
                    return httpStatusError(status);
                return makeCurlError(rc, "probe(GET range)");
            }
            if (status == 206) {
                hctx.acceptRangesBytes = true;
                hctx.contentLength = hctx.rangeTotal;
            }
        }

        ProbeResult out;
        out.resumeSupported = hctx.acceptRangesBytes;
        out.contentLength = hctx.contentLength;
        out.etag = hctx.etag;
        out.lastModified = hctx.lastModified;
        if (out.etag) {
            spdlog::debug("[HttpAdapter] probe captured ETag: {}", *out.etag);
        }
        return out;
    }

    Result<void> fetchRange(std::string_view url, std::uint64_t offset,
                            const TransferOptions& options, const ResponseStart& onStart,
                            const ByteSink& sink, const ShouldCancel& shouldCancel) override {
        if (!sink) {
            return Error{ErrorCode::InvalidArgument, "No sink provided"};
        }
        CurlRequest req;
        if (!req.curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        req.headers = build_header_list(options.headers);
        const std::string urlStr(url);

        curl_easy_setopt(req.curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.headers);
        curl_easy_setopt(req.curl, CURLOPT_FAILONERROR, 1L);
        std::string range;
        if (offset > 0) {
            range = std::to_string(offset) + "-";
            curl_easy_setopt(req.curl, CURLOPT_RANGE, range.c_str());
        }

        HeaderParseContext hctx{};
        curl_easy_setopt(req.curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(req.curl, CURLOPT_HEADERDATA, &hctx);

        WriteContext wctx;
        wctx.curl = req.curl;
        wctx.requestedOffset = offset;
        wctx.headers = &hctx;
        wctx.onStart = &onStart;
        wctx.sink = &sink;
        wctx.shouldCancel = &shouldCancel;
        curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFODATA, &wctx);
        curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);

        configure_common(req.curl, options);

        CURLcode rc = curl_easy_perform(req.curl);
        long status = 0;
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &status);

        if (wctx.cancelRequested) {
            return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
        }
        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (rc == CURLE_HTTP_RETURNED_ERROR) {
            return httpStatusError(status);
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "fetchRange(GET)");
        }
        if (!wctx.started && onStart) {
            // Empty body: still report the response so callers can size the file
            return onStart(status == 206 ? offset : 0,
                           status == 206 ? hctx.rangeTotal : hctx.contentLength);
        }
        return {};
    }
};

} // namespace

Error httpStatusError(long status) {
    const std::string msg = "HTTP error " + std::to_string(status);
    if (status >= 500 || status == 408 || status == 429) {
        return Error{ErrorCode::ServerError, msg};
    }
    if (status == 404 || status == 410) {
        return Error{ErrorCode::NotFound, msg};
    }
    if (status == 401 || status == 403) {
        return Error{ErrorCode::PermissionDenied, msg};
    }
    return Error{ErrorCode::InvalidArgument, msg};
}

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace modelflux::downloader
