#include "backup/curl_http_fetcher.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace {

struct TransferContext {
    CURL* curl{nullptr};
    const HttpFetcher::ChunkSink* sink{nullptr};
    const CancellationToken* token{nullptr};
    long statusCode{0};
    uint64_t bytesWritten{0};
    std::string snippet;
    bool snippetComplete{false};
    bool sinkFailed{false};
};

size_t writeCallback(char* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<TransferContext*>(userp);
    size_t realsize = size * nmemb;

    if (ctx->statusCode == 0) {
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->statusCode);
    }

    if (ctx->statusCode < 200 || ctx->statusCode >= 300) {
        size_t room = HttpFetcher::kMaxSnippetBytes - ctx->snippet.size();
        ctx->snippet.append(contents, std::min(room, realsize));
        if (ctx->snippet.size() >= HttpFetcher::kMaxSnippetBytes) {
            // Enough for diagnostics, stop reading the error body
            ctx->snippetComplete = true;
            return 0;
        }
        return realsize;
    }

    if (!(*ctx->sink)(contents, realsize)) {
        ctx->sinkFailed = true;
        return 0;
    }
    ctx->bytesWritten += realsize;
    return realsize;
}

int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(clientp);
    return ctx->token->isCancelled() ? 1 : 0;
}

struct CurlHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

} // namespace

CurlHttpFetcher::CurlHttpFetcher(std::chrono::seconds timeout, std::string userAgent)
    : timeout_(timeout)
    , userAgent_(std::move(userAgent)) {
}

void CurlHttpFetcher::globalInit() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
    if (rc != CURLE_OK) {
        throw std::runtime_error(std::string("Failed to initialize CURL: ") + curl_easy_strerror(rc));
    }
}

void CurlHttpFetcher::globalCleanup() {
    curl_global_cleanup();
}

FetchResult CurlHttpFetcher::fetch(const std::string& url,
                                   const ChunkSink& sink,
                                   const CancellationToken& token) {
    FetchResult result;

    if (token.isCancelled()) {
        result.cancelled = true;
        result.error = "cancelled before request";
        return result;
    }

    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        result.error = "failed to initialize CURL handle";
        return result;
    }

    TransferContext ctx;
    ctx.curl = curl.get();
    ctx.sink = &sink;
    ctx.token = &token;

    char errorBuffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);   // Worker threads must not get SIGALRM
    curl_easy_setopt(curl.get(), CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

    Logger::debug("http: GET", {{"url", url}});
    CURLcode res = curl_easy_perform(curl.get());

    if (ctx.statusCode == 0) {
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &ctx.statusCode);
    }
    result.statusCode = ctx.statusCode;
    result.bytesWritten = ctx.bytesWritten;
    result.bodySnippet = ctx.snippet;

    if (res == CURLE_OK || (res == CURLE_WRITE_ERROR && ctx.snippetComplete)) {
        result.transferred = true;
        return result;
    }

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        result.cancelled = true;
        result.error = "request cancelled";
    } else if (ctx.sinkFailed) {
        result.error = "failed to write response body";
    } else {
        result.error = errorBuffer[0] != '\0' ? std::string(errorBuffer) : std::string(curl_easy_strerror(res));
    }
    return result;
}
