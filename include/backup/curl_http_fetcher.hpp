#pragma once

#include "backup/http_fetcher.hpp"
#include <chrono>
#include <string>

// libcurl transport: one easy handle per request, redirects followed,
// cancellation checked from the transfer progress callback.
class CurlHttpFetcher : public HttpFetcher {
public:
    explicit CurlHttpFetcher(std::chrono::seconds timeout = std::chrono::seconds(120),
                             std::string userAgent = "httpbackup/1.0");

    FetchResult fetch(const std::string& url,
                      const ChunkSink& sink,
                      const CancellationToken& token) override;

    // Must run once before any thread issues requests
    static void globalInit();
    static void globalCleanup();

private:
    std::chrono::seconds timeout_;
    std::string userAgent_;
};
