#pragma once

#include "common/cancellation_token.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

struct FetchResult {
    bool transferred{false};   // Transport finished; check statusCode for the HTTP outcome
    bool cancelled{false};
    long statusCode{0};
    uint64_t bytesWritten{0};
    std::string error;         // Transport or sink error
    std::string bodySnippet;   // First bytes of a non-2xx body

    bool isSuccessStatus() const { return statusCode >= 200 && statusCode < 300; }
};

// Streams the body of an HTTP GET into a caller supplied sink.
class HttpFetcher {
public:
    // Receives each body chunk of a 2xx response; returning false aborts the transfer.
    using ChunkSink = std::function<bool(const char* data, size_t size)>;

    static constexpr size_t kMaxSnippetBytes = 512;

    virtual ~HttpFetcher() = default;

    virtual FetchResult fetch(const std::string& url,
                              const ChunkSink& sink,
                              const CancellationToken& token) = 0;
};
