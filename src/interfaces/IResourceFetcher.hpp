#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace Fanout {

// Metadata-only (HEAD) request.
struct FetchRequest {
    std::string url;
    std::vector<std::string> headers; // "Name: value"
    std::chrono::milliseconds timeout{5000};
};

struct FetchResult {
    long status_code = 0;
    std::string content_type;
    std::string effective_url;
    std::string error; // non-empty on transport failure (DNS, connect, timeout, ...)

    bool TransportFailed() const { return !error.empty(); }
};

class IResourceFetcher {
public:
    using Callback = std::function<void(FetchResult)>;
    virtual ~IResourceFetcher() = default;
    // The callback runs exactly once, on the fetcher's own thread.
    virtual void Fetch(const FetchRequest& request, Callback cb) = 0;
};

}
