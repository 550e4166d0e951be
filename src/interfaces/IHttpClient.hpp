#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace EmojiKitchen {

struct HttpRequest {
    std::string url;
    long timeout_ms = 10000;
    size_t max_bytes = 0; // 0 = unlimited; larger bodies abort the transfer with truncated set
    std::shared_ptr<std::atomic<bool>> cancelled; // optional; setting it aborts the transfer best-effort
};

struct FetchResult {
    std::string content;
    long status_code = 0;
    std::string error;
    bool truncated = false;
    bool cancelled = false;
};

class IHttpClient {
public:
    using Callback = std::function<void(FetchResult)>;
    virtual ~IHttpClient() = default;
    // Non-blocking. The callback runs exactly once, on a client thread.
    virtual void Fetch(HttpRequest request, Callback cb) = 0;
};

}
