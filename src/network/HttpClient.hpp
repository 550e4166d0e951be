#pragma once
#include <string>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <unordered_set>
#include <vector>
#include "../interfaces/IHttpClient.hpp"

// Forward declare CURLM
typedef void CURLM;
typedef void CURL;

namespace EmojiKitchen {

// Asynchronous HTTP client: one curl multi handle driven by a worker thread.
class HttpClient : public IHttpClient {
public:
    HttpClient();
    ~HttpClient() override;

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    void Fetch(HttpRequest request, Callback cb) override;

private:
    void Run();
    void Wakeup();
    void FailAllActive(const std::string& reason);

    CURLM* multi_handle_ = nullptr;
    std::thread worker_thread_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_ = false;

    struct Request {
        HttpRequest request;
        Callback callback;
    };
    std::vector<Request> pending_requests_;
    std::unordered_set<CURL*> active_handles_; // worker thread only
};

}
