#include "HttpClient.hpp"
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <curl/curl.h>
#include <algorithm>
#include <stdexcept>
#include <vector>
#include "../../config/Config.hpp"
#include "../utils/Logger.hpp"

namespace {

// Context for a single cURL easy handle transfer
struct TransferContext {
    std::string buffer;
    size_t max_bytes = 0;
    bool truncated = false;
    std::shared_ptr<std::atomic<bool>> cancelled;
    EmojiKitchen::IHttpClient::Callback callback;
    char error_buffer[CURL_ERROR_SIZE] = {0};
};

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;

    if (ctx->max_bytes > 0 && ctx->buffer.size() + chunk > ctx->max_bytes) {
        ctx->truncated = true;
        return 0; // Abort: an oversized body is never a usable image
    }

    try {
        ctx->buffer.append(static_cast<char*>(contents), chunk);
    } catch (const std::bad_alloc&) {
        return 0;
    }
    return chunk;
}

int ProgressCallback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userp);
    return (ctx && ctx->cancelled && ctx->cancelled->load()) ? 1 : 0;
}

bool IsCancelled(const TransferContext& ctx) {
    return ctx.cancelled && ctx.cancelled->load();
}

void Deliver(TransferContext& ctx, EmojiKitchen::FetchResult result) {
    if (!ctx.callback) return;
    try {
        ctx.callback(std::move(result));
    } catch (const std::exception& e) {
        EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Error, "Exception in fetch callback: " + std::string(e.what()));
    }
}

// Helper to create and configure a cURL easy handle
CURL* CreateEasyHandle(const EmojiKitchen::HttpRequest& req, TransferContext* transfer_ctx) {
    CURL* curl = curl_easy_init();
    if (!curl) return nullptr;

    const auto& config = EmojiKitchen::Config::GetInstance();

    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, transfer_ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, transfer_ctx);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config.http_user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, config.http_max_redirects);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, req.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, transfer_ctx->error_buffer);
    curl_easy_setopt(curl, CURLOPT_PRIVATE, transfer_ctx);

    long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, allowed_protocols);
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, allowed_protocols);

    return curl;
}

} // anonymous namespace

namespace EmojiKitchen {

HttpClient::HttpClient() {
    multi_handle_ = curl_multi_init();
    if (!multi_handle_) {
        throw std::runtime_error("Failed to initialize cURL multi handle");
    }
    worker_thread_ = std::thread(&HttpClient::Run, this);
}

HttpClient::~HttpClient() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_one();
    Wakeup();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    if (multi_handle_) {
        curl_multi_cleanup(multi_handle_);
    }
}

void HttpClient::Fetch(HttpRequest request, Callback cb) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        pending_requests_.push_back({std::move(request), std::move(cb)});
    }
    cv_.notify_one();
    Wakeup();
}

void HttpClient::Wakeup() {
    // Interrupts curl_multi_poll so newly queued requests start without waiting out the poll timeout.
    curl_multi_wakeup(multi_handle_);
}

void HttpClient::FailAllActive(const std::string& reason) {
    for (CURL* easy_handle : active_handles_) {
        TransferContext* transfer_ctx = nullptr;
        curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &transfer_ctx);
        curl_multi_remove_handle(multi_handle_, easy_handle);
        curl_easy_cleanup(easy_handle);
        if (transfer_ctx) {
            FetchResult result;
            result.error = reason;
            result.cancelled = IsCancelled(*transfer_ctx);
            Deliver(*transfer_ctx, std::move(result));
            delete transfer_ctx;
        }
    }
    active_handles_.clear();
}

void HttpClient::Run() {
    Logger::Log(LogLevel::Debug, "HttpClient worker thread started.");
    int still_running = 0;

    while (true) {
        std::vector<Request> current_requests;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this, &still_running] { return stop_ || !pending_requests_.empty() || still_running > 0; });
            std::swap(current_requests, pending_requests_);
            if (stop_) {
                lock.unlock();
                for (auto& req : current_requests) {
                    FetchResult result;
                    result.error = "HTTP client shutting down";
                    if (req.callback) {
                        TransferContext ctx;
                        ctx.callback = std::move(req.callback);
                        Deliver(ctx, std::move(result));
                    }
                }
                break;
            }
        }

        for (auto& req : current_requests) {
            auto* transfer_ctx = new TransferContext();
            transfer_ctx->max_bytes = req.request.max_bytes;
            transfer_ctx->cancelled = req.request.cancelled;
            transfer_ctx->callback = std::move(req.callback);

            if (IsCancelled(*transfer_ctx)) {
                FetchResult result;
                result.error = "cancelled";
                result.cancelled = true;
                Deliver(*transfer_ctx, std::move(result));
                delete transfer_ctx;
                continue;
            }

            CURL* easy_handle = CreateEasyHandle(req.request, transfer_ctx);
            if (easy_handle && curl_multi_add_handle(multi_handle_, easy_handle) == CURLM_OK) {
                active_handles_.insert(easy_handle);
                Logger::Log(LogLevel::Debug, "Added easy handle for URL: " + req.request.url);
            } else {
                if (easy_handle) curl_easy_cleanup(easy_handle);
                Logger::Log(LogLevel::Error, "Failed to create cURL easy handle for: " + req.request.url);
                FetchResult result;
                result.error = "failed to create transfer";
                Deliver(*transfer_ctx, std::move(result));
                delete transfer_ctx;
            }
        }

        curl_multi_perform(multi_handle_, &still_running);

        int msgs_in_queue;
        CURLMsg* msg;
        while ((msg = curl_multi_info_read(multi_handle_, &msgs_in_queue))) {
            if (msg->msg != CURLMSG_DONE) continue;

            CURL* easy_handle = msg->easy_handle;
            TransferContext* transfer_ctx = nullptr;
            curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &transfer_ctx);

            FetchResult result;
            result.content = std::move(transfer_ctx->buffer);
            result.truncated = transfer_ctx->truncated;

            if (msg->data.result == CURLE_OK) {
                curl_easy_getinfo(easy_handle, CURLINFO_RESPONSE_CODE, &result.status_code);
            } else {
                result.cancelled = (msg->data.result == CURLE_ABORTED_BY_CALLBACK);
                result.error = transfer_ctx->error_buffer;
                if (result.error.empty()) {
                    result.error = curl_easy_strerror(msg->data.result);
                }
            }

            curl_multi_remove_handle(multi_handle_, easy_handle);
            curl_easy_cleanup(easy_handle);
            active_handles_.erase(easy_handle);

            Deliver(*transfer_ctx, std::move(result));
            delete transfer_ctx;
        }

        if (still_running > 0) {
            curl_multi_poll(multi_handle_, nullptr, 0, 1000, nullptr);
        }
    }

    FailAllActive("HTTP client shutting down");
    Logger::Log(LogLevel::Debug, "HttpClient worker thread stopped.");
}

}
