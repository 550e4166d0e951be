#include "BlockingFetch.hpp"
#include <chrono>
#include <future>

namespace EmojiKitchen {

FetchResult FetchBlocking(IHttpClient& client, HttpRequest request) {
    if (!request.cancelled) {
        request.cancelled = std::make_shared<std::atomic<bool>>(false);
    }
    auto cancelled = request.cancelled;
    const auto wait = std::chrono::milliseconds(request.timeout_ms > 0 ? request.timeout_ms : 10000) + std::chrono::seconds(5);

    auto promise = std::make_shared<std::promise<FetchResult>>();
    auto future = promise->get_future();
    client.Fetch(std::move(request), [promise](FetchResult result) {
        promise->set_value(std::move(result));
    });

    if (future.wait_for(wait) == std::future_status::ready) {
        return future.get();
    }

    cancelled->store(true);
    FetchResult timed_out;
    timed_out.error = "no response within deadline";
    timed_out.cancelled = true;
    return timed_out;
}

}
