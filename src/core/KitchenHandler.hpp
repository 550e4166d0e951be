#pragma once
#include <dpp/dpp.h>
#include <string>
#include "Resolver.hpp"
#include "../utils/ThreadPool.hpp"
#include "../interfaces/IRateLimiter.hpp"

namespace EmojiKitchen {
    class KitchenHandler {
    public:
        KitchenHandler(dpp::cluster& bot, ThreadPool& pool, IRateLimiter& limiter, Resolver& resolver);

        void OnMessageCreate(const dpp::message_create_t& event);

    private:
        struct PairRequest;
        void ProcessPair(const PairRequest& request);

        dpp::cluster& bot;
        ThreadPool& thread_pool;
        IRateLimiter& rate_limiter;
        Resolver& resolver_;
    };
}
