#include "KitchenHandler.hpp"
#include "../utils/EmojiUtil.hpp"
#include "../utils/Logger.hpp"
#include "../utils/ReplyBuilder.hpp"

namespace EmojiKitchen {

// Everything needed to answer one two-emoji message.
struct KitchenHandler::PairRequest {
    dpp::snowflake channel_id;
    dpp::snowflake message_id;
    std::string first;
    std::string second;
};

KitchenHandler::KitchenHandler(dpp::cluster& bot, ThreadPool& pool, IRateLimiter& limiter, Resolver& resolver)
    : bot(bot), thread_pool(pool), rate_limiter(limiter), resolver_(resolver) {}

void KitchenHandler::OnMessageCreate(const dpp::message_create_t& event) {
    if (event.msg.author.is_bot()) return;

    auto emojis = EmojiUtil::ExtractEmojiPair(event.msg.content);
    if (!emojis) return;

    if (!rate_limiter.TryAcquire()) {
        Logger::Log(LogLevel::Warn, "Rate limit exceeded. Dropping emoji pair from message: " + std::to_string(event.msg.id));
        return;
    }

    PairRequest request{
        event.msg.channel_id,
        event.msg.id,
        EmojiUtil::ToCodepointString(emojis->first),
        EmojiUtil::ToCodepointString(emojis->second),
    };
    Logger::Log(LogLevel::Debug, "Queueing emoji pair " + request.first + " + " + request.second);

    try {
        thread_pool.enqueue([this, request]() { ProcessPair(request); });
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "Could not queue emoji pair: " + std::string(e.what()));
    }
}

void KitchenHandler::ProcessPair(const PairRequest& request) {
    ResolveResult result = resolver_.Resolve(request.first, request.second);

    switch (result.status) {
        case ResolveStatus::Image:
            break;
        case ResolveStatus::NoImage:
            // No combination is not an error; the bot stays silent.
            Logger::Log(LogLevel::Debug, "No image for " + result.key);
            return;
        case ResolveStatus::InfraError:
            Logger::Log(LogLevel::Warn, "Could not reach the Emoji Kitchen CDN for " + result.key);
            return;
    }

    Logger::Log(LogLevel::Info, "Replying with " + result.key + " (" + result.source_date + ")");
    bot.message_create(BuildImageReply(request.channel_id, request.message_id, result.key, result.image),
        [key = result.key](const dpp::confirmation_callback_t& cc) {
            if (cc.is_error()) {
                Logger::Log(LogLevel::Warn, "Failed to send image for " + key + ": " + cc.get_error().message);
            }
        });
}

} // namespace EmojiKitchen
