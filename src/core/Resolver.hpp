#pragma once
#include <string>
#include "Prober.hpp"
#include "MetadataIndex.hpp"
#include "../interfaces/IImageCache.hpp"
#include "../utils/KeyLocks.hpp"

namespace EmojiKitchen {

    enum class ResolveStatus {
        Image,
        NoImage,     // the pair has no known combination, or not all candidates were tried yet
        InfraError   // the CDN could not be reached; nothing was cached
    };

    struct ResolveResult {
        ResolveStatus status = ResolveStatus::NoImage;
        std::string image;
        std::string source_date;
        std::string key;
    };

    struct ResolverOptions {
        bool order_insensitive = true;
    };

    // Entry point for the message handler: two emoji in, image bytes or "no image" out.
    class Resolver {
    public:
        // metadata may be null to probe candidate dates only.
        Resolver(Prober& prober, IImageCache& cache, KeyLocks& locks, MetadataIndex* metadata, ResolverOptions options);

        ResolveResult Resolve(const std::string& codepoint_a, const std::string& codepoint_b);

    private:
        bool TryExactDate(const std::string& key, const EmojiPair& pair, ResolveResult& result);

        Prober& prober_;
        IImageCache& cache_;
        KeyLocks& locks_;
        MetadataIndex* metadata_;
        ResolverOptions options_;
    };
}
