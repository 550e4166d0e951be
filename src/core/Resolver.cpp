#include "Resolver.hpp"
#include <mutex>
#include "../utils/Logger.hpp"

namespace EmojiKitchen {

Resolver::Resolver(Prober& prober, IImageCache& cache, KeyLocks& locks, MetadataIndex* metadata, ResolverOptions options)
    : prober_(prober), cache_(cache), locks_(locks), metadata_(metadata), options_(options) {}

bool Resolver::TryExactDate(const std::string& key, const EmojiPair& pair, ResolveResult& result) {
    auto date = metadata_->Lookup(pair.first, pair.second);
    if (!date && metadata_->RefreshStale(pair)) {
        date = metadata_->Lookup(pair.first, pair.second);
    }
    if (!date) return false;

    Logger::Log(LogLevel::Debug, "Metadata points " + key + " at date " + *date);
    ProbeOutcome outcome = prober_.ProbeExact(key, pair, *date);
    if (outcome.status != ProbeStatus::Found) return false;

    result.status = ResolveStatus::Image;
    result.image = std::move(outcome.image);
    result.source_date = std::move(outcome.source_date);
    return true;
}

ResolveResult Resolver::Resolve(const std::string& codepoint_a, const std::string& codepoint_b) {
    const EmojiPair pair{codepoint_a, codepoint_b};
    ResolveResult result;
    result.key = MakePairKey(pair, options_.order_insensitive);

    // Fast path: resolved pairs never need the per-key lock.
    if (auto found = cache_.PeekFound(result.key)) {
        result.status = ResolveStatus::Image;
        result.image = std::move(found->image);
        result.source_date = std::move(found->source_date);
        return result;
    }

    auto key_mutex = locks_.Acquire(result.key);
    std::lock_guard<std::mutex> guard(*key_mutex);

    // Another request may have resolved the pair while we waited for the lock.
    auto cached = cache_.Get(result.key);
    if (!cached && metadata_ && TryExactDate(result.key, pair, result)) {
        return result;
    }

    ProbeOutcome outcome = prober_.Probe(result.key, pair);
    switch (outcome.status) {
        case ProbeStatus::Found:
            result.status = ResolveStatus::Image;
            result.image = std::move(outcome.image);
            result.source_date = std::move(outcome.source_date);
            break;
        case ProbeStatus::InfraError:
            result.status = ResolveStatus::InfraError;
            break;
        case ProbeStatus::NotFound:
        case ProbeStatus::TransientMiss:
            result.status = ResolveStatus::NoImage;
            break;
    }
    return result;
}

}
