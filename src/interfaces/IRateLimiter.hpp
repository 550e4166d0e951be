#pragma once

namespace EmojiKitchen {

class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;
    virtual bool TryAcquire() = 0;
};

}
