#pragma once
#include "../interfaces/IHttpClient.hpp"

namespace EmojiKitchen {

// Issues the request and waits for its callback. Used by background jobs that run on pool threads.
// If the callback does not arrive within the request timeout plus a grace period the request is
// cancelled and an error result is returned.
FetchResult FetchBlocking(IHttpClient& client, HttpRequest request);

}
