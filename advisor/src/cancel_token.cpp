#include "cancel_token.hpp"
#include "errors.hpp"

void CancelToken::throw_if_cancelled() const {
    if (cancelled_) {
        throw CancelledError("Request cancelled");
    }
}
