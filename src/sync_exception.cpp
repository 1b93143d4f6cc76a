#include "mailjmap/sync_exception.hpp"

static bool isTransientCurlError(CURLcode c) {
    switch (c) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_AGAIN:
            return true;
        default:
            return false;
    }
}

SyncException::SyncException(std::string key, std::string di, bool retryable) :
    retryable(retryable), key(key), debuginfo(di)
{
}

SyncException::SyncException(CURLcode c, std::string di) :
    retryable(isTransientCurlError(c)), key(curl_easy_strerror(c)), debuginfo(di)
{
}

bool SyncException::isRetryable() {
    return retryable;
}

int SyncException::httpStatus() {
    if (key == "invalid-base64") {
        return 400;
    }
    return retryable ? 503 : 500;
}

const char * SyncException::what() const noexcept {
    return key.c_str();
}

nlohmann::json SyncException::toJSON() {
    return {
        {"key", key},
        {"debuginfo", debuginfo},
        {"retryable", retryable},
    };
}
