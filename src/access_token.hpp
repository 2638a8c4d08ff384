#pragma once

#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

namespace msgraph_sync {

/// The single live bearer token.  Readers take a shared lock while copying
/// it into a header; a login takes the exclusive lock to replace it.
class AccessToken {
public:
    std::string get() const {
        std::shared_lock<std::shared_mutex> lock(mMutex);
        return mValue;
    }

    void set(std::string value) {
        std::unique_lock<std::shared_mutex> lock(mMutex);
        mValue = std::move(value);
    }

    bool empty() const {
        std::shared_lock<std::shared_mutex> lock(mMutex);
        return mValue.empty();
    }

private:
    mutable std::shared_mutex mMutex;
    std::string               mValue;
};

} // namespace msgraph_sync
