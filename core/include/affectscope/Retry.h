#pragma once

#include "affectscope/CoreContract.h"

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <glog/logging.h>

#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace affectscope {

struct RetryPolicy {
    int maxAttempts{contract::STT_MAX_ATTEMPTS};
    std::chrono::milliseconds initialBackoff{contract::STT_INITIAL_BACKOFF};
    double multiplier{contract::STT_BACKOFF_MULTIPLIER};
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper thread_sleeper() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

inline bool is_transient(const absl::Status& status) {
    return status.code() == absl::StatusCode::kUnavailable ||
           status.code() == absl::StatusCode::kDeadlineExceeded;
}

/**
 * Call `op` until it succeeds, fails with a non-transient status, or the
 * policy runs out of attempts. Waits initialBackoff, then multiplies the wait
 * after every failed attempt. Returns the last result.
 */
template <typename T>
absl::StatusOr<T> retry_with_backoff(const RetryPolicy& policy,
                                     const Sleeper& sleep,
                                     const std::string& what,
                                     const std::function<absl::StatusOr<T>()>& op) {
    const int attempts = policy.maxAttempts < 1 ? 1 : policy.maxAttempts;
    auto backoff = policy.initialBackoff;
    absl::StatusOr<T> result = op();
    for (int attempt = 1; attempt < attempts && !result.ok() && is_transient(result.status()); ++attempt) {
        LOG(WARNING) << what << " attempt " << attempt << "/" << attempts << " failed ("
                     << result.status().message() << "); retrying in " << backoff.count() << " ms";
        sleep(backoff);
        backoff = std::chrono::milliseconds(static_cast<long long>(backoff.count() * policy.multiplier));
        result = op();
    }
    return result;
}

}  // namespace affectscope
