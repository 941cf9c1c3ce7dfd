#pragma once

#include "../Errors.hpp"
#include "../ports/IPolicyEngine.hpp"
#include <iostream>
#include <string>
#include <thread>

namespace fleetsense::domain {

/**
 * @brief Run a storage operation, retrying StorageError with backoff
 *
 * Only StorageError is retried. Once the retry policy gives up the last
 * error is rethrown to the caller.
 */
template <typename Fn>
auto runWithRetry(const ports::RetryPolicy& policy, const std::string& what, Fn&& fn) -> decltype(fn()) {
    int attempts = 0;
    while (true) {
        try {
            ++attempts;
            return fn();
        } catch (const StorageError& e) {
            if (!policy.shouldRetry(attempts)) {
                std::cerr << "[Retry] Giving up on " << what << " after " << attempts
                          << " attempts: " << e.what() << std::endl;
                throw;
            }
            auto delay = policy.getBackoffDelay(attempts);
            std::cerr << "[Retry] " << what << " failed (" << e.what() << "), retrying in "
                      << delay.count() << "ms" << std::endl;
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace fleetsense::domain
