#pragma once

#include <chrono>
#include <string>
#include <utility>

#include "gitprompt/logger.h"

namespace gitprompt::perf {

// Logs the lifetime of the scope at debug level. Prompt renders have a budget
// of tens of milliseconds, so every pipeline stage is wrapped in one of these.
class ScopedTimer {
public:
    explicit ScopedTimer(std::string label)
        : label_{std::move(label)}, start_{std::chrono::steady_clock::now()} {}

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    ~ScopedTimer() {
        auto& logger = Logger::instance();
        if (!logger.enabled(Logger::Level::Debug)) {
            return;
        }
        auto end = std::chrono::steady_clock::now();
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        logger.debug("{} took {} us", label_, us);
    }

private:
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace gitprompt::perf
