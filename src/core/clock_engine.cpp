/**
 * @file clock_engine.cpp
 * @brief ClockEngine implementation.
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#include "timeuuid/core/clock_engine.hpp"
#include "timeuuid/utils/logger.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace timeuuid {
namespace core {

uint64_t SystemTickSource::now() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count();
    return static_cast<uint64_t>(ns) / 100;
}

ClockEngine::ClockEngine(std::shared_ptr<TickSource> source)
    : source_(std::move(source))
{
    if (!source_) {
        throw std::invalid_argument("ClockEngine requires a tick source");
    }
    reset();
}

void ClockEngine::reset() {
    last_ = readClock();
    lastReal_ = last_;
    drift_ = 0;
}

uint64_t ClockEngine::readClock() {
    return source_->now() & RESOLUTION_MASK;
}

std::optional<uint64_t> ClockEngine::nextTick(const std::function<void()>& onBackward) {
    uint64_t tick = readClock();

    if (tick > last_) {
        drift_ = 0;
        last_ = tick;
        lastReal_ = tick;
        return last_;
    }

    // Between the last real tick and the synthetic ones handed out since.
    if (tick >= lastReal_) {
        if (drift_ + 1 >= MAX_DRIFT) {
            return std::nullopt;
        }
        ++drift_;
        ++last_;
        return last_;
    }

    LOG_DEBUG("ClockEngine", "Clock moved backward by {} ticks", lastReal_ - tick);
    if (onBackward) {
        onBackward();
    }
    drift_ = 0;
    last_ = tick;
    lastReal_ = tick;
    return last_;
}

}  // namespace core
}  // namespace timeuuid
