/**
 * @file clock_engine.hpp
 * @brief Monotonic 60-bit UUID clock.
 *
 * Ticks are 100-nanosecond units since the Unix epoch with the low four bits
 * cleared. Calls that land on an already used tick get a synthetic value one
 * above the last one emitted, up to MAX_DRIFT times; after that the caller
 * must yield and retry until the wall clock moves on.
 *
 * Only a reading below the last real (wall-clock) tick accepted counts as a
 * backward jump and is reported so the caller can change the sequence
 * number. A reading at or above it but not above the last synthetic tick is
 * a collision and gets another bump.
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#pragma once

#include "timeuuid/core/export.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace timeuuid {
namespace core {

/**
 * @class TickSource
 * @brief Wall clock in 100-nanosecond ticks since the Unix epoch.
 */
class TIMEUUID_CORE_API TickSource {
public:
    virtual ~TickSource() = default;
    virtual uint64_t now() = 0;
};

/**
 * @class SystemTickSource
 * @brief Reads std::chrono::system_clock.
 */
class TIMEUUID_CORE_API SystemTickSource : public TickSource {
public:
    uint64_t now() override;
};

/**
 * @class ClockEngine
 * @brief Produces strictly increasing ticks between backward jumps.
 *
 * Not thread-safe; the owner serializes calls.
 */
class TIMEUUID_CORE_API ClockEngine {
public:
    /// Ticks per second.
    static constexpr uint64_t CLOCK_MULTIPLIER = 10000000ULL;

    /// Applied to every wall-clock reading.
    static constexpr uint64_t RESOLUTION_MASK = 0xFFFFFFFFFFFFFFF0ULL;

    /// Synthetic ticks allowed before the caller has to wait.
    static constexpr uint32_t MAX_DRIFT = 10000;

    explicit ClockEngine(std::shared_ptr<TickSource> source);

    /**
     * @brief Restart from the current wall clock with no drift.
     */
    void reset();

    /**
     * @brief Compute the next tick.
     *
     * @param onBackward Invoked once when the wall clock is found below the
     *        last real tick accepted, before the engine adopts the new value.
     * @return The tick to use, or std::nullopt when the drift budget for the
     *         current tick is spent. State is unchanged in that case.
     */
    std::optional<uint64_t> nextTick(const std::function<void()>& onBackward);

    /// Masked wall-clock reading.
    uint64_t readClock();

    uint64_t lastTick() const { return last_; }
    uint32_t drift() const { return drift_; }

private:
    std::shared_ptr<TickSource> source_;
    uint64_t last_ = 0;          // last tick emitted
    uint64_t lastReal_ = 0;      // last wall-clock tick accepted
    uint32_t drift_ = 0;
};

}  // namespace core
}  // namespace timeuuid
