/**
 * @file generator.hpp
 * @brief Time-based UUID generator.
 *
 * A Generator combines the clock, the sequence number and the node
 * identifier into UUIDs and renders them in any supported format. Create one
 * per process and share it by reference; all methods are thread-safe.
 *
 * Usage:
 * @code
 * Generator generator;                          // state in StateStore::defaultPath()
 * std::string id = generator.generate();        // "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"
 * std::string small = generator.generate(Format::Teenie);
 *
 * std::string back = Generator::translate(small, Format::Teenie, Format::Default);
 * @endcode
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#pragma once

#include "timeuuid/core/clock_engine.hpp"
#include "timeuuid/core/export.hpp"
#include "timeuuid/core/format_codec.hpp"
#include "timeuuid/core/node_identity.hpp"
#include "timeuuid/core/state_store.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <sys/types.h>

namespace timeuuid {
namespace core {

/**
 * @enum StateMode
 * @brief Where the generator keeps its sequence number.
 */
enum class StateMode {
    Default,    ///< StateStore::defaultPath()
    Path,       ///< GeneratorOptions::state_path
    Disabled    ///< In memory only, randomly seeded
};

/**
 * @struct GeneratorOptions
 * @brief Construction parameters for a Generator.
 */
struct TIMEUUID_CORE_API GeneratorOptions {
    StateMode state_mode = StateMode::Default;
    std::string state_path;                          ///< Used with StateMode::Path
    mode_t file_mode = 0644;                         ///< Permissions of a new state file
    std::shared_ptr<NodeIdentityProvider> node_identity;  ///< Defaults to HardwareNodeIdentity
    std::shared_ptr<TickSource> tick_source;              ///< Defaults to SystemTickSource
};

/**
 * @class Generator
 * @brief Thread-safe generator of version-stamped, time-based UUIDs.
 */
class TIMEUUID_CORE_API Generator {
public:
    /**
     * @brief Create a generator.
     *
     * With a state file, an existing record supplies the node and its
     * sequence is incremented; a missing record is created. If the file
     * cannot be used the generator logs a warning and continues with an
     * in-memory sequence.
     *
     * @throws NodeIdentityUnavailableError if no node identifier can be found.
     */
    explicit Generator(GeneratorOptions options = {});

    ~Generator() = default;

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    /**
     * @brief Generate a new UUID string.
     */
    std::string generate(Format format = Format::Default);

    /**
     * @brief Generate a new UUID string in the format named by @p format.
     * @throws InvalidFormatError before any state changes if the name is unknown.
     */
    std::string generate(const std::string& format);

    /**
     * @brief Generate a new UUID and return its fields.
     */
    UuidFields nextFields();

    /**
     * @brief Move to the next sequence number.
     *
     * Goes through the state file when there is one; otherwise increments
     * the in-memory value. Also restarts the clock engine.
     *
     * @return The new sequence number.
     */
    uint32_t nextSequence();

    /**
     * @brief Convert @p value from one format to another.
     *
     * @throws InvalidFormatError if either format is unknown.
     * @throws NoopTranslationError if both formats are the same.
     * @throws InvalidInputError if @p value is not in @p source format.
     */
    static std::string translate(const std::string& value, Format source, Format target);

    /**
     * @brief translate() taking format names.
     */
    static std::string translate(const std::string& value,
                                 const std::string& source,
                                 const std::string& target);

    uint64_t node() const;
    uint32_t sequence() const;

    /**
     * @brief Path of the state file, empty when running in memory.
     */
    std::string statePath() const;

    /**
     * @brief "MAC: aa:bb:cc:dd:ee:ff  Sequence: 1234"
     */
    std::string describe() const;

private:
    // Caller holds mutex_.
    void rolloverLocked();
    void fallBackToMemory(const std::string& reason);

    mutable std::mutex mutex_;
    std::unique_ptr<StateStore> store_;
    ClockEngine clock_;
    uint64_t node_ = 0;
    uint32_t sequence_ = 0;
};

}  // namespace core
}  // namespace timeuuid
