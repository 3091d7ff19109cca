/**
 * @file state_store.hpp
 * @brief File-backed generator state shared between processes.
 *
 * The state file holds the node identifier, the last sequence number handed
 * out and a clock value. Every read-modify-write cycle runs under
 * flock(LOCK_EX), so processes pointing at the same path never hand out the
 * same sequence number.
 *
 * Record layout (little-endian, 32 bytes):
 * @code
 * offset  size  field
 *      0     2  node, high 16 bits
 *      2     4  node, low 32 bits
 *      6     4  sequence
 *     10     8  last clock
 *     18    14  reserved, zero
 * @endcode
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#pragma once

#include "timeuuid/core/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/types.h>

namespace timeuuid {
namespace core {

class NodeIdentityProvider;

/**
 * @struct StateRecord
 * @brief Contents of the state file.
 */
struct TIMEUUID_CORE_API StateRecord {
    uint64_t node = 0;          ///< 48-bit node identifier
    uint32_t sequence = 0;      ///< Last sequence number handed out
    uint64_t last_clock = 0;    ///< Clock tick at the time of the last write
};

/// Size of a record as written.
constexpr size_t kStateRecordSize = 32;

/// Bytes a reader needs; anything shorter is corrupt.
constexpr size_t kStateRecordPayload = 18;

/**
 * @brief Encode a record into its fixed on-disk form.
 */
TIMEUUID_CORE_API std::array<uint8_t, kStateRecordSize> encodeStateRecord(const StateRecord& record);

/**
 * @brief Decode a record.
 * @throws PersistenceUnavailableError if fewer than kStateRecordPayload bytes are given.
 */
TIMEUUID_CORE_API StateRecord decodeStateRecord(const uint8_t* data, size_t length);

/**
 * @class StateStore
 * @brief Locked access to one state file.
 *
 * The store keeps no file descriptor open between calls; each operation
 * opens, locks, works and closes.
 */
class TIMEUUID_CORE_API StateStore {
public:
    /**
     * @param path Location of the state file.
     * @param mode Permission bits used when the file is created.
     */
    explicit StateStore(std::string path, mode_t mode = 0644);

    /**
     * @brief Shared default location.
     *
     * "/var/tmp/timeuuid" when /var/tmp is writable, "$HOME/.timeuuid" otherwise.
     */
    static std::string defaultPath();

    const std::string& path() const { return path_; }

    /**
     * @brief True if the file exists and is not empty.
     */
    bool exists() const;

    /**
     * @brief Open or create the installation.
     *
     * If a record exists, it is rolled over (see rollover()) and returned.
     * Otherwise the node comes from @p provider, the sequence is drawn at
     * random from [0, 65536) and the new record is written.
     *
     * @throws NodeIdentityUnavailableError if a new record needs a node and
     *         the provider has none.
     * @throws PersistenceUnavailableError if the file cannot be used.
     */
    StateRecord initialize(NodeIdentityProvider& provider, uint64_t lastClock);

    /**
     * @brief Hand out the next sequence number.
     *
     * Reads the record, increments its sequence, stamps @p lastClock and
     * writes it back. If the file has disappeared, @p fallback with its
     * sequence incremented is written as a fresh record.
     *
     * @return The record as written.
     * @throws PersistenceUnavailableError if the file cannot be used or is
     *         shorter than a record.
     */
    StateRecord rollover(const StateRecord& fallback, uint64_t lastClock);

    /**
     * @brief Read the current record under a shared lock.
     * @throws PersistenceUnavailableError if the file is missing or short.
     */
    StateRecord read() const;

    /**
     * @brief Random starting sequence for a new installation.
     */
    static uint32_t randomSequence();

private:
    std::string path_;
    mode_t mode_;
};

}  // namespace core
}  // namespace timeuuid
