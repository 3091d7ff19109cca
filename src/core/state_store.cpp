/**
 * @file state_store.cpp
 * @brief StateStore implementation.
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#include "timeuuid/core/state_store.hpp"
#include "timeuuid/core/errors.hpp"
#include "timeuuid/core/node_identity.hpp"
#include "timeuuid/utils/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <random>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace timeuuid {
namespace core {

namespace {

void putU16(uint8_t* out, uint16_t v) {
    out[0] = static_cast<uint8_t>(v);
    out[1] = static_cast<uint8_t>(v >> 8);
}

void putU32(uint8_t* out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

void putU64(uint8_t* out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

uint16_t getU16(const uint8_t* in) {
    return static_cast<uint16_t>(in[0] | (in[1] << 8));
}

uint32_t getU32(const uint8_t* in) {
    uint32_t v = 0;
    for (int i = 3; i >= 0; --i) {
        v = (v << 8) | in[i];
    }
    return v;
}

uint64_t getU64(const uint8_t* in) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | in[i];
    }
    return v;
}

std::string errnoMessage(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

/**
 * @brief An open state file holding a flock for its whole lifetime.
 */
class LockedFile {
public:
    LockedFile(const std::string& path, int flags, mode_t mode, int lockOp)
        : path_(path)
        , fd_(::open(path.c_str(), flags | O_CLOEXEC, mode))
    {
        if (fd_ < 0) {
            openErrno_ = errno;
            return;
        }
        while (::flock(fd_, lockOp) < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string message = errnoMessage("Cannot lock state file", path_);
            ::close(fd_);
            fd_ = -1;
            throw PersistenceUnavailableError(message);
        }
    }

    ~LockedFile() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

    LockedFile(const LockedFile&) = delete;
    LockedFile& operator=(const LockedFile&) = delete;

    bool isOpen() const { return fd_ >= 0; }
    int openErrno() const { return openErrno_; }

    off_t size() const {
        struct stat st;
        if (::fstat(fd_, &st) < 0) {
            throw PersistenceUnavailableError(errnoMessage("Cannot stat state file", path_));
        }
        return st.st_size;
    }

    StateRecord readRecord() const {
        std::array<uint8_t, kStateRecordSize> buf{};
        size_t total = 0;
        while (total < buf.size()) {
            ssize_t n = ::pread(fd_, buf.data() + total, buf.size() - total,
                                static_cast<off_t>(total));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw PersistenceUnavailableError(errnoMessage("Cannot read state file", path_));
            }
            if (n == 0) {
                break;
            }
            total += static_cast<size_t>(n);
        }
        return decodeStateRecord(buf.data(), total);
    }

    void writeRecord(const StateRecord& record) {
        auto buf = encodeStateRecord(record);
        if (::ftruncate(fd_, 0) < 0) {
            throw PersistenceUnavailableError(errnoMessage("Cannot truncate state file", path_));
        }
        size_t total = 0;
        while (total < buf.size()) {
            ssize_t n = ::pwrite(fd_, buf.data() + total, buf.size() - total,
                                 static_cast<off_t>(total));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw PersistenceUnavailableError(errnoMessage("Cannot write state file", path_));
            }
            total += static_cast<size_t>(n);
        }
    }

private:
    std::string path_;
    int fd_;
    int openErrno_ = 0;
};

StateRecord incrementAndWrite(LockedFile& file, StateRecord record, uint64_t lastClock) {
    record.sequence += 1;
    record.last_clock = lastClock;
    file.writeRecord(record);
    return record;
}

}  // namespace

std::array<uint8_t, kStateRecordSize> encodeStateRecord(const StateRecord& record) {
    std::array<uint8_t, kStateRecordSize> buf{};
    putU16(buf.data(), static_cast<uint16_t>((record.node >> 32) & 0xFFFF));
    putU32(buf.data() + 2, static_cast<uint32_t>(record.node & 0xFFFFFFFFULL));
    putU32(buf.data() + 6, record.sequence);
    putU64(buf.data() + 10, record.last_clock);
    return buf;
}

StateRecord decodeStateRecord(const uint8_t* data, size_t length) {
    if (length < kStateRecordPayload) {
        throw PersistenceUnavailableError(
            "State record is truncated: " + std::to_string(length) + " of " +
            std::to_string(kStateRecordPayload) + " bytes");
    }
    StateRecord record;
    record.node = (static_cast<uint64_t>(getU16(data)) << 32) | getU32(data + 2);
    record.sequence = getU32(data + 6);
    record.last_clock = getU64(data + 10);
    return record;
}

StateStore::StateStore(std::string path, mode_t mode)
    : path_(std::move(path))
    , mode_(mode)
{}

std::string StateStore::defaultPath() {
    if (::access("/var/tmp", W_OK) == 0) {
        return "/var/tmp/timeuuid";
    }
    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        return std::string(home) + "/.timeuuid";
    }
    return ".timeuuid";
}

bool StateStore::exists() const {
    struct stat st;
    return ::stat(path_.c_str(), &st) == 0 && st.st_size > 0;
}

StateRecord StateStore::initialize(NodeIdentityProvider& provider, uint64_t lastClock) {
    LockedFile file(path_, O_RDWR | O_CREAT, mode_, LOCK_EX);
    if (!file.isOpen()) {
        errno = file.openErrno();
        throw PersistenceUnavailableError(errnoMessage("Cannot open state file", path_));
    }

    if (file.size() > 0) {
        StateRecord record = incrementAndWrite(file, file.readRecord(), lastClock);
        LOG_DEBUG("StateStore", "Reusing {}: sequence {}", path_, record.sequence);
        return record;
    }

    StateRecord record;
    record.node = provider.resolve();
    record.sequence = randomSequence();
    record.last_clock = lastClock;
    file.writeRecord(record);
    LOG_DEBUG("StateStore", "Created {}: node {} sequence {}",
              path_, formatNodeId(record.node), record.sequence);
    return record;
}

StateRecord StateStore::rollover(const StateRecord& fallback, uint64_t lastClock) {
    {
        LockedFile file(path_, O_RDWR, mode_, LOCK_EX);
        if (file.isOpen()) {
            StateRecord record = incrementAndWrite(file, file.readRecord(), lastClock);
            LOG_DEBUG("StateStore", "Rolled {} to sequence {}", path_, record.sequence);
            return record;
        }
        if (file.openErrno() != ENOENT) {
            errno = file.openErrno();
            throw PersistenceUnavailableError(errnoMessage("Cannot open state file", path_));
        }
    }

    LOG_DEBUG("StateStore", "{} disappeared, writing a fresh record", path_);
    LockedFile file(path_, O_RDWR | O_CREAT, mode_, LOCK_EX);
    if (!file.isOpen()) {
        errno = file.openErrno();
        throw PersistenceUnavailableError(errnoMessage("Cannot create state file", path_));
    }
    // Another process may have recreated it between the two opens.
    StateRecord base = file.size() > 0 ? file.readRecord() : fallback;
    return incrementAndWrite(file, base, lastClock);
}

StateRecord StateStore::read() const {
    LockedFile file(path_, O_RDONLY, mode_, LOCK_SH);
    if (!file.isOpen()) {
        errno = file.openErrno();
        throw PersistenceUnavailableError(errnoMessage("Cannot open state file", path_));
    }
    return file.readRecord();
}

uint32_t StateStore::randomSequence() {
    thread_local std::random_device rd;
    thread_local std::mt19937 gen(rd());
    std::uniform_int_distribution<uint32_t> dist(0, 0xFFFF);
    return dist(gen);
}

}  // namespace core
}  // namespace timeuuid
