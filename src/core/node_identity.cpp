/**
 * @file node_identity.cpp
 * @brief Node identifier providers.
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#include "timeuuid/core/node_identity.hpp"
#include "timeuuid/core/errors.hpp"
#include "timeuuid/core/format_codec.hpp"
#include "timeuuid/utils/logger.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <sstream>

#include <net/if.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace timeuuid {
namespace core {

namespace {

// Closes the ioctl socket on every exit path.
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() { if (fd_ >= 0) ::close(fd_); }

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

}  // namespace

uint64_t HardwareNodeIdentity::resolve() {
    SocketGuard sock(::socket(AF_INET, SOCK_DGRAM, IPPROTO_IP));
    if (sock.get() < 0) {
        throw NodeIdentityUnavailableError(
            std::string("Cannot open socket to query interfaces: ") + std::strerror(errno));
    }

    char buf[4096];
    std::memset(buf, 0, sizeof(buf));
    struct ifconf ifc;
    ifc.ifc_len = sizeof(buf);
    ifc.ifc_buf = buf;
    if (::ioctl(sock.get(), SIOCGIFCONF, &ifc) < 0) {
        throw NodeIdentityUnavailableError(
            std::string("SIOCGIFCONF failed: ") + std::strerror(errno));
    }

    const size_t count = static_cast<size_t>(ifc.ifc_len) / sizeof(struct ifreq);
    for (size_t i = 0; i < count; ++i) {
        struct ifreq ifr;
        std::memset(&ifr, 0, sizeof(ifr));
        std::strncpy(ifr.ifr_name, ifc.ifc_req[i].ifr_name, IFNAMSIZ - 1);

        if (::ioctl(sock.get(), SIOCGIFHWADDR, &ifr) < 0) {
            continue;
        }

        const auto* a = reinterpret_cast<const unsigned char*>(ifr.ifr_hwaddr.sa_data);
        uint64_t mac = 0;
        for (int b = 0; b < 6; ++b) {
            mac = (mac << 8) | a[b];
        }

        uint64_t node = mac & kHardwareNodeMask;
        if (node == 0) {
            continue;
        }

        LOG_DEBUG("NodeIdentity", "Using hardware address of {}: {}",
                  ifr.ifr_name, formatNodeId(mac));
        return node;
    }

    throw NodeIdentityUnavailableError(
        "Cannot determine MAC address from any available interface");
}

uint64_t FixedNodeIdentity::resolve() {
    uint64_t node = node_ & kNodeMask;
    if (node == 0) {
        throw NodeIdentityUnavailableError("Configured node identifier is zero");
    }
    return node;
}

std::string formatNodeId(uint64_t node) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int shift = 40; shift >= 0; shift -= 8) {
        oss << std::setw(2) << ((node >> shift) & 0xFF);
        if (shift > 0) {
            oss << ':';
        }
    }
    return oss.str();
}

uint64_t parseNodeId(const std::string& text) {
    std::string digits;
    digits.reserve(12);
    for (char c : text) {
        if (c == ':' || c == '-') {
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            throw InvalidInputError("invalid node identifier \"" + text + "\"");
        }
        digits.push_back(c);
    }
    if (digits.size() != 12) {
        throw InvalidInputError("node identifier must have 12 hex digits: \"" + text + "\"");
    }
    return std::stoull(digits, nullptr, 16);
}

}  // namespace core
}  // namespace timeuuid
