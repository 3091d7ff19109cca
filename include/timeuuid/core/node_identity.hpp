/**
 * @file node_identity.hpp
 * @brief Sources of the 48-bit node identifier stamped into every UUID.
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#pragma once

#include "timeuuid/core/export.hpp"

#include <cstdint>
#include <string>

namespace timeuuid {
namespace core {

/// Mask applied to hardware addresses before they are used as a node id.
constexpr uint64_t kHardwareNodeMask = 0x7FFFFFFFFFFFULL;

/**
 * @class NodeIdentityProvider
 * @brief Supplies the node identifier for a new installation.
 *
 * Only consulted when no state record exists yet.
 */
class TIMEUUID_CORE_API NodeIdentityProvider {
public:
    virtual ~NodeIdentityProvider() = default;

    /**
     * @brief Resolve the node identifier.
     * @return A non-zero value of at most 48 bits.
     * @throws NodeIdentityUnavailableError if none can be determined.
     */
    virtual uint64_t resolve() = 0;
};

/**
 * @class HardwareNodeIdentity
 * @brief Uses the MAC address of the first interface that reports one.
 *
 * Interfaces are enumerated with SIOCGIFCONF and queried with
 * SIOCGIFHWADDR. All-zero addresses (loopback, tunnels) are skipped.
 */
class TIMEUUID_CORE_API HardwareNodeIdentity : public NodeIdentityProvider {
public:
    uint64_t resolve() override;
};

/**
 * @class FixedNodeIdentity
 * @brief Returns a value chosen by the caller.
 */
class TIMEUUID_CORE_API FixedNodeIdentity : public NodeIdentityProvider {
public:
    explicit FixedNodeIdentity(uint64_t node) : node_(node) {}

    uint64_t resolve() override;

private:
    uint64_t node_;
};

/**
 * @brief Format a node id as colon-separated octets ("aa:bb:cc:dd:ee:ff").
 */
TIMEUUID_CORE_API std::string formatNodeId(uint64_t node);

/**
 * @brief Parse a node id written as 12 hex digits, optionally separated by ':' or '-'.
 * @throws InvalidInputError on anything else.
 */
TIMEUUID_CORE_API uint64_t parseNodeId(const std::string& text);

}  // namespace core
}  // namespace timeuuid
