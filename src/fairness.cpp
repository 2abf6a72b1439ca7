#include "fairness.hpp"

#include <stdexcept>

namespace pd {

RoleAssignment assignRoles(std::uint32_t v1, std::uint32_t v2, std::uint32_t maxBid) {
    const std::uint32_t half = maxBid / 2;
    const bool bothLow = v1 <= half && v2 <= half;
    const bool bothHigh = v1 > half && v2 > half;

    RoleAssignment out;
    if (bothLow || bothHigh) {
        out.roles = { Role::A, Role::B };
    } else {
        out.roles = { Role::B, Role::A };
    }

    // Widen before adding so the parity is taken on the true sum.
    const std::uint64_t sum = static_cast<std::uint64_t>(v1) + static_cast<std::uint64_t>(v2);
    out.winner = (sum % 2 == 0) ? Role::A : Role::B;
    return out;
}

Settlement settle(std::uint32_t v1, std::uint32_t v2, std::uint32_t maxBid) {
    if (v1 > maxBid || v2 > maxBid) {
        throw std::invalid_argument("revealed value exceeds maxBid");
    }
    Settlement out;
    out.assignment = assignRoles(v1, v2, maxBid);
    out.bidSum = static_cast<std::uint64_t>(v1) + static_cast<std::uint64_t>(v2);
    return out;
}

std::uint64_t payoutFor(const Settlement& settlement, std::size_t slot, std::uint64_t fee) {
    if (slot > 1) {
        throw std::out_of_range("slot index must be 0 or 1");
    }
    if (settlement.bidSum > fee) {
        throw std::logic_error("bid sum exceeds registration fee");
    }
    if (settlement.assignment.slotWins(slot)) {
        return fee + settlement.bidSum;
    }
    return fee - settlement.bidSum;
}

const char* roleName(Role role) {
    return role == Role::A ? "A" : "B";
}

} // namespace pd
