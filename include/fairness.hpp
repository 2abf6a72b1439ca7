#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace pd {

enum class Role : std::uint8_t { A, B };

struct RoleAssignment {
    // Indexed by slot: roles[0] is slot1, roles[1] is slot2.
    std::array<Role, 2> roles{ Role::A, Role::B };
    Role winner = Role::A;

    Role roleOf(std::size_t slot) const { return roles.at(slot); }
    bool slotWins(std::size_t slot) const { return roles.at(slot) == winner; }
};

// Settlement facts frozen once both values are revealed.
struct Settlement {
    RoleAssignment assignment;
    // Widened so two uint32 values never wrap.
    std::uint64_t bidSum = 0;
};

// slot1 takes role A iff both values fall on the same side of maxBid / 2.
// Role A wins iff the sum is even.
RoleAssignment assignRoles(std::uint32_t v1, std::uint32_t v2, std::uint32_t maxBid);

Settlement settle(std::uint32_t v1, std::uint32_t v2, std::uint32_t maxBid);

// fee + bidSum for the winner, fee - bidSum for the loser. Throws when
// bidSum exceeds the fee, which would break money conservation.
std::uint64_t payoutFor(const Settlement& settlement, std::size_t slot, std::uint64_t fee);

const char* roleName(Role role);

} // namespace pd
