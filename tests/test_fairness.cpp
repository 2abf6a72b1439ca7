#include "fairness.hpp"

#include "test_support.hpp"

#include <stdexcept>
#include <string>

using pdtest::check;
using pdtest::fail;

int main() {
    using namespace pd;

    const std::uint32_t maxBid = 100;
    const std::uint64_t fee = 2 * maxBid;

    // Both low, even sum: slot1 is A and A wins.
    Settlement a = settle(40, 34, maxBid);
    check(a.bidSum == 74, "bid sum");
    check(a.assignment.roleOf(0) == Role::A && a.assignment.roleOf(1) == Role::B, "both low gives slot1 A");
    check(a.assignment.winner == Role::A, "even sum means A wins");
    check(payoutFor(a, 0, fee) == 274 && payoutFor(a, 1, fee) == 126, "scenario payouts");

    // Split across the half: slot2 becomes A.
    Settlement split = settle(10, 60, maxBid);
    check(split.assignment.roleOf(0) == Role::B && split.assignment.roleOf(1) == Role::A, "split sides give slot2 A");
    check(split.assignment.winner == Role::A && split.assignment.slotWins(1), "slot2 wins an even split");

    // half = 50: 50 is low, 51 is high.
    check(assignRoles(50, 1, maxBid).roleOf(0) == Role::A, "50 sits on the low side");
    check(assignRoles(51, 100, maxBid).roleOf(0) == Role::A, "51 sits on the high side");
    check(assignRoles(50, 51, maxBid).roleOf(0) == Role::B, "50 and 51 straddle the half");
    check(assignRoles(50, 51, maxBid).winner == Role::B, "odd sum means B wins");

    // Odd maxBid rounds the half down.
    check(assignRoles(3, 3, 7).roleOf(0) == Role::A && assignRoles(3, 4, 7).roleOf(0) == Role::B,
          "half of 7 is 3");

    for (std::uint32_t v1 = 1; v1 <= maxBid; ++v1) {
        for (std::uint32_t v2 = 1; v2 <= maxBid; ++v2) {
            Settlement s = settle(v1, v2, maxBid);
            Settlement swapped = settle(v2, v1, maxBid);
            const std::string pair = std::to_string(v1) + "," + std::to_string(v2);

            if (s.assignment.roleOf(0) == s.assignment.roleOf(1)) {
                fail("both slots got the same role for " + pair);
            }
            if (s.assignment.roles != swapped.assignment.roles ||
                s.assignment.winner != swapped.assignment.winner) {
                fail("slot assignment depends on value order for " + pair);
            }
            if (((v1 + v2) % 2 == 0) != (s.assignment.winner == Role::A)) {
                fail("winner disagrees with sum parity for " + pair);
            }

            std::uint64_t p0 = payoutFor(s, 0, fee);
            std::uint64_t p1 = payoutFor(s, 1, fee);
            if (p0 + p1 != 2 * fee) {
                fail("payouts do not conserve escrow for " + pair);
            }
            std::uint64_t winnerPayout = s.assignment.slotWins(0) ? p0 : p1;
            std::uint64_t loserPayout = s.assignment.slotWins(0) ? p1 : p0;
            if (winnerPayout - fee != s.bidSum || fee - loserPayout != s.bidSum) {
                fail("gain and loss must both equal the bid sum for " + pair);
            }
        }
    }

    Settlement maxed = settle(100, 100, maxBid);
    std::size_t loser = maxed.assignment.slotWins(0) ? 1 : 0;
    check(payoutFor(maxed, loser, fee) == 0, "loser of a 100/100 game leaves with nothing");

    bool overflowCaught = false;
    Settlement bogus;
    bogus.bidSum = 201;
    try {
        payoutFor(bogus, 0, fee);
    } catch (const std::logic_error&) {
        overflowCaught = true;
    }
    check(overflowCaught, "bid sum above the fee must be refused");

    bool rangeCaught = false;
    try {
        settle(101, 1, maxBid);
    } catch (const std::invalid_argument&) {
        rangeCaught = true;
    }
    check(rangeCaught, "settling a value above maxBid must throw");

    // Bids near the top of uint32 must not wrap the sum.
    const std::uint32_t wideMax = 4000000000u;
    const std::uint64_t wideFee = 2 * static_cast<std::uint64_t>(wideMax);
    Settlement wide = settle(3000000000u, 3000000000u, wideMax);
    check(wide.bidSum == 6000000000ull, "bid sum of two large values is exact");
    check(wide.assignment.winner == Role::A, "parity of the exact sum is even");
    std::size_t wideWinner = wide.assignment.slotWins(0) ? 0 : 1;
    check(payoutFor(wide, wideWinner, wideFee) == 14000000000ull, "winner gains the exact sum");
    check(payoutFor(wide, 1 - wideWinner, wideFee) == 2000000000ull, "loser loses the exact sum");

    std::cout << "fairness_test passed" << std::endl;
    return 0;
}
