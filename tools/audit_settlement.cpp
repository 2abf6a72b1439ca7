#include "fairness.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::uint32_t parseArg(const char* text, const char* what) {
    std::string s = text;
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(std::string(what) + " must be an unsigned integer");
    }
    unsigned long long parsed = std::stoull(s);
    if (parsed > 0xFFFFFFFFULL) {
        throw std::out_of_range(std::string(what) + " out of range");
    }
    return static_cast<std::uint32_t>(parsed);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 4) {
        std::cerr << "Usage: audit_settlement <v1> <v2> [maxBid]\n";
        return 1;
    }

    std::uint32_t v1 = 0;
    std::uint32_t v2 = 0;
    std::uint32_t maxBid = 100;
    try {
        v1 = parseArg(argv[1], "v1");
        v2 = parseArg(argv[2], "v2");
        if (argc == 4) {
            maxBid = parseArg(argv[3], "maxBid");
        }
        if (v1 == 0 || v2 == 0) {
            throw std::invalid_argument("revealed values start at 1");
        }
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    pd::Settlement s;
    std::uint64_t fee = 2 * static_cast<std::uint64_t>(maxBid);
    try {
        s = pd::settle(v1, v2, maxBid);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    std::cout << "half:    " << maxBid / 2 << '\n';
    std::cout << "bidSum:  " << s.bidSum << (s.bidSum % 2 == 0 ? " (even)" : " (odd)") << '\n';
    std::cout << "slot1:   role " << pd::roleName(s.assignment.roleOf(0)) << ", payout "
              << pd::payoutFor(s, 0, fee) << '\n';
    std::cout << "slot2:   role " << pd::roleName(s.assignment.roleOf(1)) << ", payout "
              << pd::payoutFor(s, 1, fee) << '\n';
    std::cout << "winner:  role " << pd::roleName(s.assignment.winner) << '\n';
    std::cout << "escrow:  " << 2 * fee << '\n';
    return 0;
}
