#pragma once

#include <cstdint>

namespace pd {

// Escrow for the current session. Holds at most two registration fees and
// never releases more than it holds.
class EscrowBank {
public:
    explicit EscrowBank(std::uint64_t fee = 0);

    void deposit(std::uint64_t amount);
    void release(std::uint64_t amount);
    std::uint64_t drain();

    std::uint64_t balance() const { return balance_; }
    std::uint64_t fee() const { return fee_; }
    bool empty() const { return balance_ == 0; }
    bool holdsSingleFee() const { return balance_ == fee_; }

    bool operator==(const EscrowBank& other) const {
        return balance_ == other.balance_ && fee_ == other.fee_;
    }
    bool operator!=(const EscrowBank& other) const { return !(*this == other); }

private:
    std::uint64_t fee_;
    std::uint64_t balance_;
};

} // namespace pd
