#include "escrow_bank.hpp"

#include <sstream>
#include <stdexcept>

namespace pd {

EscrowBank::EscrowBank(std::uint64_t fee)
    : fee_(fee)
    , balance_(0) {}

void EscrowBank::deposit(std::uint64_t amount) {
    if (amount > 2 * fee_ || balance_ > 2 * fee_ - amount) {
        std::ostringstream oss;
        oss << "deposit of " << amount << " would exceed two fees (balance " << balance_ << ")";
        throw std::logic_error(oss.str());
    }
    balance_ += amount;
}

void EscrowBank::release(std::uint64_t amount) {
    if (amount > balance_) {
        std::ostringstream oss;
        oss << "release of " << amount << " exceeds escrow balance " << balance_;
        throw std::logic_error(oss.str());
    }
    balance_ -= amount;
}

std::uint64_t EscrowBank::drain() {
    std::uint64_t all = balance_;
    balance_ = 0;
    return all;
}

} // namespace pd
