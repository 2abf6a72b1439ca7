#include "transfer.hpp"

#include <limits>
#include <stdexcept>

namespace pd {

bool InMemoryTransferGateway::send(const Principal& to, Amount amount) {
    if (to.empty()) {
        return false;
    }
    if (refusing_.count(to) != 0) {
        return false;
    }
    if (hook_) {
        hook_(to, amount);
    }

    Amount& balance = balances_[to];
    if (std::numeric_limits<Amount>::max() - balance < amount) {
        throw std::overflow_error("recipient balance overflow");
    }
    balance += amount;
    totalSent_ += amount;
    history_.push_back({ to, amount });
    return true;
}

void InMemoryTransferGateway::refuse(const Principal& who) {
    refusing_.insert(who);
}

void InMemoryTransferGateway::accept(const Principal& who) {
    refusing_.erase(who);
}

Amount InMemoryTransferGateway::balanceOf(const Principal& who) const {
    auto it = balances_.find(who);
    if (it == balances_.end()) {
        return 0;
    }
    return it->second;
}

} // namespace pd
