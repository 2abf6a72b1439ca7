#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pd {

// Opaque external principal. The empty string marks an unoccupied slot.
using Principal = std::string;
using Amount = std::uint64_t;

// Value-transfer primitive. send() returns false when the recipient cannot
// receive; implementations may also call back into the session while sending.
class TransferGateway {
public:
    virtual ~TransferGateway() = default;
    virtual bool send(const Principal& to, Amount amount) = 0;
};

struct TransferRecord {
    Principal to;
    Amount amount = 0;
};

// Keeps per-principal balances in memory. Principals can be marked as
// unreceivable, and a hook runs before every credit to model recipient code.
class InMemoryTransferGateway : public TransferGateway {
public:
    using ReceiveHook = std::function<void(const Principal& to, Amount amount)>;

    bool send(const Principal& to, Amount amount) override;

    void refuse(const Principal& who);
    void accept(const Principal& who);
    void setReceiveHook(ReceiveHook hook) { hook_ = std::move(hook); }

    Amount balanceOf(const Principal& who) const;
    Amount totalSent() const { return totalSent_; }
    const std::vector<TransferRecord>& history() const { return history_; }
    const std::map<Principal, Amount>& balances() const { return balances_; }

private:
    std::map<Principal, Amount> balances_;
    std::set<Principal> refusing_;
    std::vector<TransferRecord> history_;
    ReceiveHook hook_;
    Amount totalSent_ = 0;
};

} // namespace pd
