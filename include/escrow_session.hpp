#pragma once

#include "clock.hpp"
#include "commitment.hpp"
#include "escrow_bank.hpp"
#include "fairness.hpp"
#include "session_events.hpp"
#include "transfer.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace pd {

// "Ready to perform the action named by this phase." Ordered.
enum class PlayerPhase : std::uint8_t { Register = 0, Bid = 1, Reveal = 2, Withdraw = 3 };

const char* phaseName(PlayerPhase phase);

enum class Rejection {
    AlreadyRegistered,
    SessionFull,
    SessionUnsettled,
    WrongFeeAmount,
    NotRegistered,
    CannotQuitNow,
    OpponentMissing,
    DuplicateBid,
    TimedOut,
    BidsIncomplete,
    InvalidRange,
    CommitmentMismatch,
    AlreadyRevealed,
    RevealIncomplete,
    PhaseNotExpired,
    CannotClaimNow,
    NobodyTimedOut,
    NotAdministrator,
    TransferFailed,
    TransferInProgress
};

const char* describe(Rejection reason);

// Thrown for every refused operation. The session is left exactly as it was.
class SessionError : public std::runtime_error {
public:
    explicit SessionError(Rejection reason);
    SessionError(Rejection reason, const std::string& detail);

    Rejection reason() const noexcept { return reason_; }

private:
    Rejection reason_;
};

struct Player {
    Principal identity;
    std::optional<Commitment> commitment;
    std::uint32_t revealedValue = 0;
    PlayerPhase phase = PlayerPhase::Register;

    bool occupied() const { return !identity.empty(); }
    bool operator==(const Player& other) const;
    bool operator!=(const Player& other) const { return !(*this == other); }
};

// Full copy of the mutable session state; two idle sessions compare equal.
struct SessionSnapshot {
    std::array<Player, 2> slots;
    EscrowBank bank;
    Tick phaseDeadline = 0;
    std::optional<Settlement> settlement;

    bool operator==(const SessionSnapshot& other) const;
    bool operator!=(const SessionSnapshot& other) const { return !(*this == other); }
};

// Two-player commit-reveal parity game with escrowed stakes.
//
// Every public operation either applies completely or throws SessionError
// with the state untouched. Funds leave through the TransferGateway only
// after the bank, slots and cached settlement hold their final values, so a
// gateway that calls back into the session reads the post-operation state.
// Mutating calls made while a transfer is in flight are refused with
// TransferInProgress, which keeps a rollback from undoing a nested payout.
class EscrowSession {
public:
    struct Config {
        std::uint32_t minBid = 1;
        std::uint32_t maxBid = 100;
        Tick timeoutTicks = 25;
        Principal administrator = "admin";

        Amount registrationFee() const { return 2 * static_cast<Amount>(maxBid); }
    };

    EscrowSession(const Config& cfg,
                  const Clock& clock,
                  TransferGateway& transfers,
                  EventSinkPtr events = nullptr);

    void registerPlayer(const Principal& caller, Amount paidAmount);
    void quit(const Principal& caller);
    void placeCommitment(const Principal& caller, const Commitment& commitment);
    void revealBid(const Principal& caller, std::uint32_t value, const std::string& secret);
    Amount withdraw(const Principal& caller);
    Amount claimOnOpponentTimeout(const Principal& caller);
    Amount adminForceResolve(const Principal& caller);

    // Slowest of the two players; an empty slot counts as Register.
    PlayerPhase phase() const;
    Amount bank() const { return state_.bank.balance(); }
    Tick phaseDeadline() const { return state_.phaseDeadline; }
    std::uint64_t bidSum() const;
    const std::optional<Settlement>& settlement() const { return state_.settlement; }
    const Player& player(std::size_t slot) const { return state_.slots.at(slot); }
    std::optional<std::size_t> slotOf(const Principal& who) const;
    const SessionSnapshot& snapshot() const { return state_; }
    bool isIdle() const;

    const Config& config() const { return config_; }

private:
    Config config_;
    const Clock& clock_;
    TransferGateway& transfers_;
    EventSinkPtr events_;
    SessionSnapshot state_;
    bool transferInFlight_ = false;

    void requireNoTransferInFlight() const;
    std::size_t requireSlot(const Principal& caller) const;
    void requireBeforeDeadline() const;
    void advanceDeadlineIfPhaseMoved(PlayerPhase before);
    void clearSlot(std::size_t slot);
    void resetSession();

    void payOut(const SessionSnapshot& before, const Principal& to, Amount amount);
    bool trySend(const SessionSnapshot& before, const Principal& to, Amount amount);
    void notify(EventKind kind, const Principal& who, Amount amount);
};

} // namespace pd
