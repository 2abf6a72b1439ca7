#include "escrow_session.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <sstream>

namespace pd {

namespace {

std::size_t opponentOf(std::size_t slot) {
    return 1 - slot;
}

bool sameSettlement(const std::optional<Settlement>& a, const std::optional<Settlement>& b) {
    if (a.has_value() != b.has_value()) {
        return false;
    }
    if (!a) {
        return true;
    }
    return a->bidSum == b->bidSum && a->assignment.roles == b->assignment.roles &&
           a->assignment.winner == b->assignment.winner;
}

SessionSnapshot pristineState(Amount fee) {
    SessionSnapshot state;
    state.bank = EscrowBank(fee);
    return state;
}

void validateConfig(const EscrowSession::Config& cfg) {
    if (cfg.minBid == 0) {
        throw std::invalid_argument("minBid must be at least 1; 0 marks an unrevealed bid");
    }
    if (cfg.minBid > cfg.maxBid) {
        std::ostringstream oss;
        oss << "minBid (" << cfg.minBid << ") must not exceed maxBid (" << cfg.maxBid << ")";
        throw std::invalid_argument(oss.str());
    }
    if (cfg.timeoutTicks == 0) {
        throw std::invalid_argument("timeoutTicks must be positive");
    }
    if (cfg.administrator.empty()) {
        throw std::invalid_argument("administrator principal must not be empty");
    }
}

// Marks a gateway call as in flight for the lifetime of the guard.
class TransferScope {
public:
    explicit TransferScope(bool& flag)
        : flag_(flag) {
        flag_ = true;
    }
    ~TransferScope() { flag_ = false; }

    TransferScope(const TransferScope&) = delete;
    TransferScope& operator=(const TransferScope&) = delete;

private:
    bool& flag_;
};

} // namespace

const char* phaseName(PlayerPhase phase) {
    switch (phase) {
    case PlayerPhase::Register:
        return "Register";
    case PlayerPhase::Bid:
        return "Bid";
    case PlayerPhase::Reveal:
        return "Reveal";
    case PlayerPhase::Withdraw:
        return "Withdraw";
    }
    return "Unknown";
}

const char* describe(Rejection reason) {
    switch (reason) {
    case Rejection::AlreadyRegistered:
        return "caller is already registered";
    case Rejection::SessionFull:
        return "both player slots are occupied";
    case Rejection::SessionUnsettled:
        return "previous session still holds escrowed funds";
    case Rejection::WrongFeeAmount:
        return "payment does not equal the registration fee";
    case Rejection::NotRegistered:
        return "caller is not registered";
    case Rejection::CannotQuitNow:
        return "only a lone waiting registrant may quit";
    case Rejection::OpponentMissing:
        return "no opponent has registered yet";
    case Rejection::DuplicateBid:
        return "caller already placed a commitment";
    case Rejection::TimedOut:
        return "phase deadline has passed";
    case Rejection::BidsIncomplete:
        return "both commitments must be placed before revealing";
    case Rejection::InvalidRange:
        return "revealed value is outside the allowed bid range";
    case Rejection::CommitmentMismatch:
        return "reveal does not reproduce the stored commitment";
    case Rejection::AlreadyRevealed:
        return "caller already revealed";
    case Rejection::RevealIncomplete:
        return "both values must be revealed before withdrawing";
    case Rejection::PhaseNotExpired:
        return "phase deadline has not passed yet";
    case Rejection::CannotClaimNow:
        return "caller is not waiting on the opponent";
    case Rejection::NobodyTimedOut:
        return "no player is stuck in the current phase";
    case Rejection::NotAdministrator:
        return "caller is not the administrator";
    case Rejection::TransferFailed:
        return "value transfer to recipient failed";
    case Rejection::TransferInProgress:
        return "session is busy paying out a transfer";
    }
    return "unknown rejection";
}

SessionError::SessionError(Rejection reason)
    : std::runtime_error(describe(reason))
    , reason_(reason) {}

SessionError::SessionError(Rejection reason, const std::string& detail)
    : std::runtime_error(std::string(describe(reason)) + ": " + detail)
    , reason_(reason) {}

bool Player::operator==(const Player& other) const {
    return identity == other.identity && commitment == other.commitment &&
           revealedValue == other.revealedValue && phase == other.phase;
}

bool SessionSnapshot::operator==(const SessionSnapshot& other) const {
    return slots == other.slots && bank == other.bank && phaseDeadline == other.phaseDeadline &&
           sameSettlement(settlement, other.settlement);
}

EscrowSession::EscrowSession(const Config& cfg,
                             const Clock& clock,
                             TransferGateway& transfers,
                             EventSinkPtr events)
    : config_(cfg)
    , clock_(clock)
    , transfers_(transfers)
    , events_(std::move(events))
    , state_() {
    validateConfig(config_);
    state_ = pristineState(config_.registrationFee());
}

PlayerPhase EscrowSession::phase() const {
    return std::min(state_.slots[0].phase, state_.slots[1].phase);
}

std::uint64_t EscrowSession::bidSum() const {
    return state_.settlement ? state_.settlement->bidSum : 0;
}

std::optional<std::size_t> EscrowSession::slotOf(const Principal& who) const {
    if (who.empty()) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < state_.slots.size(); ++i) {
        if (state_.slots[i].identity == who) {
            return i;
        }
    }
    return std::nullopt;
}

bool EscrowSession::isIdle() const {
    return !state_.slots[0].occupied() && !state_.slots[1].occupied() && state_.bank.empty();
}

void EscrowSession::registerPlayer(const Principal& caller, Amount paidAmount) {
    requireNoTransferInFlight();
    if (caller.empty()) {
        throw std::invalid_argument("principal must not be empty");
    }
    if (slotOf(caller)) {
        throw SessionError(Rejection::AlreadyRegistered);
    }

    auto& slots = state_.slots;
    const std::size_t occupiedCount =
        static_cast<std::size_t>(slots[0].occupied()) + static_cast<std::size_t>(slots[1].occupied());
    if (occupiedCount == 2) {
        throw SessionError(Rejection::SessionFull);
    }

    bool settled = false;
    if (occupiedCount == 0) {
        settled = state_.bank.empty();
    } else {
        const Player& waiting = slots[0].occupied() ? slots[0] : slots[1];
        settled = state_.bank.holdsSingleFee() && waiting.phase == PlayerPhase::Bid;
    }
    if (!settled) {
        throw SessionError(Rejection::SessionUnsettled);
    }

    const Amount fee = config_.registrationFee();
    if (paidAmount != fee) {
        std::ostringstream oss;
        oss << "paid " << paidAmount << ", fee is " << fee;
        throw SessionError(Rejection::WrongFeeAmount, oss.str());
    }

    const PlayerPhase before = phase();
    std::size_t slot = slots[0].occupied() ? 1 : 0;
    Player& joined = slots[slot];
    joined.identity = caller;
    joined.commitment.reset();
    joined.revealedValue = 0;
    joined.phase = PlayerPhase::Bid;
    state_.bank.deposit(fee);
    advanceDeadlineIfPhaseMoved(before);

    notify(EventKind::PlayerRegistered, caller, fee);
}

void EscrowSession::quit(const Principal& caller) {
    requireNoTransferInFlight();
    const std::size_t slot = requireSlot(caller);
    const Player& self = state_.slots[slot];
    const Player& opponent = state_.slots[opponentOf(slot)];
    if (self.phase != PlayerPhase::Bid || opponent.occupied()) {
        throw SessionError(Rejection::CannotQuitNow);
    }

    const SessionSnapshot before = state_;
    const Amount refund = state_.bank.drain();
    resetSession();
    payOut(before, caller, refund);

    notify(EventKind::PlayerQuit, caller, refund);
}

void EscrowSession::placeCommitment(const Principal& caller, const Commitment& commitment) {
    requireNoTransferInFlight();
    const std::size_t slot = requireSlot(caller);
    Player& self = state_.slots[slot];
    if (!state_.slots[opponentOf(slot)].occupied()) {
        throw SessionError(Rejection::OpponentMissing);
    }
    if (self.commitment) {
        throw SessionError(Rejection::DuplicateBid);
    }
    requireBeforeDeadline();

    const PlayerPhase before = phase();
    self.commitment = commitment;
    self.phase = PlayerPhase::Reveal;
    advanceDeadlineIfPhaseMoved(before);

    notify(EventKind::CommitmentPlaced, caller, 0);
}

void EscrowSession::revealBid(const Principal& caller, std::uint32_t value, const std::string& secret) {
    requireNoTransferInFlight();
    const std::size_t slot = requireSlot(caller);
    Player& self = state_.slots[slot];
    const Player& opponent = state_.slots[opponentOf(slot)];
    if (!self.commitment || !opponent.occupied() || !opponent.commitment) {
        throw SessionError(Rejection::BidsIncomplete);
    }
    if (self.revealedValue != 0) {
        throw SessionError(Rejection::AlreadyRevealed);
    }
    if (value < config_.minBid || value > config_.maxBid) {
        std::ostringstream oss;
        oss << value << " not in [" << config_.minBid << ", " << config_.maxBid << "]";
        throw SessionError(Rejection::InvalidRange, oss.str());
    }
    requireBeforeDeadline();
    if (!verifyCommitment(*self.commitment, value, secret)) {
        throw SessionError(Rejection::CommitmentMismatch);
    }

    const PlayerPhase before = phase();
    self.revealedValue = value;
    self.phase = PlayerPhase::Withdraw;
    if (opponent.phase == PlayerPhase::Withdraw) {
        state_.settlement = settle(state_.slots[0].revealedValue,
                                   state_.slots[1].revealedValue,
                                   config_.maxBid);
    }
    advanceDeadlineIfPhaseMoved(before);

    notify(EventKind::BidRevealed, caller, value);
}

Amount EscrowSession::withdraw(const Principal& caller) {
    requireNoTransferInFlight();
    const std::size_t slot = requireSlot(caller);
    if (state_.slots[slot].phase != PlayerPhase::Withdraw || !state_.settlement) {
        throw SessionError(Rejection::RevealIncomplete);
    }
    requireBeforeDeadline();

    const SessionSnapshot before = state_;
    const Amount payout = payoutFor(*state_.settlement, slot, config_.registrationFee());
    state_.bank.release(payout);
    clearSlot(slot);
    if (!state_.slots[opponentOf(slot)].occupied()) {
        if (!state_.bank.empty()) {
            state_ = before;
            throw std::logic_error("escrow balance left over after both players withdrew");
        }
        resetSession();
    }
    if (payout > 0) {
        payOut(before, caller, payout);
    }

    notify(EventKind::Withdrawn, caller, payout);
    return payout;
}

Amount EscrowSession::claimOnOpponentTimeout(const Principal& caller) {
    requireNoTransferInFlight();
    const std::size_t slot = requireSlot(caller);
    if (clock_.now() <= state_.phaseDeadline) {
        throw SessionError(Rejection::PhaseNotExpired);
    }

    const PlayerPhase mine = state_.slots[slot].phase;
    const PlayerPhase theirs = state_.slots[opponentOf(slot)].phase;
    const bool waitingOnCommit = mine == PlayerPhase::Reveal && theirs == PlayerPhase::Bid;
    const bool waitingOnReveal = mine == PlayerPhase::Withdraw && theirs == PlayerPhase::Reveal;
    if (!waitingOnCommit && !waitingOnReveal) {
        throw SessionError(Rejection::CannotClaimNow);
    }

    const SessionSnapshot before = state_;
    const Amount amount = state_.bank.drain();
    resetSession();
    payOut(before, caller, amount);

    notify(EventKind::TimeoutClaimed, caller, amount);
    return amount;
}

Amount EscrowSession::adminForceResolve(const Principal& caller) {
    requireNoTransferInFlight();
    if (caller.empty() || caller != config_.administrator) {
        throw SessionError(Rejection::NotAdministrator);
    }
    if (isIdle()) {
        throw SessionError(Rejection::NobodyTimedOut, "no session in progress");
    }
    if (clock_.now() <= state_.phaseDeadline) {
        throw SessionError(Rejection::PhaseNotExpired);
    }

    // The global phase is the minimum of both slots, so at least one slot is
    // always stuck in it once a session exists.
    const PlayerPhase global = phase();
    const bool stuck0 = state_.slots[0].phase == global;
    const bool stuck1 = state_.slots[1].phase == global;

    const SessionSnapshot before = state_;
    const Amount amount = state_.bank.drain();

    if (stuck0 && stuck1) {
        resetSession();
        if (amount > 0) {
            payOut(before, config_.administrator, amount);
        }
        notify(EventKind::ForceResolved, config_.administrator, amount);
        return amount;
    }

    // A lone registrant never started a phase clock (phaseDeadline stays 0),
    // so the administrator may refund them at any tick after 0.
    const Principal beneficiary = stuck0 ? state_.slots[1].identity : state_.slots[0].identity;
    resetSession();
    if (amount == 0 || trySend(before, beneficiary, amount)) {
        notify(EventKind::ForceResolved, beneficiary, amount);
        return amount;
    }

    payOut(before, config_.administrator, amount);
    notify(EventKind::ForceResolved, config_.administrator, amount);
    return amount;
}

void EscrowSession::requireNoTransferInFlight() const {
    if (transferInFlight_) {
        throw SessionError(Rejection::TransferInProgress);
    }
}

std::size_t EscrowSession::requireSlot(const Principal& caller) const {
    auto slot = slotOf(caller);
    if (!slot) {
        throw SessionError(Rejection::NotRegistered);
    }
    return *slot;
}

void EscrowSession::requireBeforeDeadline() const {
    if (clock_.now() > state_.phaseDeadline) {
        throw SessionError(Rejection::TimedOut);
    }
}

void EscrowSession::advanceDeadlineIfPhaseMoved(PlayerPhase before) {
    if (phase() <= before) {
        return;
    }
    const Tick now = clock_.now();
    if (std::numeric_limits<Tick>::max() - now < config_.timeoutTicks) {
        state_.phaseDeadline = std::numeric_limits<Tick>::max();
    } else {
        state_.phaseDeadline = now + config_.timeoutTicks;
    }
}

void EscrowSession::clearSlot(std::size_t slot) {
    state_.slots.at(slot) = Player{};
}

void EscrowSession::resetSession() {
    state_ = pristineState(config_.registrationFee());
}

void EscrowSession::payOut(const SessionSnapshot& before, const Principal& to, Amount amount) {
    bool sent = false;
    try {
        TransferScope scope(transferInFlight_);
        sent = transfers_.send(to, amount);
    } catch (...) {
        state_ = before;
        throw;
    }
    if (!sent) {
        state_ = before;
        throw SessionError(Rejection::TransferFailed, to);
    }
}

bool EscrowSession::trySend(const SessionSnapshot& before, const Principal& to, Amount amount) {
    try {
        TransferScope scope(transferInFlight_);
        return transfers_.send(to, amount);
    } catch (const std::exception& ex) {
        std::cerr << "transfer to " << to << " threw: " << ex.what() << '\n';
        return false;
    } catch (...) {
        state_ = before;
        throw;
    }
}

void EscrowSession::notify(EventKind kind, const Principal& who, Amount amount) {
    if (!events_) {
        return;
    }
    SessionEvent event;
    event.kind = kind;
    event.principal = who;
    event.amount = amount;
    event.tick = clock_.now();
    try {
        events_->publish(event);
    } catch (const std::exception& ex) {
        std::cerr << "event sink failed for " << eventName(kind) << ": " << ex.what() << '\n';
    }
}

} // namespace pd
