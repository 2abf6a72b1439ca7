#pragma once

#include "clock.hpp"
#include "transcript_log.hpp"
#include "transfer.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace pd {

enum class EventKind {
    PlayerRegistered,
    PlayerQuit,
    CommitmentPlaced,
    BidRevealed,
    Withdrawn,
    TimeoutClaimed,
    ForceResolved
};

struct SessionEvent {
    EventKind kind = EventKind::PlayerRegistered;
    Principal principal;
    // Fee, refund or payout for money events; the revealed value for BidRevealed.
    Amount amount = 0;
    Tick tick = 0;
};

const char* eventName(EventKind kind);

// Canonical single-line form used both for logging and transcript leaves.
std::string encodeEvent(const SessionEvent& event);

// Best-effort notification receiver. A throwing sink never affects the session.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void publish(const SessionEvent& event) = 0;
};

using EventSinkPtr = std::shared_ptr<EventSink>;

class StreamEventSink : public EventSink {
public:
    explicit StreamEventSink(std::ostream& out);
    void publish(const SessionEvent& event) override;

private:
    std::ostream& out_;
};

class TranscriptEventSink : public EventSink {
public:
    void publish(const SessionEvent& event) override;

    const TranscriptLog& transcript() const { return log_; }
    std::string root() const { return log_.merkleRoot(); }

private:
    TranscriptLog log_;
};

// Forwards every event to each registered sink in order.
class FanoutEventSink : public EventSink {
public:
    void add(EventSinkPtr sink);
    void publish(const SessionEvent& event) override;

private:
    std::vector<EventSinkPtr> sinks_;
};

} // namespace pd
