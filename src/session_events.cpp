#include "session_events.hpp"

#include <sstream>

namespace pd {

const char* eventName(EventKind kind) {
    switch (kind) {
    case EventKind::PlayerRegistered:
        return "registered";
    case EventKind::PlayerQuit:
        return "quit";
    case EventKind::CommitmentPlaced:
        return "committed";
    case EventKind::BidRevealed:
        return "revealed";
    case EventKind::Withdrawn:
        return "withdrawn";
    case EventKind::TimeoutClaimed:
        return "timeout-claimed";
    case EventKind::ForceResolved:
        return "force-resolved";
    }
    return "unknown";
}

std::string encodeEvent(const SessionEvent& event) {
    std::ostringstream oss;
    oss << "tick=" << event.tick << '|' << eventName(event.kind) << '|' << event.principal.size()
        << ':' << event.principal << '|' << event.amount;
    return oss.str();
}

StreamEventSink::StreamEventSink(std::ostream& out)
    : out_(out) {}

void StreamEventSink::publish(const SessionEvent& event) {
    out_ << "[event] " << encodeEvent(event) << '\n';
}

void TranscriptEventSink::publish(const SessionEvent& event) {
    log_.append(encodeEvent(event));
}

void FanoutEventSink::add(EventSinkPtr sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void FanoutEventSink::publish(const SessionEvent& event) {
    for (const auto& sink : sinks_) {
        sink->publish(event);
    }
}

} // namespace pd
