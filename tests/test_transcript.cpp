#include "session_events.hpp"
#include "transcript_log.hpp"

#include "test_support.hpp"

#include <iostream>
#include <sstream>
#include <string>

using namespace pd;
using pdtest::check;
using pdtest::fail;
using pdtest::Harness;

namespace {

void proofsVerifyForEveryLeaf() {
    for (std::size_t count = 1; count <= 9; ++count) {
        TranscriptLog log;
        for (std::size_t i = 0; i < count; ++i) {
            log.append("event-" + std::to_string(i));
        }
        const std::string root = log.merkleRoot();
        check(!root.empty(), "non-empty log has a root");
        for (std::size_t i = 0; i < count; ++i) {
            auto proof = log.merkleProof(i);
            if (!TranscriptLog::verifyProof(log.getLeaf(i), proof, root)) {
                fail("proof failed for leaf " + std::to_string(i) + " of " + std::to_string(count));
            }
            std::string forged = TranscriptLog::hashEntry("forged");
            if (TranscriptLog::verifyProof(forged, proof, root)) {
                fail("forged leaf verified at " + std::to_string(i));
            }
        }
    }

    TranscriptLog single;
    single.append("only");
    check(single.merkleRoot() == TranscriptLog::hashEntry("only"), "single leaf is its own root");
    check(single.merkleProof(0).empty(), "single leaf needs no siblings");
    check(single.merkleProof(5).empty(), "out of range proof is empty");
    check(single.getLeaf(3).empty(), "out of range leaf is empty");

    TranscriptLog empty;
    check(empty.merkleRoot().empty(), "empty log has no root");
    check(!TranscriptLog::verifyProof("", {}, ""), "empty inputs never verify");
}

void sessionEventsAreCommitted() {
    Harness h;
    h.registerPair("alice", "bob");
    h.clock.advance(1);
    h.commitBoth("alice", 40, "nA", "bob", 34, "nB");
    h.session.revealBid("alice", 40, "nA");
    h.session.revealBid("bob", 34, "nB");
    h.session.withdraw("bob");
    h.session.withdraw("alice");

    const auto& log = h.events->transcript();
    const auto& entries = log.getEntries();
    check(entries.size() == 8, "eight events for a complete game");
    check(entries[0] == "tick=0|registered|5:alice|200", "registration encoding");
    check(entries[2] == "tick=1|committed|5:alice|0", "commitment encoding");
    check(entries[4] == "tick=1|revealed|5:alice|40", "reveal carries the value");
    check(entries[6] == "tick=1|withdrawn|3:bob|126", "loser payout recorded");
    check(entries[7] == "tick=1|withdrawn|5:alice|274", "winner payout recorded");

    Harness replay;
    replay.registerPair("alice", "bob");
    replay.clock.advance(1);
    replay.commitBoth("alice", 40, "nA", "bob", 34, "nB");
    replay.session.revealBid("alice", 40, "nA");
    replay.session.revealBid("bob", 34, "nB");
    replay.session.withdraw("bob");
    replay.session.withdraw("alice");
    check(replay.events->root() == h.events->root(), "identical histories share a root");

    for (std::size_t i = 0; i < log.size(); ++i) {
        check(TranscriptLog::verifyProof(log.getLeaf(i), log.merkleProof(i), log.merkleRoot()),
              "session event proof verifies");
    }
}

void streamAndFanout() {
    std::ostringstream out;
    auto transcript = std::make_shared<TranscriptEventSink>();
    FanoutEventSink fanout;
    fanout.add(std::make_shared<StreamEventSink>(out));
    fanout.add(transcript);
    fanout.add(nullptr);

    SessionEvent event;
    event.kind = EventKind::TimeoutClaimed;
    event.principal = "carol";
    event.amount = 400;
    event.tick = 31;
    fanout.publish(event);

    check(out.str() == "[event] tick=31|timeout-claimed|5:carol|400\n", "stream sink line");
    check(transcript->transcript().size() == 1, "fanout reaches every sink");
}

} // namespace

int main() {
    proofsVerifyForEveryLeaf();
    sessionEventsAreCommitted();
    streamAndFanout();

    std::cout << "transcript_test passed" << std::endl;
    return 0;
}
