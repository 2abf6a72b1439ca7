#include "clock.hpp"
#include "commitment.hpp"
#include "escrow_session.hpp"
#include "session_events.hpp"
#include "transfer.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pd;

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::uint64_t parseUnsigned(const std::string& text, const std::string& what) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(what + " must be an unsigned integer, got \"" + text + "\"");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(what + " is out of range: " + text);
    }
}

std::uint32_t parseValue(const std::string& text) {
    std::uint64_t parsed = parseUnsigned(text, "value");
    if (parsed > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("value is out of range: " + text);
    }
    return static_cast<std::uint32_t>(parsed);
}

EscrowSession::Config configFromEnvironment() {
    EscrowSession::Config cfg;
    if (const char* admin = std::getenv("PD_ADMIN")) {
        std::string trimmed = trim(admin);
        if (trimmed.empty()) {
            throw std::runtime_error("PD_ADMIN is empty or whitespace");
        }
        cfg.administrator = trimmed;
    }
    if (const char* timeout = std::getenv("PD_TIMEOUT_TICKS")) {
        cfg.timeoutTicks = parseUnsigned(trim(timeout), "PD_TIMEOUT_TICKS");
    }
    if (const char* maxBid = std::getenv("PD_MAX_BID")) {
        cfg.maxBid = parseValue(trim(maxBid));
    }
    return cfg;
}

void printStatus(const EscrowSession& session, const Clock& clock) {
    std::cout << "  tick=" << clock.now() << " phase=" << phaseName(session.phase())
              << " bank=" << session.bank() << " deadline=" << session.phaseDeadline()
              << " bidSum=" << session.bidSum() << "\n";
    for (std::size_t i = 0; i < 2; ++i) {
        const Player& p = session.player(i);
        std::cout << "  slot" << (i + 1) << ": ";
        if (!p.occupied()) {
            std::cout << "<empty>\n";
            continue;
        }
        std::cout << p.identity << " phase=" << phaseName(p.phase)
                  << " committed=" << (p.commitment ? "yes" : "no")
                  << " revealed=" << p.revealedValue << "\n";
    }
}

void printUsage() {
    std::cerr << "Usage: parity_duel [script]\n"
              << "Commands (one per line, '#' starts a comment):\n"
              << "  register <who> <amount>\n"
              << "  quit <who>\n"
              << "  commit <who> <commitment-hex>\n"
              << "  commit-value <who> <value> <secret>\n"
              << "  reveal <who> <value> <secret>\n"
              << "  withdraw <who>\n"
              << "  claim <who>\n"
              << "  admin <who>\n"
              << "  tick <n>\n"
              << "  refuse <who> | accept <who>\n"
              << "  status\n"
              << "Environment: PD_ADMIN, PD_TIMEOUT_TICKS, PD_MAX_BID override defaults.\n";
}

// Returns false when the line is malformed; rejected operations are reported
// and the script continues.
bool runCommand(const std::vector<std::string>& args,
                EscrowSession& session,
                ManualClock& clock,
                InMemoryTransferGateway& gateway) {
    const std::string& cmd = args[0];
    auto need = [&](std::size_t count) {
        if (args.size() != count) {
            throw std::invalid_argument("'" + cmd + "' expects " + std::to_string(count - 1) +
                                        " argument(s)");
        }
    };

    try {
        if (cmd == "register") {
            need(3);
            session.registerPlayer(args[1], parseUnsigned(args[2], "amount"));
        } else if (cmd == "quit") {
            need(2);
            session.quit(args[1]);
        } else if (cmd == "commit") {
            need(3);
            session.placeCommitment(args[1], commitmentFromHex(args[2]));
        } else if (cmd == "commit-value") {
            need(4);
            Commitment c = computeCommitment(parseValue(args[2]), args[3]);
            std::cout << "  commitment " << commitmentToHex(c) << "\n";
            session.placeCommitment(args[1], c);
        } else if (cmd == "reveal") {
            need(4);
            session.revealBid(args[1], parseValue(args[2]), args[3]);
        } else if (cmd == "withdraw") {
            need(2);
            std::cout << "  payout " << session.withdraw(args[1]) << "\n";
        } else if (cmd == "claim") {
            need(2);
            std::cout << "  claimed " << session.claimOnOpponentTimeout(args[1]) << "\n";
        } else if (cmd == "admin") {
            need(2);
            std::cout << "  resolved " << session.adminForceResolve(args[1]) << "\n";
        } else if (cmd == "tick") {
            need(2);
            clock.advance(parseUnsigned(args[1], "tick count"));
        } else if (cmd == "refuse") {
            need(2);
            gateway.refuse(args[1]);
        } else if (cmd == "accept") {
            need(2);
            gateway.accept(args[1]);
        } else if (cmd == "status") {
            need(1);
            printStatus(session, clock);
        } else {
            std::cerr << "Unknown command: " << cmd << "\n";
            return false;
        }
    } catch (const SessionError& err) {
        std::cout << "  rejected: " << err.what() << "\n";
    } catch (const std::invalid_argument& err) {
        std::cerr << "Malformed command: " << err.what() << "\n";
        return false;
    } catch (const std::overflow_error& err) {
        std::cerr << "Malformed command: " << err.what() << "\n";
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        printUsage();
        return 1;
    }

    EscrowSession::Config cfg;
    try {
        cfg = configFromEnvironment();
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    std::ifstream file;
    if (argc == 2) {
        file.open(argv[1]);
        if (!file) {
            std::cerr << "Unable to open script: " << argv[1] << "\n";
            return 1;
        }
    }
    std::istream& in = (argc == 2) ? static_cast<std::istream&>(file) : std::cin;

    ManualClock clock;
    InMemoryTransferGateway gateway;
    auto transcript = std::make_shared<TranscriptEventSink>();
    auto fanout = std::make_shared<FanoutEventSink>();
    fanout->add(std::make_shared<StreamEventSink>(std::cout));
    fanout->add(transcript);

    std::unique_ptr<EscrowSession> session;
    try {
        session = std::make_unique<EscrowSession>(cfg, clock, gateway, fanout);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    std::cout << "parity-duel: fee=" << cfg.registrationFee() << " bids=[" << cfg.minBid << ", "
              << cfg.maxBid << "] timeout=" << cfg.timeoutTicks << " admin=" << cfg.administrator
              << "\n";

    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        std::istringstream iss(line);
        std::vector<std::string> args;
        std::string word;
        while (iss >> word) {
            args.push_back(word);
        }
        if (args.empty()) {
            continue;
        }

        std::cout << "> " << trim(line) << "\n";
        if (!runCommand(args, *session, clock, gateway)) {
            std::cerr << "Stopping at line " << lineNo << "\n";
            printUsage();
            return 1;
        }
    }

    std::cout << "\nBalances paid out:\n";
    for (const auto& entry : gateway.balances()) {
        std::cout << "  " << entry.first << ": " << entry.second << "\n";
    }
    std::cout << "Escrow still held: " << session->bank() << "\n";
    std::cout << "Transcript events: " << transcript->transcript().size() << "\n";
    std::cout << "Transcript Merkle root: " << transcript->root() << "\n";
    return 0;
}
