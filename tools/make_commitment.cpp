#include "commitment.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: make_commitment <value> [secret]\n";
        std::cerr << "Without a secret, 16 random bytes are drawn and printed as hex.\n";
        return 1;
    }

    std::uint32_t value = 0;
    try {
        std::string text = argv[1];
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("not a decimal number");
        }
        unsigned long long parsed = std::stoull(text);
        if (parsed == 0 || parsed > 0xFFFFFFFFULL) {
            throw std::out_of_range("value out of range");
        }
        value = static_cast<std::uint32_t>(parsed);
    } catch (const std::exception& ex) {
        std::cerr << "Value must be a positive integer: " << ex.what() << '\n';
        return 1;
    }

    std::string secret;
    try {
        secret = (argc == 3) ? argv[2] : pd::generateSecret();
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    std::cout << "value:      " << value << '\n';
    std::cout << "secret:     " << secret << '\n';
    std::cout << "preimage:   " << pd::buildCommitmentPreimage(value, secret) << '\n';
    std::cout << "commitment: " << pd::commitmentToHex(pd::computeCommitment(value, secret)) << '\n';
    return 0;
}
