#include "commitment.hpp"

#include "picosha2.h"
#include "secure_memory.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace pd {

namespace {

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

int hexNibble(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    unsigned char lower = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(ch)));
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

} // namespace

std::string buildCommitmentPreimage(std::uint32_t value, const std::string& secret) {
    std::ostringstream oss;
    oss << value << '-';
    oss.write(secret.data(), static_cast<std::streamsize>(secret.size()));
    return oss.str();
}

Commitment computeCommitment(std::uint32_t value, const std::string& secret) {
    std::string preimage = buildCommitmentPreimage(value, secret);
    Commitment digest{};
    picosha2::hash256(preimage.begin(), preimage.end(), digest.begin(), digest.end());
    secureWipe(preimage);
    return digest;
}

bool verifyCommitment(const Commitment& stored, std::uint32_t value, const std::string& secret) {
    Commitment recomputed = computeCommitment(value, secret);
    return constantTimeEquals(recomputed.data(), stored.data(), stored.size());
}

std::string commitmentToHex(const Commitment& commitment) {
    return picosha2::bytes_to_hex_string(commitment.begin(), commitment.end());
}

Commitment commitmentFromHex(const std::string& hex) {
    if (hex.size() != kCommitmentBytes * 2) {
        throw std::invalid_argument("commitment hex must be exactly 64 characters");
    }

    Commitment out{};
    for (std::size_t i = 0; i < kCommitmentBytes; ++i) {
        int high = hexNibble(hex[2 * i]);
        int low = hexNibble(hex[2 * i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("commitment hex contains a non-hex character");
        }
        out[i] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return out;
}

std::string generateSecret(std::size_t numBytes) {
    if (numBytes == 0) {
        throw std::invalid_argument("secret must contain at least one byte");
    }
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }

    std::vector<unsigned char> bytes(numBytes);
    randombytes_buf(bytes.data(), bytes.size());

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    secureZero(bytes.data(), bytes.size());
    return oss.str();
}

} // namespace pd
