#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pd {

constexpr std::size_t kCommitmentBytes = 32;

// SHA-256 digest binding a player to a bid without disclosing it.
using Commitment = std::array<std::uint8_t, kCommitmentBytes>;

// Preimage is the base-10 value (no leading zeros), a '-' and the raw secret.
std::string buildCommitmentPreimage(std::uint32_t value, const std::string& secret);

Commitment computeCommitment(std::uint32_t value, const std::string& secret);

// Recomputes the commitment for (value, secret) and compares it in constant time.
bool verifyCommitment(const Commitment& stored, std::uint32_t value, const std::string& secret);

std::string commitmentToHex(const Commitment& commitment);
Commitment commitmentFromHex(const std::string& hex);

// Fresh hex-encoded secret drawn from the libsodium CSPRNG.
std::string generateSecret(std::size_t numBytes = 16);

} // namespace pd
