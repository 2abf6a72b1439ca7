#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pd {

struct MerkleProofStep {
    std::string sibling;
    bool siblingIsLeft = false;
};

// Append-only log of SHA-256 leaves with a binary Merkle commitment. An odd
// node at any level is paired with itself.
class TranscriptLog {
public:
    void append(const std::string& entry);
    std::string getLeaf(std::size_t index) const;
    const std::vector<std::string>& getLeaves() const { return leaves_; }
    const std::vector<std::string>& getEntries() const { return entries_; }

    std::string merkleRoot() const;
    std::vector<MerkleProofStep> merkleProof(std::size_t leafIndex) const;

    static bool verifyProof(const std::string& leafHash,
                            const std::vector<MerkleProofStep>& proof,
                            const std::string& root);
    static std::string hashEntry(const std::string& entry);

    std::size_t size() const { return leaves_.size(); }
    void clear();

private:
    static std::string hashPair(const std::string& left, const std::string& right);

    std::vector<std::string> entries_;
    std::vector<std::string> leaves_;
};

} // namespace pd
