#include "transcript_log.hpp"

#include "picosha2.h"

#include <utility>
#include <vector>

namespace pd {

namespace {

std::string hashBytes(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

} // namespace

void TranscriptLog::append(const std::string& entry) {
    entries_.push_back(entry);
    leaves_.push_back(hashBytes(entry));
}

std::string TranscriptLog::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string TranscriptLog::hashEntry(const std::string& entry) {
    return hashBytes(entry);
}

std::string TranscriptLog::hashPair(const std::string& left, const std::string& right) {
    return hashBytes(left + right);
}

std::string TranscriptLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }

    return layer.front();
}

std::vector<MerkleProofStep> TranscriptLog::merkleProof(std::size_t leafIndex) const {
    std::vector<MerkleProofStep> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;

    while (layer.size() > 1) {
        std::size_t pairStart = index - (index % 2);
        bool isRight = (index % 2) != 0;
        const std::string& left = layer[pairStart];
        const std::string& right = (pairStart + 1 < layer.size()) ? layer[pairStart + 1] : left;
        if (isRight) {
            proof.push_back({ left, true });
        } else {
            proof.push_back({ right, false });
        }

        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& r = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], r));
        }
        layer = std::move(next);
        index /= 2;
    }

    return proof;
}

bool TranscriptLog::verifyProof(const std::string& leafHash,
                                const std::vector<MerkleProofStep>& proof,
                                const std::string& root) {
    if (leafHash.empty() || root.empty()) {
        return false;
    }
    std::string current = leafHash;
    for (const auto& step : proof) {
        current = step.siblingIsLeft ? hashPair(step.sibling, current)
                                     : hashPair(current, step.sibling);
    }
    return current == root;
}

void TranscriptLog::clear() {
    entries_.clear();
    leaves_.clear();
}

} // namespace pd
