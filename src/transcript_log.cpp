#include "transcript_log.hpp"

#include "rng.hpp"

#include <utility>

namespace rv {

namespace {

std::string hashPair(const std::string& left, const std::string& right) {
    return sha256Hex(left + right);
}

std::vector<std::string> nextLayer(const std::vector<std::string>& layer) {
    std::vector<std::string> next;
    next.reserve((layer.size() + 1) / 2);
    for (std::size_t i = 0; i < layer.size(); i += 2) {
        const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
        next.push_back(hashPair(layer[i], right));
    }
    return next;
}

} // namespace

void TranscriptLog::append(const std::string& event) {
    leaves_.push_back(leafHash(event));
}

std::string TranscriptLog::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string TranscriptLog::leafHash(const std::string& event) {
    return sha256Hex(event);
}

std::string TranscriptLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        layer = nextLayer(layer);
    }
    return layer.front();
}

std::vector<std::string> TranscriptLog::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::size_t sibling = (index % 2 == 0) ? index + 1 : index - 1;
        proof.push_back(sibling < layer.size() ? layer[sibling] : layer[index]);
        layer = nextLayer(layer);
        index /= 2;
    }
    return proof;
}

bool TranscriptLog::verifyProof(const std::string& leaf,
                                std::size_t leafIndex,
                                const std::vector<std::string>& proof,
                                const std::string& root) {
    std::string node = leaf;
    std::size_t index = leafIndex;
    for (const auto& sibling : proof) {
        node = (index % 2 == 0) ? hashPair(node, sibling) : hashPair(sibling, node);
        index /= 2;
    }
    return !root.empty() && node == root;
}

} // namespace rv
