#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace rv {

// Append-only SHA-256 Merkle log of event encodings. An odd node is paired with itself.
class TranscriptLog {
public:
    void append(const std::string& event);
    std::string getLeaf(std::size_t index) const;

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;

    static std::string leafHash(const std::string& event);
    static bool verifyProof(const std::string& leaf,
                            std::size_t leafIndex,
                            const std::vector<std::string>& proof,
                            const std::string& root);

    std::size_t size() const { return leaves_.size(); }

private:
    std::vector<std::string> leaves_;
};

} // namespace rv
