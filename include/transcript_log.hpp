#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ud {

// Hex-encoded SHA-256 digest.
std::string sha256Hex(const std::string& data);

// Append-only audit log. Each event is stored as the hash of its encoding; the
// Merkle root commits to the whole history in order.
class TranscriptLog {
public:
    void append(const std::string& event);
    std::string getLeaf(std::size_t index) const;

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;

    std::size_t size() const { return leaves_.size(); }

private:
    std::vector<std::string> leaves_;
};

// Checks an inclusion proof for the leaf at leafIndex in a log of leafCount leaves.
bool verifyMerkleProof(const std::string& leafHash,
                       std::size_t leafIndex,
                       std::size_t leafCount,
                       const std::vector<std::string>& proof,
                       const std::string& expectedRoot);

} // namespace ud
