#include "transcript_log.hpp"

#include "picosha2.h"

#include <vector>

namespace ud {

namespace {

// Leaves and interior nodes hash under different prefixes so neither can stand in
// for the other.
const char kLeafTag = '\x00';
const char kNodeTag = '\x01';

std::string hashPair(const std::string& left, const std::string& right) {
    return sha256Hex(std::string(1, kNodeTag) + left + right);
}

// An odd node at the end of a layer is carried up unchanged.
std::vector<std::string> nextLayer(const std::vector<std::string>& layer) {
    std::vector<std::string> next;
    next.reserve((layer.size() + 1) / 2);
    for (std::size_t i = 0; i < layer.size(); i += 2) {
        if (i + 1 < layer.size()) {
            next.push_back(hashPair(layer[i], layer[i + 1]));
        } else {
            next.push_back(layer[i]);
        }
    }
    return next;
}

bool isCarried(std::size_t index, std::size_t layerSize) {
    return index % 2 == 0 && index + 1 == layerSize;
}

} // namespace

std::string sha256Hex(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

void TranscriptLog::append(const std::string& event) {
    leaves_.push_back(sha256Hex(std::string(1, kLeafTag) + event));
}

std::string TranscriptLog::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
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
        if (!isCarried(index, layer.size())) {
            proof.push_back(layer[(index % 2 == 0) ? index + 1 : index - 1]);
        }
        layer = nextLayer(layer);
        index /= 2;
    }
    return proof;
}

bool verifyMerkleProof(const std::string& leafHash,
                       std::size_t leafIndex,
                       std::size_t leafCount,
                       const std::vector<std::string>& proof,
                       const std::string& expectedRoot) {
    if (leafHash.empty() || expectedRoot.empty() || leafIndex >= leafCount) {
        return false;
    }
    std::string current = leafHash;
    std::size_t index = leafIndex;
    std::size_t layerSize = leafCount;
    std::size_t used = 0;
    while (layerSize > 1) {
        if (!isCarried(index, layerSize)) {
            if (used == proof.size()) {
                return false;
            }
            const std::string& sibling = proof[used++];
            current = (index % 2 == 0) ? hashPair(current, sibling) : hashPair(sibling, current);
        }
        index /= 2;
        layerSize = (layerSize + 1) / 2;
    }
    return used == proof.size() && current == expectedRoot;
}

} // namespace ud
