// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <primitives/block.h>
#include <crypto/sha3.h>
#include <sstream>
#include <iomanip>
#include <ostream>

std::string uint256::GetHex() const {
    std::stringstream ss;
    for (int i = static_cast<int>(WIDTH) - 1; i >= 0; i--) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

void uint256::SetHex(const std::string& str) {
    memset(data, 0, WIDTH);

    // Accept an optional 0x prefix; GetHex() order is most significant byte first
    std::string hex = str;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }
    if (hex.size() > WIDTH * 2) {
        hex = hex.substr(hex.size() - WIDTH * 2);
    }
    if (hex.size() % 2 == 1) {
        hex = "0" + hex;
    }

    size_t nbytes = hex.size() / 2;
    for (size_t i = 0; i < nbytes; i++) {
        size_t strPos = hex.size() - 2 - (i * 2);
        data[i] = static_cast<uint8_t>(std::stoi(hex.substr(strPos, 2), nullptr, 16));
    }
}

std::ostream& operator<<(std::ostream& os, const uint256& h) {
    return os << h.GetHex();
}

namespace {

void AppendLE32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; i++) {
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

} // namespace

uint256 CBlockHeader::GetHash() const {
    // version (4) + prevBlock (32) + merkleRoot (32) + time (4) + nonce (4)
    std::vector<uint8_t> data;
    data.reserve(76);
    AppendLE32(data, static_cast<uint32_t>(nVersion));
    data.insert(data.end(), hashPrevBlock.begin(), hashPrevBlock.end());
    data.insert(data.end(), hashMerkleRoot.begin(), hashMerkleRoot.end());
    AppendLE32(data, nTime);
    AppendLE32(data, nNonce);

    uint256 hash;
    SHA3_256(data.data(), data.size(), hash.data);
    return hash;
}
