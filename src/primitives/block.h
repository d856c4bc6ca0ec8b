// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_PRIMITIVES_BLOCK_H
#define POOLNODE_PRIMITIVES_BLOCK_H

#include <cstring>
#include <cstdint>
#include <vector>
#include <string>
#include <iosfwd>

/** 256-bit hash */
class uint256 {
public:
    static constexpr size_t WIDTH = 32;

    uint8_t data[WIDTH];

    uint256() { memset(data, 0, WIDTH); }

    bool IsNull() const {
        for (size_t i = 0; i < WIDTH; i++)
            if (data[i] != 0) return false;
        return true;
    }

    // Byte-wise (memcmp) order; for containers only
    bool operator<(const uint256& other) const {
        return memcmp(data, other.data, WIDTH) < 0;
    }

    bool operator==(const uint256& other) const {
        return memcmp(data, other.data, WIDTH) == 0;
    }

    bool operator!=(const uint256& other) const {
        return memcmp(data, other.data, WIDTH) != 0;
    }

    uint8_t* begin() { return data; }
    const uint8_t* begin() const { return data; }
    uint8_t* end() { return data + WIDTH; }
    const uint8_t* end() const { return data + WIDTH; }

    std::string GetHex() const;
    void SetHex(const std::string& str);
};

// Stream output operator for Boost.Test
std::ostream& operator<<(std::ostream& os, const uint256& h);

class CBlockHeader {
public:
    int32_t nVersion;
    uint256 hashPrevBlock;
    uint256 hashMerkleRoot;
    uint32_t nTime;
    uint32_t nNonce;

    CBlockHeader() { SetNull(); }

    void SetNull() {
        nVersion = 0;
        hashPrevBlock = uint256();
        hashMerkleRoot = uint256();
        nTime = 0;
        nNonce = 0;
    }

    /** SHA3-256 over the 76-byte little-endian header serialization */
    uint256 GetHash() const;
};

class CBlock : public CBlockHeader {
public:
    std::vector<uint8_t> vtx;

    CBlock() { SetNull(); }

    void SetNull() {
        CBlockHeader::SetNull();
        vtx.clear();
    }
};

#endif // POOLNODE_PRIMITIVES_BLOCK_H
