// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_CRYPTO_SHA3_H
#define POOLNODE_CRYPTO_SHA3_H

#include <stdint.h>
#include <stdlib.h>

/**
 * Compute SHA3-256 hash of data (one-shot function, OpenSSL EVP backend)
 *
 * @param data Input data to hash
 * @param len Length of input data in bytes
 * @param hash Output buffer for 32-byte hash
 * @throws std::invalid_argument on NULL buffers, std::runtime_error if OpenSSL fails
 */
void SHA3_256(const uint8_t* data, size_t len, uint8_t hash[32]);

#endif // POOLNODE_CRYPTO_SHA3_H
