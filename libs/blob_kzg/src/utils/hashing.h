/*
 * Blob KZG
 * Copyright (C) 2025 Joshua Olson
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once
#include "blake3.h"
#include "blst.h"
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <span>
#include <vector>

struct Hash {
    byte h[32];
};

using ByteSlice = std::span<const byte>;

class BlakeHasher {
private: blake3_hasher h_;
public:
    BlakeHasher() { blake3_hasher_init(&h_); }
    ~BlakeHasher() = default;

    void update(const byte* data, const size_t size) {
        blake3_hasher_update(&h_, data, size);
    }
    void finalize(byte* out) {
        blake3_hasher_finalize(&h_, static_cast<uint8_t*>(out), 32);
    }
};

// SHA-256 transcript. blst only exposes the one-shot digest so the
// transcript is buffered until finalize.
class Sha256Hasher {
private: std::vector<byte> buf_;
public:
    Sha256Hasher() = default;
    explicit Sha256Hasher(size_t expected) { buf_.reserve(expected); }

    void update(const byte* data, const size_t size) {
        buf_.insert(buf_.end(), data, data + size);
    }
    void update_u64_be(uint64_t v) {
        for (int i = 7; i >= 0; i--) {
            buf_.push_back(static_cast<byte>(v >> (8 * i)));
        }
    }
    void finalize(byte* out) const;
};

Hash new_hash(const byte* h = nullptr);
void print_hash(const Hash &hash);
void print_bytes(ByteSlice bytes);

// deterministic BLAKE3 stream keyed by i
void seeded_hash(Hash* out, uint64_t i);

// 32 bytes from the OS entropy source
Hash gen_rand_32();
