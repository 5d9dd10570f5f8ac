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
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <vector>
#include "hashing.h"
#include "settings.h"

// secret used by every testing setup
const uint64_t TEST_TAU = 1337;

void main_tsif();
void main_poly();
void main_kzg();
void main_eip4844();
void main_batch();
void main_parallel();

// n field elements of BLAKE3 output, top byte cleared so each is < r
inline std::vector<byte> seeded_blob(size_t n, uint64_t seed) {
    std::vector<byte> blob(n * BYTES_PER_FIELD_ELEMENT);
    Hash hash = new_hash();
    for (size_t i = 0; i < n; i++) {
        seeded_hash(&hash, seed * n + i);
        hash.h[0] = 0;
        memcpy(&blob[i * BYTES_PER_FIELD_ELEMENT], hash.h, BYTES_PER_FIELD_ELEMENT);
    }
    return blob;
}

// every element encodes `v`
inline std::vector<byte> constant_blob(size_t n, byte v) {
    std::vector<byte> blob(n * BYTES_PER_FIELD_ELEMENT, 0);
    for (size_t i = 0; i < n; i++) {
        blob[i * BYTES_PER_FIELD_ELEMENT + BYTES_PER_FIELD_ELEMENT - 1] = v;
    }
    return blob;
}
