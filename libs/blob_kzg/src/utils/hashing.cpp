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

#include "hashing.h"
#include "blst_aux.h"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

void Sha256Hasher::finalize(byte* out) const {
    blst_sha256(out, buf_.data(), buf_.size());
}

Hash new_hash(const byte* h) {
    Hash out;
    if (h) memcpy(out.h, h, 32);
    else memset(out.h, 0, 32);
    return out;
}

void print_hash(const Hash &hash) {
    print_bytes(ByteSlice(hash.h, 32));
}

void print_bytes(ByteSlice bytes) {
    for (byte b : bytes) {
        std::cout << std::hex
                  << std::setw(2)
                  << std::setfill('0')
                  << static_cast<unsigned>(b);
    }
    std::cout << std::dec << std::endl;
}

void seeded_hash(Hash* out, uint64_t i) {
    byte seed[8];
    for (size_t k = 0; k < 8; k++) seed[k] = static_cast<byte>(i >> (8 * k));

    BlakeHasher hasher;
    hasher.update(seed, sizeof(seed));
    hasher.finalize(out->h);
}

Hash gen_rand_32() {
    Hash out;
    std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
    if (!urandom) {
        throw std::runtime_error("Failed to open /dev/urandom");
    }
    urandom.read(reinterpret_cast<char*>(out.h), 32);
    if (urandom.gcount() != 32) {
        throw std::runtime_error("Failed to read 32 bytes from /dev/urandom");
    }
    return out;
}
