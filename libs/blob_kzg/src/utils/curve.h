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
#include "blst.h"
#include <cstddef>
#include <cstdint>

// Compile-time description of the pairing curve the engine is bound to.
struct BLS12_381 {
    static constexpr const char* name = "bls12_381";

    static constexpr size_t FR_BYTES = 32;
    static constexpr size_t FP_BYTES = 48;
    static constexpr size_t G1_AFFINE_BYTES = 2 * FP_BYTES;
    static constexpr size_t G2_AFFINE_BYTES = 4 * FP_BYTES;
    static constexpr size_t G1_COMPRESSED_BYTES = FP_BYTES;

    static constexpr size_t SCALAR_BITS = 255;

    // multiplicative generator of Fr*
    static constexpr uint64_t PRIMITIVE_ROOT = 7;
    // 2-adicity of r - 1
    static constexpr size_t TWO_ADICITY = 32;

    // r - 1, little-endian limbs
    static constexpr uint64_t R_MINUS_ONE[4] = {
        0xffffffff00000000, 0x53bda402fffe5bfe,
        0x3339d80809a1d805, 0x73eda753299d7d48
    };

    // base field modulus p, big-endian
    static constexpr byte P_BE[48] = {
        0x1a, 0x01, 0x11, 0xea, 0x39, 0x7f, 0xe6, 0x9a,
        0x4b, 0x1b, 0xa7, 0xb6, 0x43, 0x4b, 0xac, 0xd7,
        0x64, 0x77, 0x4b, 0x84, 0xf3, 0x85, 0x12, 0xbf,
        0x67, 0x30, 0xd2, 0xa0, 0xf6, 0xb0, 0xf6, 0x24,
        0x1e, 0xab, 0xff, 0xfe, 0xb1, 0x53, 0xff, 0xff,
        0xb9, 0xfe, 0xff, 0xff, 0xff, 0xff, 0xaa, 0xab
    };

    static const blst_p1_affine* g1() { return blst_p1_affine_generator(); }
    static const blst_p2_affine* g2() { return blst_p2_affine_generator(); }
};

static_assert(sizeof(blst_fr) == BLS12_381::FR_BYTES);
static_assert(sizeof(blst_p1_affine) == BLS12_381::G1_AFFINE_BYTES);
static_assert(sizeof(blst_p2_affine) == BLS12_381::G2_AFFINE_BYTES);
