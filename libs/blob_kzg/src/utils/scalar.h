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
#include "status.h"
#include <array>
#include <cstdint>
#include <vector>

using bytes32 = std::array<byte, 32>;
using bytes48 = std::array<byte, 48>;
using fr_vec = std::vector<blst_fr>;
using scalar_vec = std::vector<blst_scalar>;

// =======================================
// ============== FR (MONT) ==============
// =======================================

blst_fr new_fr(const uint64_t v = 0);
bool fr_is_zero(const blst_fr &x);
bool fr_is_one(const blst_fr &x);
bool equal_fr(const blst_fr &a, const blst_fr &b);

blst_fr fr_add(const blst_fr &a, const blst_fr &b);
blst_fr fr_sub(const blst_fr &a, const blst_fr &b);
blst_fr fr_mul(const blst_fr &a, const blst_fr &b);
blst_fr fr_neg(const blst_fr &a);
blst_fr fr_inv(const blst_fr &a);
void fr_add_inplace(blst_fr &dst, const blst_fr &src);
void fr_mul_inplace(blst_fr &dst, const blst_fr &mult);

blst_fr fr_pow(const blst_fr &base, uint64_t exp);
// exp is little-endian 64-bit limbs
blst_fr fr_pow_limbs(const blst_fr &base, const uint64_t exp[4]);

// [1, r, r^2, ..., r^(n-1)]
fr_vec fr_powers(const blst_fr &r, size_t n);

// =======================================
// ============== BIG INTS ===============
// =======================================

blst_scalar new_scalar(const uint64_t v = 0);
blst_scalar scalar_from_fr(const blst_fr &x);
blst_fr fr_from_scalar(const blst_scalar &s);

// =======================================
// ============== BYTES ==================
// =======================================

// Canonical big-endian, must be < r
CodecScalarStatus scalar_from_bytes(blst_scalar &out, const byte in[32]);
CodecScalarStatus fr_from_bytes(blst_fr &out, const byte in[32]);
bytes32 bytes_from_fr(const blst_fr &x);

// Big-endian digest reduced mod r
blst_fr fr_from_digest(const byte in[32]);

void print_fr(const blst_fr &x);
