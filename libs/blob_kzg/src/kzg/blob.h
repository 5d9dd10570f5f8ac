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
#include <span>
#include "polynomial.h"
#include "status.h"
#include "thread_pool.h"

using BlobSlice = std::span<const byte>;

// =======================================
// ============= DECODING ================
// =======================================

// Each 32-byte chunk is a big-endian field element < r.
// blob.size() must be a multiple of 32.
CodecScalarStatus blob_to_bigint_polynomial(
    PolynomialEval<blst_scalar> &out,
    BlobSlice blob,
    ThreadPool* tp = nullptr
);

CodecScalarStatus blob_to_field_polynomial(
    PolynomialEval<blst_fr> &out,
    BlobSlice blob,
    ThreadPool* tp = nullptr
);

// =======================================
// ============= CHALLENGES ==============
// =======================================

// SHA256(FSBLOBVERIFY_V1_ || 0^8 || u64_be(N) || blob || commitment) mod r
blst_fr fiat_shamir_challenge(BlobSlice blob, const bytes48 &commitment);

// Big-endian seed mod r. An all-zero seed falls back to
// SHA256(RCKZGBATCH___V1_ || z_0 || ... || z_{n-1}) mod r
// over the raw blst_fr words of each z_i (Montgomery form).
blst_fr batch_blinding_base(const bytes32 &secure_random_bytes, const fr_vec &challenges);
