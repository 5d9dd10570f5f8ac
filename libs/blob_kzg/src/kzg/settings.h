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
#include <cstddef>
#include <utility>
#include <vector>
#include "blst.h"
#include "curve.h"
#include "scalar.h"

// =======================================
// ============= PRESETS =================
// =======================================

#ifndef BLOB_KZG_FIELD_ELEMENTS_PER_BLOB
#define BLOB_KZG_FIELD_ELEMENTS_PER_BLOB 4096
#endif

constexpr size_t FIELD_ELEMENTS_PER_BLOB = BLOB_KZG_FIELD_ELEMENTS_PER_BLOB;
constexpr size_t BYTES_PER_FIELD_ELEMENT = BLS12_381::FR_BYTES;
constexpr size_t BYTES_PER_COMMITMENT = BLS12_381::G1_COMPRESSED_BYTES;
constexpr size_t BYTES_PER_PROOF = BLS12_381::G1_COMPRESSED_BYTES;
constexpr size_t KZG_SETUP_G2_LENGTH = 65;

constexpr size_t DOMAIN_TAG_LEN = 16;
constexpr char FIAT_SHAMIR_PROTOCOL_DOMAIN[] = "FSBLOBVERIFY_V1_";
constexpr char RANDOM_CHALLENGE_KZG_BATCH_DOMAIN[] = "RCKZGBATCH___V1_";

static_assert(sizeof(FIAT_SHAMIR_PROTOCOL_DOMAIN) == DOMAIN_TAG_LEN + 1);
static_assert(sizeof(RANDOM_CHALLENGE_KZG_BATCH_DOMAIN) == DOMAIN_TAG_LEN + 1);

// =======================================
// ============= BIT REVERSAL ============
// =======================================

bool is_pow2(size_t n);
size_t log2_pow2(size_t n);
size_t reverse_bits(size_t x, size_t bits);

template <typename T>
void bit_reversal_permute(std::vector<T> &v) {
    size_t bits = log2_pow2(v.size());
    for (size_t i = 0; i < v.size(); i++) {
        size_t j = reverse_bits(i, bits);
        if (i < j) std::swap(v[i], v[j]);
    }
}

// =======================================
// ============= DOMAIN ==================
// =======================================

struct PolyDomainEval {
    fr_vec roots_of_unity;      // bit-reversal order
    blst_fr inv_max_degree;     // 1/N

    size_t size() const { return roots_of_unity.size(); }
};

// primitive N-th root of unity, 7^((r-1)/N)
blst_fr root_of_unity(size_t n);

// Throws std::invalid_argument unless n is a power of two in [2, 2^32].
PolyDomainEval new_domain(size_t n);

void set_inv_max_degree(PolyDomainEval &d);

// =======================================
// ============= SETUP ===================
// =======================================

struct EthKzgContext {
    // [L_i(tau)]G, bit-reversal order
    std::vector<blst_p1_affine> srs_lagrange_g1;
    // [tau^i]H, ascending
    std::vector<blst_p2_affine> srs_monomial_g2;
    PolyDomainEval domain;

    size_t max_degree() const { return domain.size(); }
    size_t blob_size() const { return domain.size() * BYTES_PER_FIELD_ELEMENT; }
    const blst_p2_affine& tau_g2() const { return srs_monomial_g2[1]; }
};

// Insecure. The SRS is derived from a known secret, for tests
// and for producing interchange files.
EthKzgContext new_testing_setup(const blst_fr &tau, size_t n);
