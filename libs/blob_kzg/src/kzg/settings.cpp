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

#include <stdexcept>
#include "points.h"
#include "polynomial.h"
#include "settings.h"

// =======================================
// ============= BIT REVERSAL ============
// =======================================

bool is_pow2(size_t n) {
    return n != 0 && (n & (n - 1)) == 0;
}

size_t log2_pow2(size_t n) {
    size_t bits = 0;
    while ((size_t(1) << bits) < n) bits++;
    return bits;
}

size_t reverse_bits(size_t x, size_t bits) {
    size_t r = 0;
    for (size_t i = 0; i < bits; i++) {
        r = (r << 1) | (x & 1);
        x >>= 1;
    }
    return r;
}

// =======================================
// ============= DOMAIN ==================
// =======================================

blst_fr root_of_unity(size_t n) {
    size_t k = log2_pow2(n);

    // (r - 1) >> k, r - 1 has 2-adicity 32 so this is exact
    uint64_t exp[4];
    for (size_t i = 0; i < 4; i++) {
        uint64_t hi = (i + 1 < 4) ? BLS12_381::R_MINUS_ONE[i + 1] : 0;
        exp[i] = (k == 0)
            ? BLS12_381::R_MINUS_ONE[i]
            : (BLS12_381::R_MINUS_ONE[i] >> k) | (hi << (64 - k));
    }

    return fr_pow_limbs(new_fr(BLS12_381::PRIMITIVE_ROOT), exp);
}

PolyDomainEval new_domain(size_t n) {
    if (n < 2 || !is_pow2(n) || log2_pow2(n) > BLS12_381::TWO_ADICITY) {
        throw std::invalid_argument("domain size must be a power of two in [2, 2^32]");
    }

    blst_fr w = root_of_unity(n);

    // w^n == 1 and w^(n/2) != 1
    if (!fr_is_one(fr_pow(w, n)) || fr_is_one(fr_pow(w, n / 2))) {
        throw std::runtime_error("root of unity has wrong order");
    }

    PolyDomainEval d;
    d.roots_of_unity.resize(n);
    d.roots_of_unity[0] = new_fr(1);
    for (size_t i = 1; i < n; i++) {
        blst_fr_mul(&d.roots_of_unity[i], &d.roots_of_unity[i - 1], &w);
    }
    bit_reversal_permute(d.roots_of_unity);

    set_inv_max_degree(d);
    return d;
}

void set_inv_max_degree(PolyDomainEval &d) {
    d.inv_max_degree = fr_inv(new_fr(d.size()));
}

// =======================================
// ============= SETUP ===================
// =======================================

EthKzgContext new_testing_setup(const blst_fr &tau, size_t n) {
    EthKzgContext ctx;
    ctx.domain = new_domain(n);
    const fr_vec &roots = ctx.domain.roots_of_unity;

    blst_fr one = new_fr(1);

    // tau - w_i, tau may collide with a root
    int64_t tau_idx = -1;
    fr_vec diffs(n), inv_diffs(n);
    for (size_t i = 0; i < n; i++) {
        diffs[i] = fr_sub(tau, roots[i]);
        if (fr_is_zero(diffs[i])) {
            tau_idx = static_cast<int64_t>(i);
            diffs[i] = one;
        }
    }
    if (!batch_inv(inv_diffs.data(), diffs.data(), n)) {
        throw std::runtime_error("testing setup: zero denominator");
    }

    // L_i(tau) = w_i * (tau^N - 1) / (N * (tau - w_i))
    blst_fr scale = fr_mul(fr_sub(fr_pow(tau, n), one), ctx.domain.inv_max_degree);

    blst_p1 g = *blst_p1_generator();
    blst_p1 p;
    ctx.srs_lagrange_g1.resize(n);
    for (size_t i = 0; i < n; i++) {
        blst_fr l;
        if (tau_idx >= 0) {
            l = (static_cast<int64_t>(i) == tau_idx) ? one : new_fr(0);
        } else {
            l = fr_mul(fr_mul(roots[i], scale), inv_diffs[i]);
        }
        p1_mult(p, g, l);
        ctx.srs_lagrange_g1[i] = p1_to_affine(p);
    }

    blst_p2 h = *blst_p2_generator();
    blst_p2 q;
    blst_fr pow_tau = one;
    ctx.srs_monomial_g2.resize(KZG_SETUP_G2_LENGTH);
    for (size_t i = 0; i < KZG_SETUP_G2_LENGTH; i++) {
        p2_mult(q, h, pow_tau);
        ctx.srs_monomial_g2[i] = p2_to_affine(q);
        fr_mul_inplace(pow_tau, tau);
    }

    return ctx;
}
