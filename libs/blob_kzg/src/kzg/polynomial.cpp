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
#include "polynomial.h"

bool batch_inv(blst_fr* out, const blst_fr* in, size_t n) {
    if (n == 0) return true;

    blst_fr accumulator = new_fr(1);
    for (size_t i = 0; i < n; i++) {
        out[i] = accumulator;
        blst_fr_mul(&accumulator, &accumulator, &in[i]);
    }

    if (fr_is_zero(accumulator)) return false;

    blst_fr_eucl_inverse(&accumulator, &accumulator);

    for (size_t i = n; i-- > 0;) {
        blst_fr_mul(&out[i], &out[i], &accumulator);
        blst_fr_mul(&accumulator, &accumulator, &in[i]);
    }

    return true;
}

int64_t inverse_roots_minus_z(
    fr_vec &out,
    const PolyDomainEval &d,
    const blst_fr &z,
    ThreadPool* tp
) {
    size_t n = d.size();
    out.resize(n);
    fr_vec diffs(n);

    auto chunk = [&](size_t lo, size_t hi) -> int64_t {
        int64_t z_idx = -1;
        for (size_t i = lo; i < hi; i++) {
            blst_fr_sub(&diffs[i], &d.roots_of_unity[i], &z);
            if (fr_is_zero(diffs[i])) {
                z_idx = static_cast<int64_t>(i);
                diffs[i] = new_fr(1);
            }
        }

        if (!batch_inv(out.data() + lo, diffs.data() + lo, hi - lo)) {
            throw std::runtime_error("inverse_roots_minus_z: zero difference");
        }

        if (z_idx >= 0) out[z_idx] = new_fr(0);
        return z_idx;
    };

    for (int64_t idx : map_chunks(tp, n, chunk)) {
        if (idx >= 0) return idx;
    }
    return -1;
}

blst_fr eval_with_inverses(
    const PolynomialEval<blst_fr> &poly,
    const fr_vec &inverses,
    int64_t z_idx,
    const blst_fr &z,
    const PolyDomainEval &d,
    ThreadPool* tp
) {
    if (z_idx >= 0) return poly[z_idx];

    auto chunk = [&](size_t lo, size_t hi) -> blst_fr {
        blst_fr acc = new_fr(0);
        blst_fr tmp;
        for (size_t i = lo; i < hi; i++) {
            blst_fr_mul(&tmp, &d.roots_of_unity[i], &inverses[i]);
            blst_fr_mul(&tmp, &tmp, &poly[i]);
            blst_fr_add(&acc, &acc, &tmp);
        }
        return acc;
    };

    blst_fr sum = new_fr(0);
    for (const blst_fr &part : map_chunks(tp, poly.size(), chunk)) {
        fr_add_inplace(sum, part);
    }

    // (1 - z^N) / N
    blst_fr factor = fr_sub(new_fr(1), fr_pow(z, d.size()));
    fr_mul_inplace(factor, d.inv_max_degree);

    return fr_mul(sum, factor);
}

blst_fr eval_at(
    const PolynomialEval<blst_fr> &poly,
    const blst_fr &z,
    const PolyDomainEval &d,
    ThreadPool* tp
) {
    fr_vec inverses;
    int64_t z_idx = inverse_roots_minus_z(inverses, d, z, tp);
    return eval_with_inverses(poly, inverses, z_idx, z, d, tp);
}

PolynomialEval<blst_fr> derive_quotient(
    const PolynomialEval<blst_fr> &poly,
    const blst_fr &z,
    const blst_fr &y,
    const fr_vec &inverses,
    int64_t z_idx,
    const PolyDomainEval &d,
    ThreadPool* tp
) {
    size_t n = poly.size();
    size_t bits = log2_pow2(n);
    size_t z_nat = (z_idx >= 0) ? reverse_bits(static_cast<size_t>(z_idx), bits) : 0;

    PolynomialEval<blst_fr> q(n);

    // q_i = (p_i - y) / (w_i - z), plus the partial sum
    // SUM(q_i * w_i / z) needed at z_idx when z is in the domain.
    auto chunk = [&](size_t lo, size_t hi) -> blst_fr {
        blst_fr acc = new_fr(0);
        blst_fr tmp;
        for (size_t i = lo; i < hi; i++) {
            if (static_cast<int64_t>(i) == z_idx) {
                q[i] = new_fr(0);
                continue;
            }
            blst_fr_sub(&q[i], &poly[i], &y);
            blst_fr_mul(&q[i], &q[i], &inverses[i]);

            if (z_idx >= 0) {
                // w_i / z = w^(brp(i) - brp(z_idx)), read from the brp table
                size_t nat = (reverse_bits(i, bits) + n - z_nat) % n;
                const blst_fr &w_over_z = d.roots_of_unity[reverse_bits(nat, bits)];
                blst_fr_mul(&tmp, &q[i], &w_over_z);
                blst_fr_add(&acc, &acc, &tmp);
            }
        }
        return acc;
    };

    auto parts = map_chunks(tp, n, chunk);

    if (z_idx >= 0) {
        blst_fr sum = new_fr(0);
        for (const blst_fr &part : parts) fr_add_inplace(sum, part);
        q[z_idx] = fr_neg(sum);
    }

    return q;
}
