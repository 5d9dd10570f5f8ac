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
#include "settings.h"
#include "thread_pool.h"

// Evaluation form over the domain, index i holds p(roots_of_unity[i]).
template <typename T>
using PolynomialEval = std::vector<T>;

// Montgomery batch inversion. False if any input is zero.
bool batch_inv(blst_fr* out, const blst_fr* in, size_t n);

// out[i] = 1 / (w_i - z). If z is the root w_k then out[k] = 0
// and k is returned, otherwise -1.
int64_t inverse_roots_minus_z(
    fr_vec &out,
    const PolyDomainEval &d,
    const blst_fr &z,
    ThreadPool* tp = nullptr
);

// Barycentric evaluation given the inverses above.
//   p(z) = (1 - z^N)/N * SUM(w_i / (w_i - z) * p_i)
blst_fr eval_with_inverses(
    const PolynomialEval<blst_fr> &poly,
    const fr_vec &inverses,
    int64_t z_idx,
    const blst_fr &z,
    const PolyDomainEval &d,
    ThreadPool* tp = nullptr
);

blst_fr eval_at(
    const PolynomialEval<blst_fr> &poly,
    const blst_fr &z,
    const PolyDomainEval &d,
    ThreadPool* tp = nullptr
);

// q(x) = (p(x) - y) / (x - z) in evaluation form.
PolynomialEval<blst_fr> derive_quotient(
    const PolynomialEval<blst_fr> &poly,
    const blst_fr &z,
    const blst_fr &y,
    const fr_vec &inverses,
    int64_t z_idx,
    const PolyDomainEval &d,
    ThreadPool* tp = nullptr
);
