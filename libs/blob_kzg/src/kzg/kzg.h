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
#include "polynomial.h"
#include "settings.h"
#include "thread_pool.h"
#include <tuple>
#include <vector>

// [p(tau)]_1 via the Lagrange SRS.
// Throws std::invalid_argument if the polynomial and SRS sizes differ.
blst_p1_affine kzg_commit(
    const EthKzgContext &ctx,
    const PolynomialEval<blst_scalar> &poly,
    ThreadPool* tp = nullptr
);

// Returns (proof, y) with y = p(z).
std::tuple<blst_p1_affine, blst_fr> kzg_prove(
    const EthKzgContext &ctx,
    const PolynomialEval<blst_fr> &poly,
    const blst_fr &z,
    ThreadPool* tp = nullptr
);

// e(Pi, [tau - z]_2) == e(C - [y]_1, H)
bool kzg_verify(
    const blst_p1_affine &C,
    const blst_fr &z,
    const blst_fr &y,
    const blst_p1_affine &Pi,
    const blst_p2_affine &tau_g2
);

// e(SUM(r_i * Pi_i), [tau]_2) ==
// e(SUM(r_i * (C_i - [y_i]_1)) + SUM(r_i * z_i * Pi_i), H)
bool kzg_verify_batch(
    const std::vector<blst_p1_affine> &Cs,
    const fr_vec &Zs,
    const fr_vec &Ys,
    const std::vector<blst_p1_affine> &Pis,
    const fr_vec &r_powers,
    const blst_p2_affine &tau_g2,
    ThreadPool* tp = nullptr
);
