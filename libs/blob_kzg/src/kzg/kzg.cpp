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
#include "kzg.h"
#include "pippen.h"
#include "points.h"

// e(a1, a2) * e(b1, b2) == 1
static bool pairings_verify(
    const blst_p1_affine &a1,
    const blst_p2_affine &a2,
    const blst_p1_affine &b1,
    const blst_p2_affine &b2
) {
    blst_fp12 lhs, rhs, gt;
    blst_miller_loop(&lhs, &a2, &a1);
    blst_miller_loop(&rhs, &b2, &b1);
    blst_fp12_mul(&gt, &lhs, &rhs);
    blst_final_exp(&gt, &gt);
    return blst_fp12_is_one(&gt);
}

static scalar_vec to_scalars(const PolynomialEval<blst_fr> &poly) {
    scalar_vec out(poly.size());
    for (size_t i = 0; i < poly.size(); i++) {
        blst_scalar_from_fr(&out[i], &poly[i]);
    }
    return out;
}

blst_p1_affine kzg_commit(
    const EthKzgContext &ctx,
    const PolynomialEval<blst_scalar> &poly,
    ThreadPool* tp
) {
    if (poly.size() != ctx.srs_lagrange_g1.size()) {
        throw std::invalid_argument("kzg_commit: polynomial and SRS sizes differ");
    }

    blst_p1 C = msm_g1(ctx.srs_lagrange_g1.data(), poly.data(), poly.size(), tp);
    return p1_to_affine(C);
}

// Returns Pi, y
std::tuple<blst_p1_affine, blst_fr> kzg_prove(
    const EthKzgContext &ctx,
    const PolynomialEval<blst_fr> &poly,
    const blst_fr &z,
    ThreadPool* tp
) {
    if (poly.size() != ctx.srs_lagrange_g1.size()) {
        throw std::invalid_argument("kzg_prove: polynomial and SRS sizes differ");
    }

    fr_vec inverses;
    int64_t z_idx = inverse_roots_minus_z(inverses, ctx.domain, z, tp);

    blst_fr y = eval_with_inverses(poly, inverses, z_idx, z, ctx.domain, tp);

    PolynomialEval<blst_fr> q = derive_quotient(poly, z, y, inverses, z_idx, ctx.domain, tp);

    // COMMIT TO Q
    scalar_vec q_scalars = to_scalars(q);
    blst_p1 Pi = msm_g1(ctx.srs_lagrange_g1.data(), q_scalars.data(), q_scalars.size(), tp);

    return {p1_to_affine(Pi), y};
}

bool kzg_verify(
    const blst_p1_affine &C,
    const blst_fr &z,
    const blst_fr &y,
    const blst_p1_affine &Pi,
    const blst_p2_affine &tau_g2
) {
    // tau_z = [tau]_2 - [z]_2
    blst_p2 z_h;
    p2_mult(z_h, *blst_p2_generator(), z);
    blst_p2_cneg(&z_h, true);

    blst_p2 tau_z = p2_from_affine(tau_g2);
    blst_p2_add_or_double(&tau_z, &tau_z, &z_h);

    // y_c = [y]_1 - C
    blst_p1 y_g;
    p1_mult(y_g, *blst_p1_generator(), y);
    blst_p1 y_c = p1_sub(y_g, p1_from_affine(C));

    // e(Pi, [tau - z]_2) * e([y]_1 - C, H) == 1
    return pairings_verify(
        Pi, p2_to_affine(tau_z),
        p1_to_affine(y_c), *BLS12_381::g2());
}

bool kzg_verify_batch(
    const std::vector<blst_p1_affine> &Cs,
    const fr_vec &Zs,
    const fr_vec &Ys,
    const std::vector<blst_p1_affine> &Pis,
    const fr_vec &r_powers,
    const blst_p2_affine &tau_g2,
    ThreadPool* tp
) {
    size_t n = Cs.size();
    if (Zs.size() != n || Ys.size() != n || Pis.size() != n || r_powers.size() != n) {
        throw std::invalid_argument("kzg_verify_batch: input sizes differ");
    }

    scalar_vec r_s(n), rz_s(n);
    blst_fr ry_sum = new_fr(0);
    blst_fr tmp;
    for (size_t i = 0; i < n; i++) {
        blst_scalar_from_fr(&r_s[i], &r_powers[i]);

        blst_fr_mul(&tmp, &r_powers[i], &Zs[i]);
        blst_scalar_from_fr(&rz_s[i], &tmp);

        blst_fr_mul(&tmp, &r_powers[i], &Ys[i]);
        fr_add_inplace(ry_sum, tmp);
    }

    // lhs = SUM(r_i * Pi_i)
    blst_p1 lhs = msm_g1(Pis.data(), r_s.data(), n, tp);

    // rhs = SUM(r_i * C_i) - [SUM(r_i * y_i)]_1 + SUM(r_i * z_i * Pi_i)
    blst_p1 rhs = msm_g1(Cs.data(), r_s.data(), n, tp);
    blst_p1 ry_g;
    p1_mult(ry_g, *blst_p1_generator(), ry_sum);
    rhs = p1_sub(rhs, ry_g);

    blst_p1 rz_pi = msm_g1(Pis.data(), rz_s.data(), n, tp);
    blst_p1_add_or_double(&rhs, &rhs, &rz_pi);

    // e(lhs, [tau]_2) * e(-rhs, H) == 1
    blst_p1_cneg(&rhs, true);
    return pairings_verify(
        p1_to_affine(lhs), tau_g2,
        p1_to_affine(rhs), *BLS12_381::g2());
}
