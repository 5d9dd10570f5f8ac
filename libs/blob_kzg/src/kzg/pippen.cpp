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

#include "curve.h"
#include "pippen.h"
#include "points.h"

static bool scalar_bytes_zero(const blst_scalar &s) {
    for (size_t i = 0; i < 32; i++) {
        if (s.b[i] != 0) return false;
    }
    return true;
}

// ==============================================
// ============= SCRATCH_SPACE ==================
// ==============================================

void PippMan::new_scratch_space(size_t n) {
    size_t bytes = blst_p1s_mult_pippenger_scratch_sizeof(n);
    size_t limbs = (bytes + sizeof(limb_t) - 1) / sizeof(limb_t);
    if (scratch_space.size() < limbs) scratch_space.resize(limbs);
}

// ==============================================
// ============= FUNCTIONALITY ==================
// ==============================================

blst_p1 PippMan::mult_p1s(
    const blst_p1_affine* points,
    const blst_scalar* scalars,
    size_t n
) {
    point_ptrs.clear();
    scalar_ptrs.clear();
    for (size_t i = 0; i < n; i++) {
        if (blst_p1_affine_is_inf(&points[i]) || scalar_bytes_zero(scalars[i])) continue;
        point_ptrs.push_back(&points[i]);
        scalar_ptrs.push_back(scalars[i].b);
    }

    blst_p1 agg = new_p1();
    size_t len = point_ptrs.size();
    if (len == 0) return agg;

    if (len < PIPPENGER_THRESHOLD) {
        blst_p1 base, tmp;
        for (size_t i = 0; i < len; i++) {
            blst_p1_from_affine(&base, point_ptrs[i]);
            blst_p1_mult(&tmp, &base, scalar_ptrs[i], BLS12_381::SCALAR_BITS);
            blst_p1_add_or_double(&agg, &agg, &tmp);
        }
        return agg;
    }

    new_scratch_space(len);
    blst_p1s_mult_pippenger(
        &agg,
        point_ptrs.data(),
        len,
        scalar_ptrs.data(),
        BLS12_381::SCALAR_BITS,
        scratch_space.data());
    return agg;
}

blst_p1 msm_g1(
    const blst_p1_affine* points,
    const blst_scalar* scalars,
    size_t n,
    ThreadPool* tp
) {
    auto chunk = [&](size_t lo, size_t hi) -> blst_p1 {
        PippMan pm;
        return pm.mult_p1s(points + lo, scalars + lo, hi - lo);
    };

    blst_p1 agg = new_p1();
    for (const blst_p1 &part : map_chunks(tp, n, chunk)) {
        blst_p1_add_or_double(&agg, &agg, &part);
    }
    return agg;
}
