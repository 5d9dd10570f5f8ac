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
#include "thread_pool.h"
#include <cstddef>
#include <vector>

using std::vector;

// below this many terms a double-and-add loop beats pippenger
const size_t PIPPENGER_THRESHOLD = 8;

// =======================================
// ============== PIPPENGER ==============
// =======================================

class PippMan {
public:
    PippMan() = default;

    // SUM(scalars[i] * points[i]). Infinity points and zero
    // scalars are dropped before bucketing.
    blst_p1 mult_p1s(
        const blst_p1_affine* points,
        const blst_scalar* scalars,
        size_t n);

private:
    vector<limb_t> scratch_space;
    vector<const blst_p1_affine*> point_ptrs;
    vector<const byte*> scalar_ptrs;

    void new_scratch_space(size_t n);
};

// Splits the sum across the pool, one PippMan per range.
blst_p1 msm_g1(
    const blst_p1_affine* points,
    const blst_scalar* scalars,
    size_t n,
    ThreadPool* tp = nullptr);
