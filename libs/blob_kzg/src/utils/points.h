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
#include "scalar.h"
#include "status.h"

// =======================================
// =============== POINTS ================
// =======================================

// -------------------- P1 ---------------------------

blst_p1 new_p1();
blst_p1_affine p1_to_affine(const blst_p1 &p1);
blst_p1 p1_from_affine(const blst_p1_affine &aff);
void p1_mult(blst_p1 &dst, const blst_p1 &a, const blst_fr &b);
blst_p1 p1_sub(const blst_p1 &a, const blst_p1 &b);

bytes48 compress_p1(const blst_p1 &p);
bytes48 compress_p1_affine(const blst_p1_affine &p);
void print_p1(const blst_p1 &p);
void print_p1_affine(const blst_p1_affine &p);

// ZCash compressed form. Infinity is reported as PointAtInfinity
// with `out` zeroed.
CodecEccStatus p1_from_bytes(blst_p1_affine &out, const byte in[48]);

// -------------------- P2 ---------------------------

blst_p2_affine p2_to_affine(const blst_p2 &p2);
blst_p2 p2_from_affine(const blst_p2_affine &aff);
void p2_mult(blst_p2 &dst, const blst_p2 &a, const blst_fr &b);
bool is_g2_generator(const blst_p2_affine &p);
