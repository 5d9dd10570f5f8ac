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

#include <cstring>
#include <iomanip>
#include <iostream>
#include "curve.h"
#include "points.h"


// =======================================
// =============== POINTS ================
// =======================================


// -------------------- P1 ---------------------------

blst_p1 new_p1() {
    blst_p1 p;
    memset(&p, 0, sizeof(p));
    return p;
}

blst_p1_affine p1_to_affine(const blst_p1 &p1) {
    blst_p1_affine aff;
    blst_p1_to_affine(&aff, &p1);
    return aff;
}

blst_p1 p1_from_affine(const blst_p1_affine &aff) {
    blst_p1 p1;
    blst_p1_from_affine(&p1, &aff);
    return p1;
}

void p1_mult(blst_p1 &dst, const blst_p1 &a, const blst_fr &b) {
    blst_scalar s = scalar_from_fr(b);
    blst_p1_mult(&dst, &a, s.b, BLS12_381::SCALAR_BITS);
}

// a - b
blst_p1 p1_sub(const blst_p1 &a, const blst_p1 &b) {
    blst_p1 neg_b = b;
    blst_p1_cneg(&neg_b, true);

    blst_p1 out;
    blst_p1_add_or_double(&out, &a, &neg_b);
    return out;
}

bytes48 compress_p1(const blst_p1 &p) {
    bytes48 out;
    blst_p1_compress(out.data(), &p);
    return out;
}

bytes48 compress_p1_affine(const blst_p1_affine &p) {
    bytes48 out;
    blst_p1_affine_compress(out.data(), &p);
    return out;
}

void print_p1(const blst_p1 &p) {
    auto comp = compress_p1(p);
    for (auto b : comp)
        std::cout << std::hex << std::setw(2) << std::setfill('0') << (int)b;
    std::cout << std::dec << std::endl;
}

void print_p1_affine(const blst_p1_affine &p) {
    print_p1(p1_from_affine(p));
}

CodecEccStatus p1_from_bytes(blst_p1_affine &out, const byte in[48]) {
    memset(&out, 0, sizeof(out));

    // compression flag is mandatory
    if ((in[0] & 0x80) == 0) return CodecEccStatus::InvalidEncoding;

    if (in[0] & 0x40) {
        if ((in[0] & 0x3f) != 0) return CodecEccStatus::InvalidEncoding;
        for (size_t i = 1; i < 48; i++) {
            if (in[i] != 0) return CodecEccStatus::InvalidEncoding;
        }
        return CodecEccStatus::PointAtInfinity;
    }

    // x with the 3 flag bits cleared must be < p
    byte x[48];
    memcpy(x, in, 48);
    x[0] &= 0x1f;
    if (memcmp(x, BLS12_381::P_BE, 48) >= 0)
        return CodecEccStatus::CoordinateGreaterThanOrEqualModulus;

    switch (blst_p1_uncompress(&out, in)) {
        case BLST_SUCCESS:
            break;
        case BLST_POINT_NOT_ON_CURVE:
            return CodecEccStatus::PointNotOnCurve;
        default:
            return CodecEccStatus::InvalidEncoding;
    }

    if (!blst_p1_affine_in_g1(&out)) return CodecEccStatus::PointNotInSubgroup;
    return CodecEccStatus::Success;
}

// -------------------- P2 ---------------------------

blst_p2_affine p2_to_affine(const blst_p2 &p2) {
    blst_p2_affine aff;
    blst_p2_to_affine(&aff, &p2);
    return aff;
}

blst_p2 p2_from_affine(const blst_p2_affine &aff) {
    blst_p2 p2;
    blst_p2_from_affine(&p2, &aff);
    return p2;
}

void p2_mult(blst_p2 &dst, const blst_p2 &a, const blst_fr &b) {
    blst_scalar s = scalar_from_fr(b);
    blst_p2_mult(&dst, &a, s.b, BLS12_381::SCALAR_BITS);
}

bool is_g2_generator(const blst_p2_affine &p) {
    return blst_p2_affine_is_equal(&p, BLS12_381::g2());
}
