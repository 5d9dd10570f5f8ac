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
#include "scalar.h"

// =======================================
// ============== FR (MONT) ==============
// =======================================

blst_fr new_fr(const uint64_t v) {
    uint64_t limbs[4] = {v, 0, 0, 0};
    blst_fr x;
    blst_fr_from_uint64(&x, limbs);
    return x;
}

bool fr_is_zero(const blst_fr &x) {
    return (x.l[0] | x.l[1] | x.l[2] | x.l[3]) == 0;
}

bool fr_is_one(const blst_fr &x) {
    static const blst_fr ONE = new_fr(1);
    return equal_fr(x, ONE);
}

bool equal_fr(const blst_fr &a, const blst_fr &b) {
    return std::memcmp(a.l, b.l, sizeof(a.l)) == 0;
}

blst_fr fr_add(const blst_fr &a, const blst_fr &b) {
    blst_fr res;
    blst_fr_add(&res, &a, &b);
    return res;
}

blst_fr fr_sub(const blst_fr &a, const blst_fr &b) {
    blst_fr res;
    blst_fr_sub(&res, &a, &b);
    return res;
}

blst_fr fr_mul(const blst_fr &a, const blst_fr &b) {
    blst_fr res;
    blst_fr_mul(&res, &a, &b);
    return res;
}

blst_fr fr_neg(const blst_fr &a) {
    blst_fr res;
    blst_fr_cneg(&res, &a, true);
    return res;
}

// inverse of zero is zero
blst_fr fr_inv(const blst_fr &a) {
    blst_fr res;
    blst_fr_eucl_inverse(&res, &a);
    return res;
}

void fr_add_inplace(blst_fr &dst, const blst_fr &src) {
    blst_fr_add(&dst, &dst, &src);
}
void fr_mul_inplace(blst_fr &dst, const blst_fr &mult) {
    blst_fr_mul(&dst, &dst, &mult);
}

blst_fr fr_pow(const blst_fr &base, uint64_t exp) {
    blst_fr result = new_fr(1);
    blst_fr tmp = base;

    while (exp > 0) {
        if (exp & 1) {
            blst_fr_mul(&result, &result, &tmp);
        }
        blst_fr_sqr(&tmp, &tmp);
        exp >>= 1;
    }
    return result;
}

blst_fr fr_pow_limbs(const blst_fr &base, const uint64_t exp[4]) {
    blst_fr result = new_fr(1);
    blst_fr tmp = base;

    for (size_t i = 0; i < 4; i++) {
        uint64_t e = exp[i];
        for (size_t bit = 0; bit < 64; bit++) {
            if (e & 1) {
                blst_fr_mul(&result, &result, &tmp);
            }
            blst_fr_sqr(&tmp, &tmp);
            e >>= 1;
        }
    }
    return result;
}

fr_vec fr_powers(const blst_fr &r, size_t n) {
    fr_vec out(n);
    if (n == 0) return out;

    out[0] = new_fr(1);
    for (size_t i = 1; i < n; i++) {
        blst_fr_mul(&out[i], &out[i - 1], &r);
    }
    return out;
}

// =======================================
// ============== BIG INTS ===============
// =======================================

blst_scalar new_scalar(const uint64_t v) {
    uint64_t limbs[4] = {v, 0, 0, 0};
    blst_scalar s;
    blst_scalar_from_uint64(&s, limbs);
    return s;
}

blst_scalar scalar_from_fr(const blst_fr &x) {
    blst_scalar s;
    blst_scalar_from_fr(&s, &x);
    return s;
}

blst_fr fr_from_scalar(const blst_scalar &s) {
    blst_fr x;
    blst_fr_from_scalar(&x, &s);
    return x;
}

// =======================================
// ============== BYTES ==================
// =======================================

CodecScalarStatus scalar_from_bytes(blst_scalar &out, const byte in[32]) {
    blst_scalar_from_bendian(&out, in);
    if (!blst_scalar_fr_check(&out))
        return CodecScalarStatus::ScalarLargerThanCurveOrder;

    for (size_t i = 0; i < 32; i++) {
        if (in[i] != 0) return CodecScalarStatus::Success;
    }
    return CodecScalarStatus::Zero;
}

CodecScalarStatus fr_from_bytes(blst_fr &out, const byte in[32]) {
    blst_scalar s;
    CodecScalarStatus status = scalar_from_bytes(s, in);
    if (status == CodecScalarStatus::ScalarLargerThanCurveOrder) return status;

    blst_fr_from_scalar(&out, &s);
    return status;
}

bytes32 bytes_from_fr(const blst_fr &x) {
    bytes32 out;
    blst_scalar s = scalar_from_fr(x);
    blst_bendian_from_scalar(out.data(), &s);
    return out;
}

blst_fr fr_from_digest(const byte in[32]) {
    blst_scalar s;
    blst_scalar_from_be_bytes(&s, in, 32);
    return fr_from_scalar(s);
}

void print_fr(const blst_fr &x) {
    bytes32 be = bytes_from_fr(x);
    for (byte b : be)
        std::cout << std::hex << std::setw(2) << std::setfill('0') << (int)b;
    std::cout << std::dec << std::endl;
}
