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

#include <cassert>
#include <stdexcept>
#include "polynomial.h"
#include "tests.h"

static fr_vec seeded_frs(size_t n, uint64_t seed) {
    fr_vec out(n);
    Hash hash = new_hash();
    for (size_t i = 0; i < n; i++) {
        seeded_hash(&hash, seed + i);
        out[i] = fr_from_digest(hash.h);
    }
    return out;
}

void test_bit_reversal() {
    printf("TESTING BIT REVERSAL \n");

    assert(is_pow2(1) && is_pow2(2) && is_pow2(4096));
    assert(!is_pow2(0) && !is_pow2(3) && !is_pow2(4095));
    assert(log2_pow2(1) == 0);
    assert(log2_pow2(4096) == 12);

    assert(reverse_bits(1, 3) == 4);
    assert(reverse_bits(3, 3) == 6);
    assert(reverse_bits(6, 3) == 3);

    std::vector<size_t> v = {0, 1, 2, 3, 4, 5, 6, 7};
    bit_reversal_permute(v);
    std::vector<size_t> expected = {0, 4, 2, 6, 1, 5, 3, 7};
    assert(v == expected);

    // involution
    bit_reversal_permute(v);
    for (size_t i = 0; i < v.size(); i++) assert(v[i] == i);

    printf("BIT REVERSAL SUCCESS\n\n");
}

void test_domain() {
    printf("TESTING ROOTS OF UNITY \n");

    const size_t N = 16;
    PolyDomainEval d = new_domain(N);
    assert(d.size() == N);

    // brp order puts 1 then -1 first
    assert(fr_is_one(d.roots_of_unity[0]));
    assert(equal_fr(d.roots_of_unity[1], fr_neg(new_fr(1))));

    for (size_t i = 0; i < N; i++) {
        assert(fr_is_one(fr_pow(d.roots_of_unity[i], N)));
        for (size_t j = i + 1; j < N; j++) {
            assert(!equal_fr(d.roots_of_unity[i], d.roots_of_unity[j]));
        }
    }

    // natural index 1 sits at brp(1)
    blst_fr w = root_of_unity(N);
    assert(equal_fr(d.roots_of_unity[reverse_bits(1, 4)], w));

    assert(fr_is_one(fr_mul(d.inv_max_degree, new_fr(N))));

    bool threw = false;
    try { new_domain(12); } catch (const std::invalid_argument &) { threw = true; }
    assert(threw);

    threw = false;
    try { new_domain(1); } catch (const std::invalid_argument &) { threw = true; }
    assert(threw);

    printf("ROOTS OF UNITY SUCCESS\n\n");
}

void test_batch_inv() {
    printf("TESTING BATCH INVERSION \n");

    fr_vec in = seeded_frs(10, 500);
    fr_vec out(in.size());
    assert(batch_inv(out.data(), in.data(), in.size()));
    for (size_t i = 0; i < in.size(); i++) {
        assert(fr_is_one(fr_mul(in[i], out[i])));
        assert(equal_fr(out[i], fr_inv(in[i])));
    }

    in[3] = new_fr(0);
    assert(!batch_inv(out.data(), in.data(), in.size()));

    printf("BATCH INVERSION SUCCESS\n\n");
}

void test_barycentric() {
    printf("TESTING BARYCENTRIC EVALUATION \n");

    const size_t N = 16;
    PolyDomainEval d = new_domain(N);

    // p(x) = a + b*x
    blst_fr a = new_fr(7), b = new_fr(11);
    PolynomialEval<blst_fr> poly(N);
    for (size_t i = 0; i < N; i++) {
        poly[i] = fr_add(a, fr_mul(b, d.roots_of_unity[i]));
    }

    // off the domain
    blst_fr z = new_fr(12345);
    blst_fr y = eval_at(poly, z, d);
    assert(equal_fr(y, fr_add(a, fr_mul(b, z))));

    // on the domain, the stored evaluation comes back
    fr_vec inverses;
    int64_t idx = inverse_roots_minus_z(inverses, d, d.roots_of_unity[5]);
    assert(idx == 5);
    assert(fr_is_zero(inverses[5]));
    y = eval_with_inverses(poly, inverses, idx, d.roots_of_unity[5], d);
    assert(equal_fr(y, poly[5]));

    // random polynomial agrees with the naive sum over a shifted point
    PolynomialEval<blst_fr> r = seeded_frs(N, 900);
    blst_fr zz = new_fr(99);
    blst_fr expected = new_fr(0);
    // Lagrange basis at zz: L_i(zz) = w_i (zz^N - 1) / (N (zz - w_i))
    blst_fr scale = fr_mul(fr_sub(fr_pow(zz, N), new_fr(1)), d.inv_max_degree);
    for (size_t i = 0; i < N; i++) {
        blst_fr l = fr_mul(fr_mul(d.roots_of_unity[i], scale), fr_inv(fr_sub(zz, d.roots_of_unity[i])));
        fr_add_inplace(expected, fr_mul(l, r[i]));
    }
    assert(equal_fr(eval_at(r, zz, d), expected));

    printf("BARYCENTRIC EVALUATION SUCCESS\n\n");
}

void test_quotient() {
    printf("TESTING QUOTIENT \n");

    const size_t N = 16;
    PolyDomainEval d = new_domain(N);

    // p(x) = x^2, q(x) = (x^2 - z^2) / (x - z) = x + z
    PolynomialEval<blst_fr> poly(N);
    for (size_t i = 0; i < N; i++) {
        poly[i] = fr_mul(d.roots_of_unity[i], d.roots_of_unity[i]);
    }

    blst_fr z = new_fr(424242);
    fr_vec inverses;
    int64_t idx = inverse_roots_minus_z(inverses, d, z);
    assert(idx == -1);
    blst_fr y = eval_with_inverses(poly, inverses, idx, z, d);
    assert(equal_fr(y, fr_mul(z, z)));

    PolynomialEval<blst_fr> q = derive_quotient(poly, z, y, inverses, idx, d);
    for (size_t i = 0; i < N; i++) {
        assert(equal_fr(q[i], fr_add(d.roots_of_unity[i], z)));
    }

    // z on the domain, the quotient entry at z is rebuilt from the rest
    for (size_t m : {size_t(0), size_t(3), size_t(N - 1)}) {
        blst_fr zm = d.roots_of_unity[m];
        idx = inverse_roots_minus_z(inverses, d, zm);
        assert(idx == static_cast<int64_t>(m));

        y = eval_with_inverses(poly, inverses, idx, zm, d);
        q = derive_quotient(poly, zm, y, inverses, idx, d);
        for (size_t i = 0; i < N; i++) {
            assert(equal_fr(q[i], fr_add(d.roots_of_unity[i], zm)));
        }
    }

    printf("QUOTIENT SUCCESS\n\n");
}

void main_poly() {
    test_bit_reversal();
    test_domain();
    test_batch_inv();
    test_barycentric();
    test_quotient();
}
