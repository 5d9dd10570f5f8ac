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
#include "eip4844.h"
#include "points.h"
#include "tests.h"

struct BatchFixture {
    std::vector<byte> blobs;
    std::vector<bytes48> commitments;
    std::vector<bytes48> proofs;
};

static BatchFixture make_batch(const EthKzgContext &ctx, size_t count, uint64_t seed) {
    BatchFixture f;
    size_t n = ctx.max_degree();
    f.commitments.resize(count);
    f.proofs.resize(count);

    for (size_t k = 0; k < count; k++) {
        std::vector<byte> blob = seeded_blob(n, seed + k);
        assert(blob_to_kzg_commitment(ctx, f.commitments[k], blob) == EthKzgStatus::Success);
        assert(compute_blob_kzg_proof(ctx, f.proofs[k], blob, f.commitments[k]) == EthKzgStatus::Success);
        f.blobs.insert(f.blobs.end(), blob.begin(), blob.end());
    }
    return f;
}

void test_challenges() {
    printf("TESTING FIAT-SHAMIR AND BLINDING \n");

    const size_t N = 4;
    std::vector<byte> blob = seeded_blob(N, 10);
    bytes48 C = compress_p1_affine(*BLS12_381::g1());

    blst_fr z1 = fiat_shamir_challenge(blob, C);
    blst_fr z2 = fiat_shamir_challenge(blob, C);
    assert(equal_fr(z1, z2));
    printf("challenge: ");
    print_fr(z1);

    // the transcript covers blob and commitment
    std::vector<byte> other = blob;
    other[100] ^= 0x01;
    assert(!equal_fr(z1, fiat_shamir_challenge(other, C)));
    bytes48 C2 = C;
    C2[47] ^= 0x01;
    assert(!equal_fr(z1, fiat_shamir_challenge(blob, C2)));

    // transcript layout
    Sha256Hasher hasher;
    hasher.update(reinterpret_cast<const byte*>(FIAT_SHAMIR_PROTOCOL_DOMAIN), DOMAIN_TAG_LEN);
    byte degree[16] = {0};
    degree[15] = static_cast<byte>(N);
    hasher.update(degree, sizeof(degree));
    hasher.update(blob.data(), blob.size());
    hasher.update(C.data(), C.size());
    Hash h;
    hasher.finalize(h.h);
    assert(equal_fr(z1, fr_from_digest(h.h)));

    // a non-zero seed is used directly
    fr_vec zs = {z1, new_fr(3)};
    bytes32 seed{};
    seed[31] = 9;
    assert(equal_fr(batch_blinding_base(seed, zs), new_fr(9)));

    // an all-zero seed hashes the challenges
    bytes32 zero{};
    blst_fr r1 = batch_blinding_base(zero, zs);
    blst_fr r2 = batch_blinding_base(zero, zs);
    assert(equal_fr(r1, r2));
    assert(!fr_is_zero(r1));

    // blst_fr words are Montgomery form: 1 is stored as 2^256 mod r
    static_assert(sizeof(blst_fr) == 32);
    blst_fr one = new_fr(1);
    const uint64_t R_MOD_r[4] = {
        0x00000001fffffffe, 0x5884b7fa00034802,
        0x998c4fefecbc4ff5, 0x1824b159acc5056f
    };
    assert(memcmp(one.l, R_MOD_r, sizeof(R_MOD_r)) == 0);

    Sha256Hasher fallback;
    fallback.update(reinterpret_cast<const byte*>(RANDOM_CHALLENGE_KZG_BATCH_DOMAIN), DOMAIN_TAG_LEN);
    for (const blst_fr &z : zs) {
        fallback.update(reinterpret_cast<const byte*>(z.l), sizeof(z.l));
    }
    fallback.finalize(h.h);
    assert(equal_fr(r1, fr_from_digest(h.h)));

    // not the canonical big-endian encoding
    Sha256Hasher canonical;
    canonical.update(reinterpret_cast<const byte*>(RANDOM_CHALLENGE_KZG_BATCH_DOMAIN), DOMAIN_TAG_LEN);
    for (const blst_fr &z : zs) {
        bytes32 be = bytes_from_fr(z);
        canonical.update(be.data(), be.size());
    }
    canonical.finalize(h.h);
    assert(!equal_fr(r1, fr_from_digest(h.h)));

    zs[1] = new_fr(4);
    assert(!equal_fr(r1, batch_blinding_base(zero, zs)));

    printf("FIAT-SHAMIR AND BLINDING SUCCESS\n\n");
}

void test_batch_verify() {
    printf("TESTING BLOB BATCH VERIFY \n");

    const size_t N = 4;
    const size_t count = 5;
    EthKzgContext ctx = new_testing_setup(new_fr(TEST_TAU), N);
    BatchFixture f = make_batch(ctx, count, 20);
    int64_t n = static_cast<int64_t>(count);

    Hash entropy = gen_rand_32();
    bytes32 seed;
    memcpy(seed.data(), entropy.h, 32);
    printf("seed: ");
    print_hash(entropy);
    bytes32 zero{};

    assert(verify_blob_kzg_proof_batch(ctx, f.blobs, f.commitments, f.proofs, n, seed) == EthKzgStatus::Success);
    assert(verify_blob_kzg_proof_batch(ctx, f.blobs, f.commitments, f.proofs, n, zero) == EthKzgStatus::Success);

    // prefixes of the batch
    assert(verify_blob_kzg_proof_batch(ctx, f.blobs, f.commitments, f.proofs, 1, seed) == EthKzgStatus::Success);
    assert(verify_blob_kzg_proof_batch(ctx, f.blobs, f.commitments, f.proofs, 0, seed) == EthKzgStatus::Success);
    assert(verify_blob_kzg_proof_batch(ctx, f.blobs, f.commitments, f.proofs, -1, seed) == EthKzgStatus::VerificationFailure);

    // empty buffers are fine when n == 0
    assert(verify_blob_kzg_proof_batch(ctx, BlobSlice(), {}, {}, 0, seed) == EthKzgStatus::Success);

    printf("BLOB BATCH VERIFY SUCCESS\n\n");
}

void test_batch_rejects() {
    printf("TESTING BLOB BATCH REJECTS \n");

    const size_t N = 4;
    const size_t count = 4;
    EthKzgContext ctx = new_testing_setup(new_fr(TEST_TAU), N);
    BatchFixture f = make_batch(ctx, count, 40);
    int64_t n = static_cast<int64_t>(count);
    bytes32 seed{};
    seed[0] = 0x42;
    seed[31] = 0x07;

    // swapped proofs
    std::vector<bytes48> swapped = f.proofs;
    std::swap(swapped[1], swapped[2]);
    assert(verify_blob_kzg_proof_batch(ctx, f.blobs, f.commitments, swapped, n, seed) == EthKzgStatus::VerificationFailure);
    assert(verify_blob_kzg_proof_batch(ctx, f.blobs, f.commitments, swapped, n, bytes32{}) == EthKzgStatus::VerificationFailure);

    // one tampered blob
    std::vector<byte> tampered = f.blobs;
    tampered[3 * N * BYTES_PER_FIELD_ELEMENT + 31] ^= 0x01;
    assert(verify_blob_kzg_proof_batch(ctx, tampered, f.commitments, f.proofs, n, seed) == EthKzgStatus::VerificationFailure);

    // short inputs
    std::span<const bytes48> short_cs(f.commitments.data(), count - 1);
    assert(verify_blob_kzg_proof_batch(ctx, f.blobs, short_cs, f.proofs, n, seed) == EthKzgStatus::InputsLengthsMismatch);
    BlobSlice short_blobs(f.blobs.data(), f.blobs.size() - 1);
    assert(verify_blob_kzg_proof_batch(ctx, short_blobs, f.commitments, f.proofs, n, seed) == EthKzgStatus::InputsLengthsMismatch);

    // decode errors surface as their own status
    std::vector<bytes48> bad_cs = f.commitments;
    bad_cs[2] = bytes48{};
    assert(verify_blob_kzg_proof_batch(ctx, f.blobs, bad_cs, f.proofs, n, seed) == EthKzgStatus::EccInvalidEncoding);

    std::vector<byte> big = f.blobs;
    memset(&big[N * BYTES_PER_FIELD_ELEMENT], 0xff, BYTES_PER_FIELD_ELEMENT);
    assert(verify_blob_kzg_proof_batch(ctx, big, f.commitments, f.proofs, n, seed) == EthKzgStatus::ScalarLargerThanCurveOrder);

    // the earliest failing entry wins
    bad_cs[0] = f.commitments[0];
    assert(verify_blob_kzg_proof_batch(ctx, big, bad_cs, f.proofs, n, seed) == EthKzgStatus::ScalarLargerThanCurveOrder);

    printf("BLOB BATCH REJECTS SUCCESS\n\n");
}

void main_batch() {
    test_challenges();
    test_batch_verify();
    test_batch_rejects();
}
