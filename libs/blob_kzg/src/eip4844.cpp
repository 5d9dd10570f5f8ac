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

#include "eip4844.h"
#include "kzg.h"
#include "points.h"

const EthKzgStatus OK = EthKzgStatus::Success;

// =======================================
// ============= COMMIT ==================
// =======================================

static EthKzgStatus commit_impl(
    ThreadPool* tp,
    const EthKzgContext &ctx,
    bytes48 &commitment,
    BlobSlice blob
) {
    if (blob.size() != ctx.blob_size()) return EthKzgStatus::InputsLengthsMismatch;

    PolynomialEval<blst_scalar> poly;
    EthKzgStatus s = to_kzg_status(blob_to_bigint_polynomial(poly, blob, tp));
    if (s != OK) return s;

    commitment = compress_p1_affine(kzg_commit(ctx, poly, tp));
    return OK;
}

// =======================================
// ============= PROVE ===================
// =======================================

static EthKzgStatus prove_impl(
    ThreadPool* tp,
    const EthKzgContext &ctx,
    bytes48 &proof,
    bytes32 &y_out,
    BlobSlice blob,
    const bytes32 &z_bytes
) {
    if (blob.size() != ctx.blob_size()) return EthKzgStatus::InputsLengthsMismatch;

    blst_fr z;
    EthKzgStatus s = to_kzg_status(fr_from_bytes(z, z_bytes.data()));
    if (s != OK) return s;

    PolynomialEval<blst_fr> poly;
    s = to_kzg_status(blob_to_field_polynomial(poly, blob, tp));
    if (s != OK) return s;

    auto [Pi, y] = kzg_prove(ctx, poly, z, tp);
    proof = compress_p1_affine(Pi);
    y_out = bytes_from_fr(y);
    return OK;
}

static EthKzgStatus prove_blob_impl(
    ThreadPool* tp,
    const EthKzgContext &ctx,
    bytes48 &proof,
    BlobSlice blob,
    const bytes48 &commitment
) {
    if (blob.size() != ctx.blob_size()) return EthKzgStatus::InputsLengthsMismatch;

    blst_p1_affine C;
    EthKzgStatus s = to_kzg_status(p1_from_bytes(C, commitment.data()));
    if (s != OK) return s;

    PolynomialEval<blst_fr> poly;
    s = to_kzg_status(blob_to_field_polynomial(poly, blob, tp));
    if (s != OK) return s;

    blst_fr z = fiat_shamir_challenge(blob, commitment);
    blst_p1_affine Pi = std::get<0>(kzg_prove(ctx, poly, z, tp));
    proof = compress_p1_affine(Pi);
    return OK;
}

// =======================================
// ============= VERIFY ==================
// =======================================

static EthKzgStatus verify_blob_impl(
    ThreadPool* tp,
    const EthKzgContext &ctx,
    BlobSlice blob,
    const bytes48 &commitment,
    const bytes48 &proof
) {
    if (blob.size() != ctx.blob_size()) return EthKzgStatus::InputsLengthsMismatch;

    blst_p1_affine C, Pi;
    EthKzgStatus s = to_kzg_status(p1_from_bytes(C, commitment.data()));
    if (s != OK) return s;

    s = to_kzg_status(p1_from_bytes(Pi, proof.data()));
    if (s != OK) return s;

    PolynomialEval<blst_fr> poly;
    s = to_kzg_status(blob_to_field_polynomial(poly, blob, tp));
    if (s != OK) return s;

    blst_fr z = fiat_shamir_challenge(blob, commitment);
    blst_fr y = eval_at(poly, z, ctx.domain, tp);

    if (!kzg_verify(C, z, y, Pi, ctx.tau_g2())) return EthKzgStatus::VerificationFailure;
    return OK;
}

static EthKzgStatus verify_batch_impl(
    ThreadPool* tp,
    const EthKzgContext &ctx,
    BlobSlice blobs,
    std::span<const bytes48> commitments,
    std::span<const bytes48> proofs,
    int64_t n,
    const bytes32 &secure_random_bytes
) {
    if (n < 0) return EthKzgStatus::VerificationFailure;
    if (n == 0) return OK;

    size_t count = static_cast<size_t>(n);
    size_t blob_size = ctx.blob_size();
    if (commitments.size() < count || proofs.size() < count || blobs.size() < count * blob_size) {
        return EthKzgStatus::InputsLengthsMismatch;
    }

    std::vector<blst_p1_affine> Cs(count), Pis(count);
    fr_vec Zs(count), Ys(count);

    // parallel across entries only, each entry runs serially
    auto entries = [&](size_t lo, size_t hi) -> EthKzgStatus {
        PolynomialEval<blst_fr> poly;
        EthKzgStatus s;
        for (size_t i = lo; i < hi; i++) {
            BlobSlice blob = blobs.subspan(i * blob_size, blob_size);

            s = to_kzg_status(p1_from_bytes(Cs[i], commitments[i].data()));
            if (s != OK) return s;

            s = to_kzg_status(blob_to_field_polynomial(poly, blob));
            if (s != OK) return s;

            Zs[i] = fiat_shamir_challenge(blob, commitments[i]);
            Ys[i] = eval_at(poly, Zs[i], ctx.domain);

            s = to_kzg_status(p1_from_bytes(Pis[i], proofs[i].data()));
            if (s != OK) return s;
        }
        return OK;
    };

    EthKzgStatus s = first_error(map_chunks(tp, count, entries), OK);
    if (s != OK) return s;

    blst_fr r = batch_blinding_base(secure_random_bytes, Zs);
    fr_vec r_powers = fr_powers(r, count);

    if (!kzg_verify_batch(Cs, Zs, Ys, Pis, r_powers, ctx.tau_g2(), tp)) {
        return EthKzgStatus::VerificationFailure;
    }
    return OK;
}

// =======================================
// ============= PUBLIC ==================
// =======================================

EthKzgStatus blob_to_kzg_commitment(
    const EthKzgContext &ctx,
    bytes48 &commitment,
    BlobSlice blob
) {
    return commit_impl(nullptr, ctx, commitment, blob);
}

EthKzgStatus blob_to_kzg_commitment_parallel(
    ThreadPool &tp,
    const EthKzgContext &ctx,
    bytes48 &commitment,
    BlobSlice blob
) {
    return commit_impl(&tp, ctx, commitment, blob);
}

EthKzgStatus compute_kzg_proof(
    const EthKzgContext &ctx,
    bytes48 &proof,
    bytes32 &y,
    BlobSlice blob,
    const bytes32 &z
) {
    return prove_impl(nullptr, ctx, proof, y, blob, z);
}

EthKzgStatus compute_kzg_proof_parallel(
    ThreadPool &tp,
    const EthKzgContext &ctx,
    bytes48 &proof,
    bytes32 &y,
    BlobSlice blob,
    const bytes32 &z
) {
    return prove_impl(&tp, ctx, proof, y, blob, z);
}

EthKzgStatus verify_kzg_proof(
    const EthKzgContext &ctx,
    const bytes48 &commitment,
    const bytes32 &z_bytes,
    const bytes32 &y_bytes,
    const bytes48 &proof
) {
    blst_p1_affine C, Pi;
    blst_fr z, y;

    EthKzgStatus s = to_kzg_status(p1_from_bytes(C, commitment.data()));
    if (s != OK) return s;

    s = to_kzg_status(fr_from_bytes(z, z_bytes.data()));
    if (s != OK) return s;

    s = to_kzg_status(fr_from_bytes(y, y_bytes.data()));
    if (s != OK) return s;

    s = to_kzg_status(p1_from_bytes(Pi, proof.data()));
    if (s != OK) return s;

    if (!kzg_verify(C, z, y, Pi, ctx.tau_g2())) return EthKzgStatus::VerificationFailure;
    return OK;
}

EthKzgStatus compute_blob_kzg_proof(
    const EthKzgContext &ctx,
    bytes48 &proof,
    BlobSlice blob,
    const bytes48 &commitment
) {
    return prove_blob_impl(nullptr, ctx, proof, blob, commitment);
}

EthKzgStatus compute_blob_kzg_proof_parallel(
    ThreadPool &tp,
    const EthKzgContext &ctx,
    bytes48 &proof,
    BlobSlice blob,
    const bytes48 &commitment
) {
    return prove_blob_impl(&tp, ctx, proof, blob, commitment);
}

EthKzgStatus verify_blob_kzg_proof(
    const EthKzgContext &ctx,
    BlobSlice blob,
    const bytes48 &commitment,
    const bytes48 &proof
) {
    return verify_blob_impl(nullptr, ctx, blob, commitment, proof);
}

EthKzgStatus verify_blob_kzg_proof_parallel(
    ThreadPool &tp,
    const EthKzgContext &ctx,
    BlobSlice blob,
    const bytes48 &commitment,
    const bytes48 &proof
) {
    return verify_blob_impl(&tp, ctx, blob, commitment, proof);
}

EthKzgStatus verify_blob_kzg_proof_batch(
    const EthKzgContext &ctx,
    BlobSlice blobs,
    std::span<const bytes48> commitments,
    std::span<const bytes48> proofs,
    int64_t n,
    const bytes32 &secure_random_bytes
) {
    return verify_batch_impl(nullptr, ctx, blobs, commitments, proofs, n, secure_random_bytes);
}

EthKzgStatus verify_blob_kzg_proof_batch_parallel(
    ThreadPool &tp,
    const EthKzgContext &ctx,
    BlobSlice blobs,
    std::span<const bytes48> commitments,
    std::span<const bytes48> proofs,
    int64_t n,
    const bytes32 &secure_random_bytes
) {
    return verify_batch_impl(&tp, ctx, blobs, commitments, proofs, n, secure_random_bytes);
}
