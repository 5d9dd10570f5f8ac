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
#include <cstdint>
#include <span>
#include "blob.h"
#include "settings.h"
#include "status.h"
#include "thread_pool.h"

// Byte-level blob operations. Every call validates its inputs and
// reports through EthKzgStatus. A blob is max_degree() * 32 bytes.
// The _parallel editions split work across `tp`. Allocation and pool
// failures propagate as exceptions.

EthKzgStatus blob_to_kzg_commitment(
    const EthKzgContext &ctx,
    bytes48 &commitment,
    BlobSlice blob
);

EthKzgStatus blob_to_kzg_commitment_parallel(
    ThreadPool &tp,
    const EthKzgContext &ctx,
    bytes48 &commitment,
    BlobSlice blob
);

EthKzgStatus compute_kzg_proof(
    const EthKzgContext &ctx,
    bytes48 &proof,
    bytes32 &y,
    BlobSlice blob,
    const bytes32 &z
);

EthKzgStatus compute_kzg_proof_parallel(
    ThreadPool &tp,
    const EthKzgContext &ctx,
    bytes48 &proof,
    bytes32 &y,
    BlobSlice blob,
    const bytes32 &z
);

EthKzgStatus verify_kzg_proof(
    const EthKzgContext &ctx,
    const bytes48 &commitment,
    const bytes32 &z,
    const bytes32 &y,
    const bytes48 &proof
);

// Opening at the Fiat-Shamir challenge of (blob, commitment).
EthKzgStatus compute_blob_kzg_proof(
    const EthKzgContext &ctx,
    bytes48 &proof,
    BlobSlice blob,
    const bytes48 &commitment
);

EthKzgStatus compute_blob_kzg_proof_parallel(
    ThreadPool &tp,
    const EthKzgContext &ctx,
    bytes48 &proof,
    BlobSlice blob,
    const bytes48 &commitment
);

EthKzgStatus verify_blob_kzg_proof(
    const EthKzgContext &ctx,
    BlobSlice blob,
    const bytes48 &commitment,
    const bytes48 &proof
);

EthKzgStatus verify_blob_kzg_proof_parallel(
    ThreadPool &tp,
    const EthKzgContext &ctx,
    BlobSlice blob,
    const bytes48 &commitment,
    const bytes48 &proof
);

// `blobs` holds n blobs back to back. n < 0 fails, n == 0 succeeds.
// A non-zero `secure_random_bytes` seeds the blinding weights.
EthKzgStatus verify_blob_kzg_proof_batch(
    const EthKzgContext &ctx,
    BlobSlice blobs,
    std::span<const bytes48> commitments,
    std::span<const bytes48> proofs,
    int64_t n,
    const bytes32 &secure_random_bytes
);

EthKzgStatus verify_blob_kzg_proof_batch_parallel(
    ThreadPool &tp,
    const EthKzgContext &ctx,
    BlobSlice blobs,
    std::span<const bytes48> commitments,
    std::span<const bytes48> proofs,
    int64_t n,
    const bytes32 &secure_random_bytes
);
