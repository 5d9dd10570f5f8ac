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
#include <stdexcept>
#include "eip4844.h"
#include "extern.h"
#include "tsif.h"

static int code(EthKzgStatus s) { return static_cast<int>(s); }

static bytes48 to_bytes48(const unsigned char* src) {
    bytes48 out;
    memcpy(out.data(), src, out.size());
    return out;
}

static bytes32 to_bytes32(const unsigned char* src) {
    bytes32 out;
    memcpy(out.data(), src, out.size());
    return out;
}

extern "C" {

// =======================================
// ============= HANDLES =================
// =======================================

void* kzg_context_open(const char* path, size_t field_elements_per_blob, int* status) {
    if (path == nullptr) {
        if (status) *status = TS_MISSING_FILE;
        return nullptr;
    }

    try {
        auto res = load_trusted_setup(path, field_elements_per_blob);
        if (res.is_err()) {
            if (status) *status = static_cast<int>(res.unwrap_err());
            return nullptr;
        }
        if (status) *status = TS_SUCCESS;
        return new EthKzgContext(res.take());

    } catch (const std::exception &) {
        if (status) *status = TS_LOW_LEVEL_READ_ERROR;
        return nullptr;
    }
}

void kzg_context_close(void* ctx) {
    delete static_cast<EthKzgContext*>(ctx);
}

void* kzg_pool_open(size_t workers) {
    try {
        return new ThreadPool(workers);
    } catch (const std::exception &) {
        return nullptr;
    }
}

void kzg_pool_close(void* pool) {
    delete static_cast<ThreadPool*>(pool);
}

// =======================================
// ============= OPERATIONS ==============
// =======================================

int kzg_blob_to_commitment(
    void* ctx,
    void* pool,
    unsigned char commitment_out[48],
    const unsigned char* blob,
    size_t blob_size
) {
    if (!ctx) return KZG_NULL_HANDLE;
    auto &c = *static_cast<EthKzgContext*>(ctx);

    try {
        bytes48 commitment;
        BlobSlice b(blob, blob_size);
        EthKzgStatus s = pool
            ? blob_to_kzg_commitment_parallel(*static_cast<ThreadPool*>(pool), c, commitment, b)
            : blob_to_kzg_commitment(c, commitment, b);

        if (s == EthKzgStatus::Success) memcpy(commitment_out, commitment.data(), 48);
        return code(s);

    } catch (const std::exception &) {
        return KZG_INTERNAL_ERR;
    }
}

int kzg_compute_proof(
    void* ctx,
    void* pool,
    unsigned char proof_out[48],
    unsigned char y_out[32],
    const unsigned char* blob,
    size_t blob_size,
    const unsigned char z[32]
) {
    if (!ctx) return KZG_NULL_HANDLE;
    auto &c = *static_cast<EthKzgContext*>(ctx);

    try {
        bytes48 proof;
        bytes32 y;
        bytes32 zz = to_bytes32(z);
        BlobSlice b(blob, blob_size);
        EthKzgStatus s = pool
            ? compute_kzg_proof_parallel(*static_cast<ThreadPool*>(pool), c, proof, y, b, zz)
            : compute_kzg_proof(c, proof, y, b, zz);

        if (s == EthKzgStatus::Success) {
            memcpy(proof_out, proof.data(), 48);
            memcpy(y_out, y.data(), 32);
        }
        return code(s);

    } catch (const std::exception &) {
        return KZG_INTERNAL_ERR;
    }
}

int kzg_verify_proof(
    void* ctx,
    const unsigned char commitment[48],
    const unsigned char z[32],
    const unsigned char y[32],
    const unsigned char proof[48]
) {
    if (!ctx) return KZG_NULL_HANDLE;
    auto &c = *static_cast<EthKzgContext*>(ctx);

    try {
        return code(verify_kzg_proof(
            c, to_bytes48(commitment), to_bytes32(z), to_bytes32(y), to_bytes48(proof)));

    } catch (const std::exception &) {
        return KZG_INTERNAL_ERR;
    }
}

int kzg_compute_blob_proof(
    void* ctx,
    void* pool,
    unsigned char proof_out[48],
    const unsigned char* blob,
    size_t blob_size,
    const unsigned char commitment[48]
) {
    if (!ctx) return KZG_NULL_HANDLE;
    auto &c = *static_cast<EthKzgContext*>(ctx);

    try {
        bytes48 proof;
        bytes48 C = to_bytes48(commitment);
        BlobSlice b(blob, blob_size);
        EthKzgStatus s = pool
            ? compute_blob_kzg_proof_parallel(*static_cast<ThreadPool*>(pool), c, proof, b, C)
            : compute_blob_kzg_proof(c, proof, b, C);

        if (s == EthKzgStatus::Success) memcpy(proof_out, proof.data(), 48);
        return code(s);

    } catch (const std::exception &) {
        return KZG_INTERNAL_ERR;
    }
}

int kzg_verify_blob_proof(
    void* ctx,
    void* pool,
    const unsigned char* blob,
    size_t blob_size,
    const unsigned char commitment[48],
    const unsigned char proof[48]
) {
    if (!ctx) return KZG_NULL_HANDLE;
    auto &c = *static_cast<EthKzgContext*>(ctx);

    try {
        BlobSlice b(blob, blob_size);
        bytes48 C = to_bytes48(commitment);
        bytes48 Pi = to_bytes48(proof);
        EthKzgStatus s = pool
            ? verify_blob_kzg_proof_parallel(*static_cast<ThreadPool*>(pool), c, b, C, Pi)
            : verify_blob_kzg_proof(c, b, C, Pi);
        return code(s);

    } catch (const std::exception &) {
        return KZG_INTERNAL_ERR;
    }
}

int kzg_verify_blob_proof_batch(
    void* ctx,
    void* pool,
    const unsigned char* blobs,
    size_t blobs_size,
    const unsigned char* commitments,
    const unsigned char* proofs,
    int64_t n,
    const unsigned char secure_random_bytes[32]
) {
    if (!ctx) return KZG_NULL_HANDLE;
    if (n < 0) return KZG_VERIFICATION_FAILURE;
    auto &c = *static_cast<EthKzgContext*>(ctx);

    // blobs_size bounds n before any commitment or proof is read
    size_t count = static_cast<size_t>(n);
    if (count > blobs_size / c.blob_size()) return KZG_INPUTS_LENGTHS_MISMATCH;

    try {
        std::vector<bytes48> Cs(count), Pis(count);
        for (size_t i = 0; i < count; i++) {
            Cs[i] = to_bytes48(commitments + 48 * i);
            Pis[i] = to_bytes48(proofs + 48 * i);
        }

        BlobSlice b(blobs, blobs_size);
        bytes32 seed = to_bytes32(secure_random_bytes);
        EthKzgStatus s = pool
            ? verify_blob_kzg_proof_batch_parallel(*static_cast<ThreadPool*>(pool), c, b, Cs, Pis, n, seed)
            : verify_blob_kzg_proof_batch(c, b, Cs, Pis, n, seed);
        return code(s);

    } catch (const std::exception &) {
        return KZG_INTERNAL_ERR;
    }
}

}
