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

// extern.h
#include <cstddef>
#include <cstdint>

extern "C" {
    // status codes, see codes.cpp
    extern const int KZG_OK;
    extern const int KZG_VERIFICATION_FAILURE;
    extern const int KZG_INPUTS_LENGTHS_MISMATCH;
    extern const int KZG_SCALAR_ZERO;
    extern const int KZG_SCALAR_LARGER_THAN_CURVE_ORDER;
    extern const int KZG_ECC_INVALID_ENCODING;
    extern const int KZG_ECC_COORDINATE_GREATER_THAN_OR_EQUAL_MODULUS;
    extern const int KZG_ECC_POINT_NOT_ON_CURVE;
    extern const int KZG_ECC_POINT_NOT_IN_SUBGROUP;
    extern const int KZG_NULL_HANDLE;
    extern const int KZG_INTERNAL_ERR;

    extern const int TS_SUCCESS;
    extern const int TS_MISSING_FILE;
    extern const int TS_WRONG_PRESET;
    extern const int TS_UNSUPPORTED_FILE_VERSION;
    extern const int TS_INVALID_FILE;
    extern const int TS_LOW_LEVEL_READ_ERROR;
    extern const int TS_LOW_LEVEL_WRITE_ERROR;

    // Returns nullptr and sets *status on failure.
    void* kzg_context_open(
        const char* path,
        size_t field_elements_per_blob,
        int* status
    );
    void kzg_context_close(void* ctx);

    // Every operation below runs serially when `pool` is null and
    // returns KZG_INTERNAL_ERR if the library throws.
    void* kzg_pool_open(size_t workers);
    void kzg_pool_close(void* pool);

    int kzg_blob_to_commitment(
        void* ctx,
        void* pool,
        unsigned char commitment_out[48],
        const unsigned char* blob,
        size_t blob_size
    );

    int kzg_compute_proof(
        void* ctx,
        void* pool,
        unsigned char proof_out[48],
        unsigned char y_out[32],
        const unsigned char* blob,
        size_t blob_size,
        const unsigned char z[32]
    );

    int kzg_verify_proof(
        void* ctx,
        const unsigned char commitment[48],
        const unsigned char z[32],
        const unsigned char y[32],
        const unsigned char proof[48]
    );

    int kzg_compute_blob_proof(
        void* ctx,
        void* pool,
        unsigned char proof_out[48],
        const unsigned char* blob,
        size_t blob_size,
        const unsigned char commitment[48]
    );

    int kzg_verify_blob_proof(
        void* ctx,
        void* pool,
        const unsigned char* blob,
        size_t blob_size,
        const unsigned char commitment[48],
        const unsigned char proof[48]
    );

    // commitments and proofs are n * 48 bytes, blobs n * blob size.
    // A blobs_size too small for n is KZG_INPUTS_LENGTHS_MISMATCH.
    int kzg_verify_blob_proof_batch(
        void* ctx,
        void* pool,
        const unsigned char* blobs,
        size_t blobs_size,
        const unsigned char* commitments,
        const unsigned char* proofs,
        int64_t n,
        const unsigned char secure_random_bytes[32]
    );
}
