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

#include "blob.h"
#include "hashing.h"

// =======================================
// ============= DECODING ================
// =======================================

template <typename T, typename Decode>
static CodecScalarStatus decode_blob(
    PolynomialEval<T> &out,
    BlobSlice blob,
    ThreadPool* tp,
    Decode decode
) {
    size_t n = blob.size() / BYTES_PER_FIELD_ELEMENT;
    out.resize(n);

    // first bad chunk of each range wins, ranges merge in order
    auto chunk = [&](size_t lo, size_t hi) -> CodecScalarStatus {
        CodecScalarStatus local = CodecScalarStatus::Success;
        for (size_t i = lo; i < hi; i++) {
            CodecScalarStatus s = decode(out[i], &blob[i * BYTES_PER_FIELD_ELEMENT]);
            if (s == CodecScalarStatus::ScalarLargerThanCurveOrder
                && local == CodecScalarStatus::Success) {
                local = s;
            }
        }
        return local;
    };

    return first_error(map_chunks(tp, n, chunk), CodecScalarStatus::Success);
}

CodecScalarStatus blob_to_bigint_polynomial(
    PolynomialEval<blst_scalar> &out,
    BlobSlice blob,
    ThreadPool* tp
) {
    return decode_blob(out, blob, tp,
        [](blst_scalar &s, const byte* in) { return scalar_from_bytes(s, in); });
}

CodecScalarStatus blob_to_field_polynomial(
    PolynomialEval<blst_fr> &out,
    BlobSlice blob,
    ThreadPool* tp
) {
    return decode_blob(out, blob, tp,
        [](blst_fr &x, const byte* in) { return fr_from_bytes(x, in); });
}

// =======================================
// ============= CHALLENGES ==============
// =======================================

blst_fr fiat_shamir_challenge(BlobSlice blob, const bytes48 &commitment) {
    uint64_t n = blob.size() / BYTES_PER_FIELD_ELEMENT;

    Sha256Hasher hasher(DOMAIN_TAG_LEN + 16 + blob.size() + commitment.size());
    hasher.update(reinterpret_cast<const byte*>(FIAT_SHAMIR_PROTOCOL_DOMAIN), DOMAIN_TAG_LEN);

    // degree as a 16-byte big-endian integer
    hasher.update_u64_be(0);
    hasher.update_u64_be(n);

    hasher.update(blob.data(), blob.size());
    hasher.update(commitment.data(), commitment.size());

    Hash h;
    hasher.finalize(h.h);
    return fr_from_digest(h.h);
}

blst_fr batch_blinding_base(const bytes32 &secure_random_bytes, const fr_vec &challenges) {
    for (byte b : secure_random_bytes) {
        if (b != 0) return fr_from_digest(secure_random_bytes.data());
    }

    // the challenges go in as stored: Montgomery form, 64-bit limbs, little-endian
    Sha256Hasher hasher(DOMAIN_TAG_LEN + challenges.size() * sizeof(blst_fr));
    hasher.update(reinterpret_cast<const byte*>(RANDOM_CHALLENGE_KZG_BATCH_DOMAIN), DOMAIN_TAG_LEN);
    hasher.update(reinterpret_cast<const byte*>(challenges.data()), challenges.size() * sizeof(blst_fr));

    Hash h;
    hasher.finalize(h.h);
    return fr_from_digest(h.h);
}
