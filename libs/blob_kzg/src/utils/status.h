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

// =======================================
// =============== CODECS ================
// =======================================

enum class CodecScalarStatus : uint8_t {
    Success,
    Zero,
    ScalarLargerThanCurveOrder,
};

enum class CodecEccStatus : uint8_t {
    Success,
    InvalidEncoding,
    CoordinateGreaterThanOrEqualModulus,
    PointNotOnCurve,
    PointNotInSubgroup,
    PointAtInfinity,
};

// =======================================
// =============== EIP-4844 ==============
// =======================================

enum class EthKzgStatus : uint8_t {
    Success,
    VerificationFailure,
    InputsLengthsMismatch,
    ScalarZero,
    ScalarLargerThanCurveOrder,
    EccInvalidEncoding,
    EccCoordinateGreaterThanOrEqualModulus,
    EccPointNotOnCurve,
    EccPointNotInSubgroup,
};

enum class TrustedSetupStatus : uint8_t {
    tsSuccess,
    tsMissingFile,
    tsWrongPreset,
    tsUnsupportedFileVersion,
    tsInvalidFile,
    tsLowLevelReadError,
    tsLowLevelWriteError,
};

// Zero scalars and the point at infinity are valid
// commitments, proofs and evaluations.
EthKzgStatus to_kzg_status(CodecScalarStatus s);
EthKzgStatus to_kzg_status(CodecEccStatus s);

const char* status_to_string(EthKzgStatus s);
const char* status_to_string(TrustedSetupStatus s);
