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

#include "status.h"

EthKzgStatus to_kzg_status(CodecScalarStatus s) {
    switch (s) {
        case CodecScalarStatus::Success:
        case CodecScalarStatus::Zero:
            return EthKzgStatus::Success;
        case CodecScalarStatus::ScalarLargerThanCurveOrder:
            return EthKzgStatus::ScalarLargerThanCurveOrder;
    }
    return EthKzgStatus::ScalarLargerThanCurveOrder;
}

EthKzgStatus to_kzg_status(CodecEccStatus s) {
    switch (s) {
        case CodecEccStatus::Success:
        case CodecEccStatus::PointAtInfinity:
            return EthKzgStatus::Success;
        case CodecEccStatus::InvalidEncoding:
            return EthKzgStatus::EccInvalidEncoding;
        case CodecEccStatus::CoordinateGreaterThanOrEqualModulus:
            return EthKzgStatus::EccCoordinateGreaterThanOrEqualModulus;
        case CodecEccStatus::PointNotOnCurve:
            return EthKzgStatus::EccPointNotOnCurve;
        case CodecEccStatus::PointNotInSubgroup:
            return EthKzgStatus::EccPointNotInSubgroup;
    }
    return EthKzgStatus::EccInvalidEncoding;
}

const char* status_to_string(EthKzgStatus s) {
    switch (s) {
        case EthKzgStatus::Success: return "Success";
        case EthKzgStatus::VerificationFailure: return "VerificationFailure";
        case EthKzgStatus::InputsLengthsMismatch: return "InputsLengthsMismatch";
        case EthKzgStatus::ScalarZero: return "ScalarZero";
        case EthKzgStatus::ScalarLargerThanCurveOrder: return "ScalarLargerThanCurveOrder";
        case EthKzgStatus::EccInvalidEncoding: return "EccInvalidEncoding";
        case EthKzgStatus::EccCoordinateGreaterThanOrEqualModulus:
            return "EccCoordinateGreaterThanOrEqualModulus";
        case EthKzgStatus::EccPointNotOnCurve: return "EccPointNotOnCurve";
        case EthKzgStatus::EccPointNotInSubgroup: return "EccPointNotInSubgroup";
    }
    return "Unknown";
}

const char* status_to_string(TrustedSetupStatus s) {
    switch (s) {
        case TrustedSetupStatus::tsSuccess: return "tsSuccess";
        case TrustedSetupStatus::tsMissingFile: return "tsMissingFile";
        case TrustedSetupStatus::tsWrongPreset: return "tsWrongPreset";
        case TrustedSetupStatus::tsUnsupportedFileVersion: return "tsUnsupportedFileVersion";
        case TrustedSetupStatus::tsInvalidFile: return "tsInvalidFile";
        case TrustedSetupStatus::tsLowLevelReadError: return "tsLowLevelReadError";
        case TrustedSetupStatus::tsLowLevelWriteError: return "tsLowLevelWriteError";
    }
    return "Unknown";
}
