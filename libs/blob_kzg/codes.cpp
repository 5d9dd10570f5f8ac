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

#include "extern.h"
#include "status.h"

extern "C" {

extern const int KZG_OK                                          = static_cast<int>(EthKzgStatus::Success);
extern const int KZG_VERIFICATION_FAILURE                        = static_cast<int>(EthKzgStatus::VerificationFailure);
extern const int KZG_INPUTS_LENGTHS_MISMATCH                     = static_cast<int>(EthKzgStatus::InputsLengthsMismatch);
extern const int KZG_SCALAR_ZERO                                 = static_cast<int>(EthKzgStatus::ScalarZero);
extern const int KZG_SCALAR_LARGER_THAN_CURVE_ORDER              = static_cast<int>(EthKzgStatus::ScalarLargerThanCurveOrder);
extern const int KZG_ECC_INVALID_ENCODING                        = static_cast<int>(EthKzgStatus::EccInvalidEncoding);
extern const int KZG_ECC_COORDINATE_GREATER_THAN_OR_EQUAL_MODULUS = static_cast<int>(EthKzgStatus::EccCoordinateGreaterThanOrEqualModulus);
extern const int KZG_ECC_POINT_NOT_ON_CURVE                      = static_cast<int>(EthKzgStatus::EccPointNotOnCurve);
extern const int KZG_ECC_POINT_NOT_IN_SUBGROUP                   = static_cast<int>(EthKzgStatus::EccPointNotInSubgroup);

extern const int KZG_NULL_HANDLE                                 = -2;
extern const int KZG_INTERNAL_ERR                                = -1;

extern const int TS_SUCCESS                  = static_cast<int>(TrustedSetupStatus::tsSuccess);
extern const int TS_MISSING_FILE             = static_cast<int>(TrustedSetupStatus::tsMissingFile);
extern const int TS_WRONG_PRESET             = static_cast<int>(TrustedSetupStatus::tsWrongPreset);
extern const int TS_UNSUPPORTED_FILE_VERSION = static_cast<int>(TrustedSetupStatus::tsUnsupportedFileVersion);
extern const int TS_INVALID_FILE             = static_cast<int>(TrustedSetupStatus::tsInvalidFile);
extern const int TS_LOW_LEVEL_READ_ERROR     = static_cast<int>(TrustedSetupStatus::tsLowLevelReadError);
extern const int TS_LOW_LEVEL_WRITE_ERROR    = static_cast<int>(TrustedSetupStatus::tsLowLevelWriteError);

}
