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
#include <string>
#include "result.h"
#include "settings.h"
#include "status.h"

// Trusted Setup Interchange Format
//
//   magic       12   "∃⋃∈∎" in UTF-8
//   version      4   'v' 1 '.' 0
//   protocol    32   "ethereum_deneb_kzg", NUL padded
//   curve       15   "bls12_381", NUL padded
//   num fields   1   3
//   schema    3x32   kind(15) group(2) order(3) elem_size(u32 LE) count(u64 LE)
//   data             one array per schema item, each 64-byte aligned
//
// Points and field elements are the raw little-endian Montgomery
// limbs of blst_p1_affine, blst_p2_affine and blst_fr.

constexpr size_t TSIF_ALIGN = 64;
constexpr size_t TSIF_SCHEMA_ITEM_LEN = 32;
constexpr size_t TSIF_NUM_FIELDS = 3;

Result<EthKzgContext, TrustedSetupStatus> load_trusted_setup(
    const std::string &path,
    size_t expected_n = FIELD_ELEMENTS_PER_BLOB
);

TrustedSetupStatus dump_trusted_setup(
    const EthKzgContext &ctx,
    const std::string &path
);
