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

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include "points.h"
#include "tsif.h"

static const byte TSIF_MAGIC[12] = {
    0xE2, 0x88, 0x83, 0xE2, 0x8B, 0x83,
    0xE2, 0x88, 0x88, 0xE2, 0x88, 0x8E
};
static const byte TSIF_VERSION[4] = {'v', 1, '.', 0};
static const char* TSIF_PROTOCOL = "ethereum_deneb_kzg";

constexpr size_t PROTOCOL_LEN = 32;
constexpr size_t CURVE_LEN = 15;
constexpr size_t KIND_LEN = 15;

// =======================================
// ============= LAYOUT ==================
// =======================================

using Schema = std::array<byte, TSIF_SCHEMA_ITEM_LEN>;

static void put_padded(byte* dst, const char* s, size_t len) {
    memset(dst, 0, len);
    memcpy(dst, s, std::min(strlen(s), len));
}

static Schema schema_item(
    const char* kind,
    const char* group,
    const char* order,
    uint32_t elem_size,
    uint64_t count
) {
    Schema item;
    put_padded(item.data(), kind, KIND_LEN);
    memcpy(item.data() + 15, group, 2);
    memcpy(item.data() + 17, order, 3);
    for (size_t i = 0; i < 4; i++) item[20 + i] = static_cast<byte>(elem_size >> (8 * i));
    for (size_t i = 0; i < 8; i++) item[24 + i] = static_cast<byte>(count >> (8 * i));
    return item;
}

static std::array<Schema, TSIF_NUM_FIELDS> schema_for(size_t n) {
    return {
        schema_item("srs_lagrange", "g1", "brp", sizeof(blst_p1_affine), n),
        schema_item("srs_monomial", "g2", "asc", sizeof(blst_p2_affine), KZG_SETUP_G2_LENGTH),
        schema_item("roots_unity", "fr", "brp", sizeof(blst_fr), n),
    };
}

static size_t align_up(size_t pos) {
    return (pos + TSIF_ALIGN - 1) & ~(TSIF_ALIGN - 1);
}

// =======================================
// ============= LOAD ====================
// =======================================

static bool read_exact(std::ifstream &f, void* dst, size_t n) {
    f.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(n));
    return static_cast<size_t>(f.gcount()) == n;
}

static TrustedSetupStatus skip_to_align(std::ifstream &f) {
    std::streamoff pos = f.tellg();
    if (pos < 0) return TrustedSetupStatus::tsLowLevelReadError;

    f.seekg(static_cast<std::streamoff>(align_up(static_cast<size_t>(pos))));
    if (!f) return TrustedSetupStatus::tsLowLevelReadError;
    return TrustedSetupStatus::tsSuccess;
}

template <typename T>
static TrustedSetupStatus read_array(std::ifstream &f, std::vector<T> &out, size_t count) {
    TrustedSetupStatus s = skip_to_align(f);
    if (s != TrustedSetupStatus::tsSuccess) return s;

    out.resize(count);
    if (!read_exact(f, out.data(), count * sizeof(T))) return TrustedSetupStatus::tsInvalidFile;
    return TrustedSetupStatus::tsSuccess;
}

Result<EthKzgContext, TrustedSetupStatus> load_trusted_setup(
    const std::string &path,
    size_t expected_n
) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return TrustedSetupStatus::tsMissingFile;
    if (!is_pow2(expected_n) || expected_n < 2) return TrustedSetupStatus::tsWrongPreset;

    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) return TrustedSetupStatus::tsLowLevelReadError;

    byte buf[PROTOCOL_LEN];

    // MAGIC + VERSION
    if (!read_exact(f, buf, sizeof(TSIF_MAGIC))) return TrustedSetupStatus::tsInvalidFile;
    if (memcmp(buf, TSIF_MAGIC, sizeof(TSIF_MAGIC)) != 0) return TrustedSetupStatus::tsInvalidFile;

    if (!read_exact(f, buf, sizeof(TSIF_VERSION))) return TrustedSetupStatus::tsInvalidFile;
    if (buf[0] != TSIF_VERSION[0]) return TrustedSetupStatus::tsInvalidFile;
    if (memcmp(buf + 1, TSIF_VERSION + 1, 3) != 0) return TrustedSetupStatus::tsUnsupportedFileVersion;

    // PROTOCOL + CURVE
    byte expected[PROTOCOL_LEN];
    if (!read_exact(f, buf, PROTOCOL_LEN)) return TrustedSetupStatus::tsInvalidFile;
    put_padded(expected, TSIF_PROTOCOL, PROTOCOL_LEN);
    if (memcmp(buf, expected, PROTOCOL_LEN) != 0) return TrustedSetupStatus::tsWrongPreset;

    if (!read_exact(f, buf, CURVE_LEN)) return TrustedSetupStatus::tsInvalidFile;
    put_padded(expected, BLS12_381::name, CURVE_LEN);
    if (memcmp(buf, expected, CURVE_LEN) != 0) return TrustedSetupStatus::tsWrongPreset;

    // SCHEMA
    byte num_fields;
    if (!read_exact(f, &num_fields, 1)) return TrustedSetupStatus::tsInvalidFile;
    if (num_fields != TSIF_NUM_FIELDS) return TrustedSetupStatus::tsWrongPreset;

    for (const Schema &item : schema_for(expected_n)) {
        if (!read_exact(f, buf, TSIF_SCHEMA_ITEM_LEN)) return TrustedSetupStatus::tsInvalidFile;
        if (memcmp(buf, item.data(), TSIF_SCHEMA_ITEM_LEN) != 0) return TrustedSetupStatus::tsWrongPreset;
    }

    // DATA
    EthKzgContext ctx;
    TrustedSetupStatus s;

    s = read_array(f, ctx.srs_lagrange_g1, expected_n);
    if (s != TrustedSetupStatus::tsSuccess) return s;

    s = read_array(f, ctx.srs_monomial_g2, KZG_SETUP_G2_LENGTH);
    if (s != TrustedSetupStatus::tsSuccess) return s;

    s = read_array(f, ctx.domain.roots_of_unity, expected_n);
    if (s != TrustedSetupStatus::tsSuccess) return s;

    set_inv_max_degree(ctx.domain);

    // monomial form starts with the generator
    if (!is_g2_generator(ctx.srs_monomial_g2[0])) return TrustedSetupStatus::tsWrongPreset;

    return ctx;
}

// =======================================
// ============= DUMP ====================
// =======================================

static void pad_to_align(std::ofstream &f, size_t &pos) {
    static const char zeros[TSIF_ALIGN] = {0};
    size_t next = align_up(pos);
    f.write(zeros, static_cast<std::streamsize>(next - pos));
    pos = next;
}

template <typename T>
static void write_array(std::ofstream &f, size_t &pos, const std::vector<T> &v) {
    pad_to_align(f, pos);
    f.write(reinterpret_cast<const char*>(v.data()), static_cast<std::streamsize>(v.size() * sizeof(T)));
    pos += v.size() * sizeof(T);
}

TrustedSetupStatus dump_trusted_setup(
    const EthKzgContext &ctx,
    const std::string &path
) {
    size_t n = ctx.max_degree();
    if (ctx.srs_lagrange_g1.size() != n || ctx.srs_monomial_g2.size() != KZG_SETUP_G2_LENGTH) {
        return TrustedSetupStatus::tsWrongPreset;
    }

    std::ofstream f(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!f) return TrustedSetupStatus::tsLowLevelWriteError;

    byte field[PROTOCOL_LEN];
    size_t pos = 0;

    f.write(reinterpret_cast<const char*>(TSIF_MAGIC), sizeof(TSIF_MAGIC));
    f.write(reinterpret_cast<const char*>(TSIF_VERSION), sizeof(TSIF_VERSION));

    put_padded(field, TSIF_PROTOCOL, PROTOCOL_LEN);
    f.write(reinterpret_cast<const char*>(field), PROTOCOL_LEN);

    put_padded(field, BLS12_381::name, CURVE_LEN);
    f.write(reinterpret_cast<const char*>(field), CURVE_LEN);

    char num_fields = static_cast<char>(TSIF_NUM_FIELDS);
    f.write(&num_fields, 1);

    for (const Schema &item : schema_for(n)) {
        f.write(reinterpret_cast<const char*>(item.data()), TSIF_SCHEMA_ITEM_LEN);
    }
    pos = sizeof(TSIF_MAGIC) + sizeof(TSIF_VERSION) + PROTOCOL_LEN + CURVE_LEN + 1
        + TSIF_NUM_FIELDS * TSIF_SCHEMA_ITEM_LEN;

    write_array(f, pos, ctx.srs_lagrange_g1);
    write_array(f, pos, ctx.srs_monomial_g2);
    write_array(f, pos, ctx.domain.roots_of_unity);

    f.flush();
    if (!f) return TrustedSetupStatus::tsLowLevelWriteError;
    return TrustedSetupStatus::tsSuccess;
}
