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

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include "points.h"
#include "tests.h"
#include "tsif.h"

namespace fs = std::filesystem;

static std::string temp_path(const char* name) {
    return (fs::temp_directory_path() / name).string();
}

static std::vector<char> read_file(const std::string &path) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(f), {});
}

static void write_file(const std::string &path, const std::vector<char> &bytes) {
    std::ofstream f(path, std::ios::out | std::ios::binary | std::ios::trunc);
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

// writes a copy of `base` with bytes[at] replaced, then loads it
static TrustedSetupStatus load_patched(
    const std::vector<char> &base,
    size_t at,
    char value,
    size_t n = 4
) {
    std::vector<char> bytes = base;
    bytes[at] = value;
    std::string path = temp_path("blob_kzg_patched.tsif");
    write_file(path, bytes);

    auto res = load_trusted_setup(path, n);
    fs::remove(path);
    return res.is_ok() ? TrustedSetupStatus::tsSuccess : res.unwrap_err();
}

void test_tsif_roundtrip() {
    printf("TESTING TSIF DUMP -> LOAD \n");

    const size_t N = 4;
    EthKzgContext ctx = new_testing_setup(new_fr(TEST_TAU), N);
    std::string path = temp_path("blob_kzg_roundtrip.tsif");

    assert(dump_trusted_setup(ctx, path) == TrustedSetupStatus::tsSuccess);

    // header pads to 192, lagrange to 576, monomial g2 to 13056
    assert(fs::file_size(path) == 13056 + N * sizeof(blst_fr));

    std::vector<char> bytes = read_file(path);
    assert(memcmp(&bytes[192], ctx.srs_lagrange_g1.data(), N * sizeof(blst_p1_affine)) == 0);
    assert(memcmp(&bytes[576], ctx.srs_monomial_g2.data(), KZG_SETUP_G2_LENGTH * sizeof(blst_p2_affine)) == 0);
    assert(memcmp(&bytes[13056], ctx.domain.roots_of_unity.data(), N * sizeof(blst_fr)) == 0);

    auto res = load_trusted_setup(path, N);
    assert(res.is_ok());
    EthKzgContext loaded = res.take();

    assert(loaded.max_degree() == N);
    assert(memcmp(loaded.srs_lagrange_g1.data(), ctx.srs_lagrange_g1.data(), N * sizeof(blst_p1_affine)) == 0);
    assert(memcmp(loaded.srs_monomial_g2.data(), ctx.srs_monomial_g2.data(), KZG_SETUP_G2_LENGTH * sizeof(blst_p2_affine)) == 0);
    for (size_t i = 0; i < N; i++) {
        assert(equal_fr(loaded.domain.roots_of_unity[i], ctx.domain.roots_of_unity[i]));
    }
    assert(equal_fr(loaded.domain.inv_max_degree, ctx.domain.inv_max_degree));

    // dumping the loaded setup gives the same file
    std::string again = temp_path("blob_kzg_roundtrip_again.tsif");
    assert(dump_trusted_setup(loaded, again) == TrustedSetupStatus::tsSuccess);
    assert(read_file(again) == bytes);

    fs::remove(path);
    fs::remove(again);
    printf("TSIF ROUNDTRIP SUCCESS\n\n");
}

void test_tsif_rejects() {
    printf("TESTING TSIF REJECTS BAD FILES \n");

    const size_t N = 4;
    EthKzgContext ctx = new_testing_setup(new_fr(TEST_TAU), N);
    std::string path = temp_path("blob_kzg_rejects.tsif");
    assert(dump_trusted_setup(ctx, path) == TrustedSetupStatus::tsSuccess);
    std::vector<char> base = read_file(path);

    // missing file
    auto missing = load_trusted_setup(temp_path("blob_kzg_does_not_exist.tsif"), N);
    assert(missing.is_err());
    assert(missing.unwrap_err() == TrustedSetupStatus::tsMissingFile);

    // preset size mismatch, caught by the schema
    auto wrong_n = load_trusted_setup(path, 8);
    assert(wrong_n.is_err());
    assert(wrong_n.unwrap_err() == TrustedSetupStatus::tsWrongPreset);

    auto not_pow2 = load_trusted_setup(path, 3);
    assert(not_pow2.is_err());
    assert(not_pow2.unwrap_err() == TrustedSetupStatus::tsWrongPreset);

    // magic
    assert(load_patched(base, 0, 'X') == TrustedSetupStatus::tsInvalidFile);

    // version
    assert(load_patched(base, 12, 'x') == TrustedSetupStatus::tsInvalidFile);
    assert(load_patched(base, 13, 2) == TrustedSetupStatus::tsUnsupportedFileVersion);

    // protocol and curve
    assert(load_patched(base, 16, 'E') == TrustedSetupStatus::tsWrongPreset);
    assert(load_patched(base, 48, 'B') == TrustedSetupStatus::tsWrongPreset);

    // num fields
    assert(load_patched(base, 63, 4) == TrustedSetupStatus::tsWrongPreset);

    // element size of the lagrange item
    assert(load_patched(base, 64 + 20, 48) == TrustedSetupStatus::tsWrongPreset);

    // element count of the roots item
    assert(load_patched(base, 64 + 64 + 24, 5) == TrustedSetupStatus::tsWrongPreset);

    // first g2 point is not the generator
    assert(load_patched(base, 576 + 10, static_cast<char>(base[576 + 10] ^ 0x01))
        == TrustedSetupStatus::tsWrongPreset);

    // truncated in the roots array
    std::vector<char> cut(base.begin(), base.begin() + 13100);
    std::string cut_path = temp_path("blob_kzg_cut.tsif");
    write_file(cut_path, cut);
    auto truncated = load_trusted_setup(cut_path, N);
    assert(truncated.is_err());
    assert(truncated.unwrap_err() == TrustedSetupStatus::tsInvalidFile);

    // truncated in the header
    cut.resize(100);
    write_file(cut_path, cut);
    truncated = load_trusted_setup(cut_path, N);
    assert(truncated.is_err());
    assert(truncated.unwrap_err() == TrustedSetupStatus::tsInvalidFile);

    // unwritable destination
    std::string bad_dir = temp_path("blob_kzg_no_such_dir/setup.tsif");
    assert(dump_trusted_setup(ctx, bad_dir) == TrustedSetupStatus::tsLowLevelWriteError);

    fs::remove(path);
    fs::remove(cut_path);
    printf("TSIF REJECTS SUCCESS\n\n");
}

void main_tsif() {
    test_tsif_roundtrip();
    test_tsif_rejects();
}
