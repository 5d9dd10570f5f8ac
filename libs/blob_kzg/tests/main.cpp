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

#include <string>
#include "tests.h"

int main(int argc, char* argv[]) {
    printf("\noptions == {tsif, poly, kzg, eip4844, batch, parallel}\n\n");
    printf("=====================================\n");

    if (argc > 1) {
        std::string a = argv[1];
        if (a == "tsif") {
            main_tsif();

        } else if (a == "poly") {
            main_poly();

        } else if (a == "kzg") {
            main_kzg();

        } else if (a == "eip4844") {
            main_eip4844();

        } else if (a == "batch") {
            main_batch();

        } else if (a == "parallel") {
            main_parallel();

        } else {
            printf("unknown suite: %s\n", a.c_str());
            return 1;
        }
        return 0;
    }


    // TRUSTED SETUP
    main_tsif();

    // POLYNOMIALS
    main_poly();

    // KZG
    main_kzg();
    main_eip4844();
    main_batch();

    // THREADS
    main_parallel();

    return 0;

}
