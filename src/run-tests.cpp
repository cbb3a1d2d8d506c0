/* This file is part of mpinc project: an incremental MessagePack decoder
 * Copyright (c) 2026 The mpinc authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the mpinc source tree */

#include <iostream>
#include <mpinc/test.hpp>

using namespace mpinc;

int main(int argc, char **argv)
{
    if (argc >= 2) {
        std::cerr << "using test-filter mask: " << argv[1] << std::endl;
        cfg<override> = { .filter = argv[1] };
    }
}
