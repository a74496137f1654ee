/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Test Runner
 */

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <tunlink/tunlink.hpp>

int main(int argc, char **argv) {
    if (tunlink::init().is_err()) {
        return 1;
    }

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
