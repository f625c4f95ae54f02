// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
//
// chainboard -- publishes board snapshots to an on-chain storeString contract.

#include "app/app.h"
#include "app/config.h"

#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[]) {
    auto config = app::parse_args(argc, argv);
    if (!config.ok()) {
        std::cerr << "Error: " << config.error().message() << std::endl;
        return EXIT_FAILURE;
    }

    app::App chainboard(std::move(config).value());

    auto init_result = chainboard.init();
    if (!init_result.ok()) {
        std::cerr << "Error: " << init_result.error().message() << std::endl;
        return EXIT_FAILURE;
    }

    // Until SIGINT / SIGTERM.
    chainboard.run();
    chainboard.shutdown();

    return EXIT_SUCCESS;
}
