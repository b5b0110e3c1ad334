// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// sluice-sum -- SHA-256 checksums computed through a two-stage pipeline
//
// Usage:
//   sluice-sum [options] -file=PATH [-file=PATH ...] [PATH ...]
//
// Prints "<sha256-hex>  <path>" per file, in order.  Every error reported
// by the pipeline is printed to stderr and makes the exit status 1.
//
// Options:
//   -errcap=N           Error Channel capacity (default: 4)
//   -pollms=N           Error Channel poll interval in ms (default: 10)
//   -loglevel=LEVEL     trace, debug, info, warn, error, fatal, off
//   -debug=CAT[,CAT]    channel, producer, handler, pipeline, config, io,
//                       crypto, thread, all
//   -logfile=PATH       Also log to PATH
//   -printtoconsole=0   Do not log to stderr
//   -conf=PATH          Read options from PATH
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/logging.h"
#include "crypto/sha256.h"
#include "stream/file_producer.h"
#include "stream/handlers.h"
#include "stream/pipeline.h"
#include "stream/settings.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void print_usage() {
    std::cout
        << "Usage: sluice-sum [options] -file=PATH [-file=PATH ...] [PATH ...]\n"
        << "\n"
        << "Options:\n"
        << "  -errcap=N           Error Channel capacity (default: 4)\n"
        << "  -pollms=N           Error Channel poll interval in ms (default: 10)\n"
        << "  -loglevel=LEVEL     trace, debug, info, warn, error, fatal, off\n"
        << "  -debug=CAT[,CAT]    Restrict logging to these categories\n"
        << "  -logfile=PATH       Also log to PATH\n"
        << "  -printtoconsole=0   Do not log to stderr\n"
        << "  -conf=PATH          Read options from PATH\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    core::Config config;
    config.parse_args(argc, argv);

    if (config.has("help") || config.has("?") || config.has("h")) {
        print_usage();
        return EXIT_SUCCESS;
    }

    auto settings = stream::Settings::from_config(config);
    if (!settings.ok()) {
        std::cerr << "Error: " << settings.error().message() << std::endl;
        return EXIT_FAILURE;
    }
    stream::init_logging(settings.value());

    std::vector<std::filesystem::path> paths;
    for (const auto& p : config.get_list("file")) paths.emplace_back(p);
    for (const auto& p : config.positional()) paths.emplace_back(p);
    if (paths.empty()) {
        print_usage();
        return EXIT_FAILURE;
    }

    stream::Pipeline pipeline(
        std::make_unique<stream::FileProducer>(paths),
        settings.value().error_capacity,
        settings.value().poll_interval);

    pipeline.then(stream::digest_handler(
        [](const stream::ContextPtr& ctx, const crypto::Sha256Digest& digest) {
            std::cout << crypto::to_hex(digest) << "  "
                      << ctx->value(stream::PATH_KEY).value_or("-") << "\n";
        }));

    auto errors = stream::drain(pipeline.start());
    pipeline.join();
    std::cout.flush();

    for (const auto& err : errors) {
        std::cerr << "sluice-sum: " << err.message() << std::endl;
        LOG_DEBUG(core::LogCategory::PIPELINE, err.format());
    }
    core::Logger::instance().flush();
    return errors.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}
