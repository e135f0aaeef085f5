// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ranger/cli/commands.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace ranger::cli;

// Report exceptions escaping noexcept functions before aborting
static void ranger_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(ranger_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    if (args.object_uri.empty()) {
        std::cerr << "Error: No object specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    auto result = args.info ? info(args) : download(args);
    return result ? *result : 1;
}
