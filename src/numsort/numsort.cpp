#include <args/args.hxx>
#include <numsort/driver.hpp>
#include <iostream>
#include <string>
#include <vector>

#if defined(NUMSORT_USE_SPDLOG)
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#endif

int main(int argc, char* argv[]) {
    args::ArgumentParser parser("numsort - Sort the numbers in a text file, one per line");
    parser.Prog("numsort");
    args::Positional<std::string> input(parser, "input_file", "File to read, one number per line");
    args::Positional<std::string> output(parser, "output_file", "File to write the sorted numbers to");

    // Exactly two paths; a leading '-' is part of a path, never a flag
    if (argc != 3) {
        numsort::print_usage(std::cout);
        return 1;
    }
    const std::vector<std::string> paths{"--", argv[1], argv[2]};

    try {
        parser.ParseArgs(paths);
    } catch (const args::Error&) {
        numsort::print_usage(std::cout);
        return 1;
    }

    if (!input || !output) {
        numsort::print_usage(std::cout);
        return 1;
    }

#if defined(NUMSORT_USE_SPDLOG)
    // Keep trace output off stdout, which carries the progress report
    auto logger = spdlog::stderr_color_mt("numsort");
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);
#endif

    return numsort::run(args::get(input), args::get(output), std::cout);
}
