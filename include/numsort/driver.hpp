#pragma once

#include <numsort/error.hpp>
#include <numsort/numsort.hpp>
#include <numsort/trace.hpp>

#include <ostream>
#include <string>
#include <utility>

namespace numsort {

inline void print_usage(std::ostream& out, const std::string& prog = "numsort") {
    out << "Usage: " << prog << " <input_file> <output_file>\n";
}

// Read -> sort -> write, reporting progress on `out`.
// Returns the process exit status: 0 on success, 1 on any numsort::Error.
inline int run(const std::string& input, const std::string& output, std::ostream& out) {
    NUMSORT_FUNC();
    try {
        out << "Reading numbers from " << input << "...\n";
        auto numbers = read_numbers(input);
        out << "Found " << numbers.size() << " numbers\n";

        out << "Sorting numbers...\n";
        auto sorted = sort_numbers(std::move(numbers));

        out << "Writing sorted numbers to " << output << "...\n";
        write_numbers(sorted, output);

        out << "Sorting completed successfully!\n";
        if (auto summary = summarize(sorted)) {
            NUMSORT_INFO("sorted %zu numbers into '%s'", summary->count, output.c_str());
            out << "Smallest number: " << format_number(summary->min) << "\n";
            out << "Largest number: " << format_number(summary->max) << "\n";
        } else {
            NUMSORT_INFO("no numbers in '%s', wrote empty '%s'", input.c_str(), output.c_str());
            out << "No numbers to report\n";
        }
    } catch (const Error& e) {
        NUMSORT_WARN("%s error: %s", to_string(e.kind()), e.what());
        out << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace numsort
