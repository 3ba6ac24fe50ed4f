#pragma once

#include <numsort/error.hpp>
#include <numsort/trace.hpp>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace numsort {

namespace detail {
    // Streams need not set errno, so only trust it when something did
    inline std::string open_failure_reason(int err) {
        if (err == 0) return "cannot open for writing";
        return std::error_code(err, std::generic_category()).message();
    }

    constexpr std::string_view kWhitespace = " \t\n\r\v\f";

    inline std::string_view trim(std::string_view s) {
        auto first = s.find_first_not_of(kWhitespace);
        if (first == std::string_view::npos) return {};
        auto last = s.find_last_not_of(kWhitespace);
        return s.substr(first, last - first + 1);
    }

    // Splits on "\n", "\r\n" and a lone "\r"; a trailing terminator does not open a new line
    inline std::vector<std::string_view> split_lines(std::string_view text) {
        std::vector<std::string_view> lines;
        size_t start = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] != '\n' && text[i] != '\r') continue;
            lines.push_back(text.substr(start, i - start));
            if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
            start = i + 1;
        }
        if (start < text.size()) {
            lines.push_back(text.substr(start));
        }
        return lines;
    }
}

// Parses one stripped line as a finite base-10 real number.
// Accepts an optional sign, a fractional part and an exponent; the whole text must be consumed.
inline std::optional<double> parse_number(std::string_view text) {
    if (text.empty()) return std::nullopt;

    // from_chars takes '-' but not '+'
    if (text.front() == '+') {
        text.remove_prefix(1);
        if (text.empty() || text.front() == '+' || text.front() == '-') return std::nullopt;
    }

    double value = 0.0;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value, std::chars_format::general);
    if (ptr != last) return std::nullopt;
    if (ec == std::errc::result_out_of_range) {
        // Underflow rounds toward a (signed) zero or subnormal; overflow stays rejected
        value = std::strtod(std::string(text).c_str(), nullptr);
    } else if (ec != std::errc()) {
        return std::nullopt;
    }
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

// Reads one number per non-blank line, in file order.
// Throws NotFoundError if `path` cannot be opened and InvalidInputError on the first bad line.
inline std::vector<double> read_numbers(const std::string& path) {
    NUMSORT_FUNC();

    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        NUMSORT_WARN("'%s' is a directory", path.c_str());
        throw NotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        NUMSORT_WARN("cannot open '%s'", path.c_str());
        throw NotFoundError(path);
    }
    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        throw NotFoundError(path);
    }
    NUMSORT_DEBUG("read %zu bytes from '%s'", content.size(), path.c_str());

    std::vector<double> numbers;
    int line_num = 0;
    for (auto raw : detail::split_lines(content)) {
        ++line_num;
        auto line = detail::trim(raw);
        if (line.empty()) {
            NUMSORT_TRACE("line %d is blank, skipped", line_num);
            continue;
        }
        auto value = parse_number(line);
        if (!value) {
            throw InvalidInputError(std::string(line), line_num);
        }
        numbers.push_back(*value);
    }

    NUMSORT_DEBUG("parsed %zu numbers from %d lines", numbers.size(), line_num);
    return numbers;
}

// Returns the values in non-descending order; equal values keep their relative order
inline std::vector<double> sort_numbers(std::vector<double> numbers) {
    NUMSORT_TIMEIT("sort_numbers");
    NUMSORT_TRACE("sorting %zu numbers", numbers.size());
    std::stable_sort(numbers.begin(), numbers.end());
    return numbers;
}

// Whole values print as exact integers ("10", not "10.0"); anything else
// prints in plain decimal with the fewest digits that read back to the same double.
inline std::string format_number(double value) {
    if (value == 0.0) return "0";  // also folds -0.0

    char buf[512];
    std::to_chars_result res;
    if (std::isfinite(value) && std::trunc(value) == value) {
        res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed, 0);
    } else {
        res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    }
    return std::string(buf, res.ptr);
}

// Writes one number per line (LF), replacing any existing file.
// Throws IoError if the file cannot be created or written.
inline void write_numbers(const std::vector<double>& numbers, const std::string& path) {
    NUMSORT_FUNC();

    errno = 0;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IoError(path, detail::open_failure_reason(errno));
    }
    for (double n : numbers) {
        file << format_number(n) << '\n';
    }
    file.close();
    if (!file) {
        throw IoError(path, "write failed");
    }
    NUMSORT_DEBUG("wrote %zu numbers to '%s'", numbers.size(), path.c_str());
}

struct Summary {
    size_t count = 0;
    double min = 0.0;
    double max = 0.0;
};

// Count and extremes of an already sorted sequence; nothing for an empty one
inline std::optional<Summary> summarize(const std::vector<double>& sorted) {
    if (sorted.empty()) return std::nullopt;
    return Summary{sorted.size(), sorted.front(), sorted.back()};
}

} // namespace numsort
