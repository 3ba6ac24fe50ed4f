// Drives the read/sort/write pipeline from code and keeps its traces in memory
#include <numsort/driver.hpp>
#include <numsort/trace.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

std::vector<std::string> trace_log;

void memory_trace_handler(const char* level, const char* file, int line, const char* function, const char* msg) {
    std::ostringstream oss;
    oss << "[" << level << "] " << std::filesystem::path(file).filename().string() << ":" << line
        << " (" << function << "): " << msg;
    trace_log.push_back(oss.str());
}

int main() {
    auto dir = std::filesystem::temp_directory_path();
    auto input = (dir / "numsort_example_in.txt").string();
    auto output = (dir / "numsort_example_out.txt").string();
    std::ofstream(input) << "42\n\n-3.5\n17\n   \n0.125\n17\n";

    numsort::trace::set_trace_handler(memory_trace_handler);

    std::cout << "1. First run registers trace points (all disabled):\n";
    numsort::run(input, output, std::cout);

    std::cout << "\n2. Registered trace points:\n";
    std::cout << numsort::trace::TraceManager::instance().list_trace_points();

    std::cout << "\n3. Second run with every trace point enabled:\n";
    numsort::trace::TraceManager::instance().set_all_enabled(true);
    numsort::run(input, output, std::cout);

    std::cout << "\n4. Captured traces:\n";
    for (const auto& entry : trace_log) {
        std::cout << "  " << entry << "\n";
    }

    std::cout << "\n5. Timer summary:\n" << numsort::trace::TimerManager::instance().summary();

    std::remove(input.c_str());
    std::remove(output.c_str());
    return 0;
}
