#pragma once

#include <sstream>
#include <stdexcept>

namespace idheap_test {

[[noreturn]] inline void fail_check(const char* expr, const char* file, int line) {
    std::ostringstream oss;
    oss << "CHECK failed: " << expr << " at " << file << ":" << line;
    throw std::runtime_error(oss.str());
}

}  // namespace idheap_test

#define CHECK(expr) do { if (!(expr)) ::idheap_test::fail_check(#expr, __FILE__, __LINE__); } while (0)
