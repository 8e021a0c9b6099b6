#ifndef GRIDSTORE_TEST_UTILS_HPP
#define GRIDSTORE_TEST_UTILS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>

// Keep test output readable, only errors reach the console
inline void quiet_logging() {
    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= boost::log::trivial::error
    );
}

inline std::vector<uint8_t> to_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

// Deterministic pseudo-random payload
inline std::vector<uint8_t> make_payload(size_t size, uint32_t seed = 7) {
    std::vector<uint8_t> data(size);
    uint32_t state = seed;
    for (auto& byte : data) {
        state = state * 1103515245u + 12345u;
        byte = static_cast<uint8_t>(state >> 16);
    }
    return data;
}

#endif // GRIDSTORE_TEST_UTILS_HPP
