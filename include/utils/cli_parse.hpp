#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace utils {

// Consumes the value following `flag` (argv[i + 1]).
inline std::string require_arg(int& i, int argc, char** argv, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error("missing value for " + flag);
    }
    return argv[++i];
}

inline int parse_int(const std::string& s, const std::string& flag) {
    size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(s, &pos);
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + ": invalid integer: " + s);
    }
    if (pos != s.size()) {
        throw std::runtime_error(flag + ": invalid integer: " + s);
    }
    return v;
}

inline double parse_double(const std::string& s, const std::string& flag) {
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &pos);
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + ": invalid number: " + s);
    }
    if (pos != s.size()) {
        throw std::runtime_error(flag + ": invalid number: " + s);
    }
    return v;
}

// "a,b,c" -> {a, b, c}; empty entries are skipped.
inline std::vector<double> parse_double_list(const std::string& s, const std::string& flag) {
    std::vector<double> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) {
            continue;
        }
        out.push_back(parse_double(item, flag));
    }
    return out;
}

}  // namespace utils
