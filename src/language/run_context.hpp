#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <iostream>
#include <vector>

// The program's notion of "standard output". Each run owns one of these, so
// redirecting it never affects any other run.
struct OutputTarget {
    std::ostream* stream = &std::cout;
};

// Everything a single run may touch besides its AST.
struct RunContext {
    OutputTarget output;
    std::vector<nlohmann::json> inputs;
    size_t next_input{0};
};
