// id_generator.cpp

#include "id_generator.h"

#include <cstdio>

std::string SequentialIdGenerator::next(const std::string& prefix) {
    return prefix + "-" + std::to_string(++counter_);
}

RandomIdGenerator::RandomIdGenerator() : rng_(std::random_device{}()) {}

std::string RandomIdGenerator::next(const std::string& prefix) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng_()));
    return prefix + "-" + buf;
}
