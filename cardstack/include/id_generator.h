#pragma once
// id_generator.h
// Injected id generation for stacks, entries and snapshots.
//
// Every operation that mints ids takes an IdGenerator&, so there is no
// hidden global counter and tests can use deterministic ids. Generators are
// not thread-safe; use one per thread (or per editing session).

#include <cstdint>
#include <random>
#include <string>

class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    /// Returns a fresh id of the form "<prefix>-<suffix>".
    virtual std::string next(const std::string& prefix) = 0;
};

/// "<prefix>-1", "<prefix>-2", ... from a counter owned by this instance.
class SequentialIdGenerator final : public IdGenerator {
public:
    std::string next(const std::string& prefix) override;

private:
    uint64_t counter_ = 0;
};

/// "<prefix>-<16 hex digits>" from a seeded 64-bit Mersenne Twister.
class RandomIdGenerator final : public IdGenerator {
public:
    RandomIdGenerator();
    explicit RandomIdGenerator(uint64_t seed) : rng_(seed) {}

    std::string next(const std::string& prefix) override;

private:
    std::mt19937_64 rng_;
};
