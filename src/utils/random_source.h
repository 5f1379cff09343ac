#ifndef RANDOM_SOURCE_H
#define RANDOM_SOURCE_H

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <vector>

// Seeded xoshiro256** generator. Every random decision of a run (font choice,
// jitter, template filling, paper noise) is drawn from one of these, so a run
// is reproducible from its seed on any platform.
class RandomSource {
public:
    explicit RandomSource(uint64_t seed);

    uint64_t seed() const { return seed_; }

    uint64_t next();

    // Uniform integer in [min_val, max_val] (inclusive)
    int nextInt(int min_val, int max_val);

    // Uniform double in [0, 1)
    double nextDouble();

    // Uniform double in [min_val, max_val)
    double nextDouble(double min_val, double max_val);

    // Normal distribution (Box-Muller)
    double nextGaussian(double mean, double stddev);

    // Independent generator derived from this seed and a salt (does not advance this one)
    RandomSource fork(uint64_t salt) const;

    template <typename T>
    const T& pick(const std::vector<T>& items) {
        if (items.empty()) {
            throw std::logic_error("RandomSource::pick called with an empty list");
        }
        return items[static_cast<size_t>(nextInt(0, static_cast<int>(items.size()) - 1))];
    }

private:
    uint64_t seed_;
    uint64_t state_[4];
    bool has_spare_gaussian_ = false;
    double spare_gaussian_ = 0.0;

    static uint64_t splitmix64(uint64_t& x);
    static uint64_t rotl(uint64_t x, int k) { return (x << k) | (x >> (64 - k)); }
};

// Seed from the wall clock, for runs that did not ask for a fixed seed
uint64_t makeTimeSeed();

#endif // RANDOM_SOURCE_H
