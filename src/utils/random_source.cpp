#include "random_source.h"
#include <chrono>
#include <cmath>

namespace {
const double kTwoPi = 6.283185307179586476925;
}

RandomSource::RandomSource(uint64_t seed) : seed_(seed) {
    uint64_t x = seed;
    state_[0] = splitmix64(x);
    state_[1] = splitmix64(x);
    state_[2] = splitmix64(x);
    state_[3] = splitmix64(x);
}

uint64_t RandomSource::splitmix64(uint64_t& x) {
    uint64_t z = (x += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

uint64_t RandomSource::next() {
    const uint64_t result = rotl(state_[1] * 5, 7) * 9;
    const uint64_t t = state_[1] << 17;

    state_[2] ^= state_[0];
    state_[3] ^= state_[1];
    state_[1] ^= state_[2];
    state_[0] ^= state_[3];

    state_[2] ^= t;
    state_[3] = rotl(state_[3], 45);

    return result;
}

int RandomSource::nextInt(int min_val, int max_val) {
    if (min_val >= max_val) return min_val;
    uint64_t range = static_cast<uint64_t>(static_cast<int64_t>(max_val) - min_val) + 1;
    return min_val + static_cast<int>(next() % range);
}

double RandomSource::nextDouble() {
    // Upper 53 bits
    return static_cast<double>(next() >> 11) * 0x1.0p-53;
}

double RandomSource::nextDouble(double min_val, double max_val) {
    return min_val + nextDouble() * (max_val - min_val);
}

double RandomSource::nextGaussian(double mean, double stddev) {
    if (has_spare_gaussian_) {
        has_spare_gaussian_ = false;
        return mean + stddev * spare_gaussian_;
    }
    double u1 = nextDouble();
    double u2 = nextDouble();
    if (u1 < 1e-300) u1 = 1e-300;
    double radius = std::sqrt(-2.0 * std::log(u1));
    double angle = kTwoPi * u2;
    spare_gaussian_ = radius * std::sin(angle);
    has_spare_gaussian_ = true;
    return mean + stddev * radius * std::cos(angle);
}

RandomSource RandomSource::fork(uint64_t salt) const {
    uint64_t mixed = seed_ ^ (salt * 0xd1b54a32d192ed03ULL);
    return RandomSource(splitmix64(mixed));
}

uint64_t makeTimeSeed() {
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch();
    uint64_t x = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
    return RandomSource(x).next();
}
