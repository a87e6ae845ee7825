#include "random_source.hpp"
#include <algorithm>

Mt19937Random::Mt19937Random() : gen_(std::random_device{}()) {}

Mt19937Random::Mt19937Random(uint64_t seed) : gen_(seed) {}

double Mt19937Random::uniform(double lo, double hi) {
    if (hi <= lo) {
        return lo;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_real_distribution<double> dis(lo, hi);
    return dis(gen_);
}

bool Mt19937Random::bernoulli(double probability) {
    double p = std::clamp(probability, 0.0, 1.0);
    std::lock_guard<std::mutex> lock(mutex_);
    std::bernoulli_distribution dis(p);
    return dis(gen_);
}

uint64_t Mt19937Random::next_seed() {
    std::lock_guard<std::mutex> lock(mutex_);
    return gen_();
}
