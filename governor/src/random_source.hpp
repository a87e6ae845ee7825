#pragma once
#include <cstdint>
#include <mutex>
#include <random>

// Source of every random draw the governor makes (jitter, long pauses,
// fingerprint seeds). Implementations must be safe to call from many threads.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform in [lo, hi]; returns lo when hi <= lo
    virtual double uniform(double lo, double hi) = 0;

    // True with the given probability
    virtual bool bernoulli(double probability) = 0;

    virtual uint64_t next_seed() = 0;
};

class Mt19937Random : public RandomSource {
public:
    Mt19937Random();
    explicit Mt19937Random(uint64_t seed);

    double uniform(double lo, double hi) override;
    bool bernoulli(double probability) override;
    uint64_t next_seed() override;

private:
    std::mutex mutex_;
    std::mt19937_64 gen_;
};
