// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace primordia::chem
{

    // Injectable random source. Only random() is primitive; everything else is
    // derived from it so a scripted source reproduces whole simulation steps.
    class Rng
    {
    public:
        virtual ~Rng() = default;

        // Uniform double in [0, 1).
        virtual double random() = 0;

        double uniform(double a, double b) { return a + (b - a) * random(); }

        // Uniform integer in [a, b] (inclusive).
        int uniform_int(int a, int b);

        // Random index into a collection of size n (n > 0).
        std::size_t choice(std::size_t n);

        // k distinct indices drawn from [0, n) in draw order; k is clamped to n.
        std::vector<std::size_t> sample(std::size_t n, std::size_t k);
    };

    class MersenneRng final : public Rng
    {
    public:
        explicit MersenneRng(std::uint64_t seed = 1234567ULL) : m_engine(seed) {}

        double random() override { return m_dist(m_engine); }

        void reseed(std::uint64_t seed) { m_engine.seed(seed); }

    private:
        std::mt19937_64 m_engine;
        std::uniform_real_distribution<double> m_dist{0.0, 1.0};
    };

} // namespace primordia::chem
