// SPDX-License-Identifier: AGPL-3.0-or-later
#include "primordia/chem/statistics.hpp"

#include <algorithm>
#include <cmath>

namespace primordia::chem
{
    namespace
    {
        constexpr std::size_t kMinSamples = 10;
        constexpr std::size_t kMaxWindow = 50;
        constexpr std::size_t kMinPairs = 5;
        constexpr double kMinStdDev = 1e-4;

        double mean(const double *v, std::size_t n)
        {
            double s = 0.0;
            for (std::size_t i = 0; i < n; ++i)
                s += v[i];
            return s / static_cast<double>(n);
        }

        // Population standard deviation.
        double stddev(const double *v, std::size_t n, double mu)
        {
            double s = 0.0;
            for (std::size_t i = 0; i < n; ++i)
                s += (v[i] - mu) * (v[i] - mu);
            return std::sqrt(s / static_cast<double>(n));
        }
    }

    double feedback_coefficient(const std::vector<double> &entropyReduction,
                                const std::vector<double> &catalyticActivity)
    {
        // Align the two series on their most recent samples.
        const std::size_t n = std::min(entropyReduction.size(), catalyticActivity.size());
        if (n < kMinSamples)
            return 0.0;

        std::size_t window = std::min(kMaxWindow, n / 4);
        if (window < kMinSamples)
            window = n;

        // Entropy at t-1 against catalysis at t.
        const std::size_t pairs = window - 1;
        if (pairs < kMinPairs)
            return 0.0;
        const double *er = entropyReduction.data() + (entropyReduction.size() - window);
        const double *ca = catalyticActivity.data() + (catalyticActivity.size() - pairs);

        const double muEr = mean(er, pairs);
        const double muCa = mean(ca, pairs);
        const double sdEr = stddev(er, pairs, muEr);
        const double sdCa = stddev(ca, pairs, muCa);
        if (!(sdEr >= kMinStdDev) || !(sdCa >= kMinStdDev))
            return 0.0;

        double cov = 0.0;
        for (std::size_t i = 0; i < pairs; ++i)
            cov += (er[i] - muEr) * (ca[i] - muCa);
        cov /= static_cast<double>(pairs);

        const double r = cov / (sdEr * sdCa);
        if (!std::isfinite(r))
            return 0.0;
        return std::clamp(r, -1.0, 1.0);
    }

} // namespace primordia::chem
