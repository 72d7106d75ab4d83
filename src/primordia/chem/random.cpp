// SPDX-License-Identifier: AGPL-3.0-or-later
#include "primordia/chem/random.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace primordia::chem
{

    int Rng::uniform_int(int a, int b)
    {
        if (b <= a)
            return a;
        const double span = static_cast<double>(b) - static_cast<double>(a) + 1.0;
        const int offset = static_cast<int>(std::floor(random() * span));
        return std::min(b, a + offset);
    }

    std::size_t Rng::choice(std::size_t n)
    {
        if (n == 0)
            return 0;
        return static_cast<std::size_t>(uniform_int(0, static_cast<int>(n) - 1));
    }

    std::vector<std::size_t> Rng::sample(std::size_t n, std::size_t k)
    {
        k = std::min(k, n);
        std::vector<std::size_t> pool(n);
        std::iota(pool.begin(), pool.end(), std::size_t{0});

        // Partial Fisher-Yates: the first k slots hold the draw.
        for (std::size_t i = 0; i < k; ++i)
        {
            const std::size_t j = i + choice(n - i);
            std::swap(pool[i], pool[j]);
        }
        pool.resize(k);
        return pool;
    }

} // namespace primordia::chem
