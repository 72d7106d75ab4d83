// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstdint>
#include <vector>

#include "primordia/chem/molecule.hpp"

namespace primordia::chem
{

    struct FoodItem
    {
        Molecule molecule;
        std::int64_t count{0};
    };

    constexpr std::int64_t kPrebioticSeedCount = 100;

    // Simple prebiotic feedstock plus two amphiphile seeds (caprylic acid and a
    // basic phospholipid).
    std::vector<Molecule> prebiotic_food_set();

    // Every molecule at the same abundance, in the given order.
    std::vector<FoodItem> uniform_food(const std::vector<Molecule> &molecules, std::int64_t count);

    // Same feedstock with abundances weighted toward water and small gases.
    std::vector<FoodItem> initial_food_set();

} // namespace primordia::chem
