// SPDX-License-Identifier: AGPL-3.0-or-later
#include "primordia/chem/food_set.hpp"

namespace primordia::chem
{

    std::vector<Molecule> prebiotic_food_set()
    {
        return {
            Molecule{"H2O", 1.0},
            Molecule{"CH4", 1.0},
            Molecule{"NH3", 1.0},
            Molecule{"H2", 1.0},
            Molecule{"CO2", 1.0},
            Molecule{"HCN", 2.0},
            Molecule{"CH2O", 2.0},
            Molecule{"C2H4O2", 3.0},  // acetic acid
            Molecule{"C2H5NO2", 5.0}, // glycine
            Molecule{"C8H16O2", 10.0, true},
            Molecule{"C10H18O8P", 15.0, true},
        };
    }

    std::vector<FoodItem> uniform_food(const std::vector<Molecule> &molecules, std::int64_t count)
    {
        std::vector<FoodItem> food;
        food.reserve(molecules.size());
        for (const auto &m : molecules)
            food.push_back({m, count});
        return food;
    }

    std::vector<FoodItem> initial_food_set()
    {
        return {
            {Molecule{"H2O", 1.0}, 1000},
            {Molecule{"CH4", 1.0}, 500},
            {Molecule{"NH3", 1.0}, 300},
            {Molecule{"H2", 1.0}, 800},
            {Molecule{"CO2", 1.0}, 400},
            {Molecule{"CH2O", 2.0}, 50},
            {Molecule{"HCN", 2.0}, 30},
            {Molecule{"C8H16O2", 10.0, true}, 10},
            {Molecule{"C10H18O8P", 20.0, true}, 5},
        };
    }

} // namespace primordia::chem
