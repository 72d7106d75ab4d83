// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "primordia/chem/molecule.hpp"

namespace primordia::chem
{

    // A transformation between molecule multisets. Everything but the catalyst
    // set is fixed at construction; catalysts only accumulate.
    class Reaction
    {
    public:
        static constexpr double kCatalystFactor = 5.0;
        static constexpr double kCatalyzedOrderGain = 1.5;

        Reaction() = default;
        Reaction(std::vector<Molecule> reactants, std::vector<Molecule> products, double baseRate = 0.01, double energy = 0.0)
            : m_reactants(std::move(reactants)),
              m_products(std::move(products)),
              m_baseRate(baseRate),
              m_energy(energy)
        {
        }

        const std::vector<Molecule> &reactants() const { return m_reactants; }
        const std::vector<Molecule> &products() const { return m_products; }
        double base_rate() const { return m_baseRate; }
        double energy() const { return m_energy; } // negative = exergonic
        const std::set<std::string> &catalysts() const { return m_catalysts; }

        // Set semantics; returns false when the molecule already catalyzes this reaction.
        bool add_catalyst(const Molecule &molecule) { return m_catalysts.insert(molecule.name).second; }
        bool has_catalyst(const std::string &name) const { return m_catalysts.count(name) != 0; }
        bool is_catalyzed() const { return !m_catalysts.empty(); }

        // base_rate * (1 + 5 ln(1 + |catalysts|)) once catalyzed.
        double effective_rate() const;

        // Complexity gained across the reaction, amplified 1.5x under catalysis.
        double entropy_reduction() const;

        // Distinct reactant names; a homodimerization yields a single entry.
        std::set<std::string> reactant_set() const;

        std::string to_string() const;

        // Hints consumed by environments; defaults match an aqueous reaction at pH 8.
        double optimal_ph{8.0};
        bool prefers_wet{true};
        bool metal_catalyzed{false};

    private:
        std::vector<Molecule> m_reactants;
        std::vector<Molecule> m_products;
        double m_baseRate{0.01};
        double m_energy{0.0};
        std::set<std::string> m_catalysts;
    };

} // namespace primordia::chem
