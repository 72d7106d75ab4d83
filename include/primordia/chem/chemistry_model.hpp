// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "primordia/chem/molecule.hpp"

namespace primordia::chem
{

    struct Combination
    {
        std::string name;
        bool is_amphiphilic{false}; // inherited from either input
    };

    // Element symbol -> count, in first-seen order.
    using ElementCounts = std::vector<std::pair<std::string, int>>;

    // Strategy deciding what two molecules condense into and what a molecule
    // breaks down into. decompose() alone decides whether a molecule breaks
    // down; fewer than two fragments means no decomposition reaction.
    class ChemistryModel
    {
    public:
        virtual ~ChemistryModel() = default;

        virtual Combination combine(const Molecule &a, const Molecule &b) const = 0;
        virtual std::vector<Molecule> decompose(const Molecule &molecule) const = 0;
    };

    // Name-string heuristics: a few canonical pairs, an element-counting
    // condensation, and concatenation as last resort. Not stoichiometry.
    class HeuristicChemistry final : public ChemistryModel
    {
    public:
        static constexpr std::size_t kMinDecomposableLength = 5;

        Combination combine(const Molecule &a, const Molecule &b) const override;
        std::vector<Molecule> decompose(const Molecule &molecule) const override;

        static std::string combine_names(const std::string &a, const std::string &b);
        static ElementCounts count_elements(const std::string &formula);
    };

} // namespace primordia::chem
