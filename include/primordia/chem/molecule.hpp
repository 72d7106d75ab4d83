// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <string>
#include <utility>

#include "primordia/math/vec2.hpp"

namespace primordia::chem
{
    class Rng;
    class Reaction;

    // A molecule type. Identity is the name alone; how many units exist is
    // tracked by the owning pool, never per instance.
    struct Molecule
    {
        static constexpr double kMaxSpeed = 0.05;
        static constexpr double kBrownianKick = 0.005;
        static constexpr std::size_t kMinCatalyticNameLength = 3;

        std::string name;               // e.g. H2O, C8H16O2
        double complexity{1.0};         // >= 0
        bool is_amphiphilic{false};     // can form a compartment boundary
        double hydrophobic_strength{0}; // 0 unless amphiphilic
        math::Vec2 position{};
        math::Vec2 velocity{};

        Molecule() = default;
        Molecule(std::string n, double c = 1.0, bool amphiphilic = false, double hydrophobic = 0.5)
            : name(std::move(n)),
              complexity(c),
              is_amphiphilic(amphiphilic),
              hydrophobic_strength(amphiphilic ? hydrophobic : 0.0)
        {
        }

        // Advance by velocity, reflect elastically inside [0,bounds], apply a
        // Brownian kick and clamp the speed to kMaxSpeed.
        void update_position(const math::Vec2 &bounds, Rng &rng);

        // Substring similarity between this name and any reactant or product name.
        bool can_catalyze(const Reaction &reaction) const;
    };

    inline bool operator==(const Molecule &a, const Molecule &b) { return a.name == b.name; }
    inline bool operator!=(const Molecule &a, const Molecule &b) { return !(a == b); }

} // namespace primordia::chem
