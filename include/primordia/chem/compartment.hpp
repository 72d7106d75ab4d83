// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "primordia/chem/molecule.hpp"
#include "primordia/math/vec2.hpp"

namespace primordia::chem
{
    class Environment;
    class Rng;

    // Membrane-bound protocell. Lifecycle: forming -> stable/growing ->
    // {dividing -> two forming daughters | dissolving -> removed}.
    class Compartment
    {
    public:
        static constexpr double kDefaultRadius = 0.05;
        static constexpr double kInitialStability = 0.5;
        static constexpr double kMaxStability = 0.9;
        static constexpr double kDissolutionStability = 0.1;
        static constexpr double kDivisionThreshold = 0.15;
        static constexpr double kDivisionStability = 0.6;
        static constexpr int kDivisionAge = 10;
        static constexpr double kGrowthStability = 0.5;
        static constexpr double kUnboundDecay = 0.05;
        static constexpr double kDaughterRadiusScale = 0.6;

        explicit Compartment(math::Vec2 position, double radius = kDefaultRadius);

        bool contains_point(const math::Vec2 &point) const;

        void add_molecule(const std::string &name, std::int64_t count = 1);

        // Only amphiphilic molecules can join the membrane.
        bool add_to_boundary(const Molecule &molecule);

        // Age, recompute stability from the membrane, grow, refresh metabolic activity.
        void update();

        // Dry phase, wet-phase dissolution of weak membranes and temperature
        // extremes all erode stability; it never drops below zero.
        void apply_environment(const Environment &env);

        bool can_divide() const;
        bool is_dissolved() const { return m_stability <= kDissolutionStability; }

        // Split into two daughters; the interior is conserved exactly per name.
        std::pair<Compartment, Compartment> divide(Rng &rng) const;

        const math::Vec2 &position() const { return m_position; }
        double radius() const { return m_radius; }
        double stability() const { return m_stability; }
        int age() const { return m_age; }
        double division_threshold() const { return m_divisionThreshold; }
        double metabolic_activity() const { return m_metabolicActivity; }
        const std::map<std::string, std::int64_t> &molecules() const { return m_molecules; }
        const std::vector<Molecule> &boundary_molecules() const { return m_boundary; }
        std::int64_t interior_total() const;

        void set_radius(double r) { m_radius = r; }
        void set_stability(double s) { m_stability = s; }
        void set_age(int a) { m_age = a; }

    private:
        math::Vec2 m_position{};
        double m_radius{kDefaultRadius};
        std::map<std::string, std::int64_t> m_molecules; // interior counts
        std::vector<Molecule> m_boundary;               // membrane
        double m_stability{kInitialStability};
        int m_age{0};
        double m_divisionThreshold{kDivisionThreshold};
        double m_metabolicActivity{0.0};
    };

} // namespace primordia::chem
