// SPDX-License-Identifier: AGPL-3.0-or-later
#include "primordia/chem/compartment.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

#include "primordia/chem/environment.hpp"
#include "primordia/chem/random.hpp"

namespace primordia::chem
{

    Compartment::Compartment(math::Vec2 position, double radius)
        : m_position(position),
          m_radius(radius)
    {
        if (!(radius > 0.0))
            throw std::invalid_argument("Compartment radius must be positive");
    }

    bool Compartment::contains_point(const math::Vec2 &point) const
    {
        return math::distance(point, m_position) <= m_radius;
    }

    void Compartment::add_molecule(const std::string &name, std::int64_t count)
    {
        if (count <= 0)
            return;
        m_molecules[name] += count;
    }

    bool Compartment::add_to_boundary(const Molecule &molecule)
    {
        if (!molecule.is_amphiphilic)
            return false;
        m_boundary.push_back(molecule);
        return true;
    }

    std::int64_t Compartment::interior_total() const
    {
        std::int64_t sum = 0;
        for (const auto &[name, count] : m_molecules)
            sum += count;
        return sum;
    }

    void Compartment::update()
    {
        ++m_age;

        if (!m_boundary.empty())
        {
            const double packing = static_cast<double>(m_boundary.size()) / (100.0 + m_radius * 1000.0);
            m_stability = std::min(kMaxStability, 0.4 + 0.5 * packing);
        }
        else
        {
            m_stability = std::max(0.0, m_stability - kUnboundDecay);
        }

        const double load = std::log(1.0 + static_cast<double>(interior_total()));
        if (m_stability > kGrowthStability && !m_molecules.empty())
            m_radius += 0.001 * m_stability * load;

        m_metabolicActivity = static_cast<double>(m_molecules.size()) * load;
    }

    void Compartment::apply_environment(const Environment &env)
    {
        double penalty = 0.0;
        if (auto wet = env.wet_phase())
        {
            if (*wet < 0.2)
                penalty += 0.05; // dehydration
            else if (*wet > 0.8 && m_stability < 0.7)
                penalty += 0.02; // weak membranes dissolve
        }
        if (auto t = env.temperature())
        {
            if (*t < 10.0 || *t > 80.0)
                penalty += 0.03;
        }
        m_stability = std::max(0.0, m_stability - penalty);
    }

    bool Compartment::can_divide() const
    {
        return m_radius > m_divisionThreshold &&
               m_stability > kDivisionStability &&
               m_age > kDivisionAge;
    }

    std::pair<Compartment, Compartment> Compartment::divide(Rng &rng) const
    {
        const double angle = rng.uniform(0.0, 2.0 * std::numbers::pi);
        const double offset = m_radius * 0.5;
        const math::Vec2 axis{offset * std::cos(angle), offset * std::sin(angle)};

        Compartment first(m_position + axis, m_radius * kDaughterRadiusScale);
        Compartment second(m_position - axis, m_radius * kDaughterRadiusScale);

        for (const auto &[name, count] : m_molecules)
        {
            const double ratio = rng.uniform(0.4, 0.6);
            const auto share = static_cast<std::int64_t>(static_cast<double>(count) * ratio);
            first.add_molecule(name, share);
            second.add_molecule(name, count - share);
        }

        // Independent coin per membrane molecule; a daughter may end up bare.
        for (const auto &molecule : m_boundary)
        {
            if (rng.random() < 0.5)
                first.add_to_boundary(molecule);
            else
                second.add_to_boundary(molecule);
        }

        first.m_stability = std::clamp(m_stability + rng.uniform(-0.1, 0.1), kDissolutionStability, kMaxStability);
        second.m_stability = std::clamp(m_stability + rng.uniform(-0.1, 0.1), kDissolutionStability, kMaxStability);

        return {std::move(first), std::move(second)};
    }

} // namespace primordia::chem
