// SPDX-License-Identifier: AGPL-3.0-or-later
#include "primordia/chem/reaction.hpp"

#include <cmath>
#include <sstream>

namespace primordia::chem
{
    namespace
    {
        double total_complexity(const std::vector<Molecule> &molecules)
        {
            double sum = 0.0;
            for (const auto &m : molecules)
                sum += m.complexity;
            return sum;
        }

        void join_names(std::ostringstream &out, const std::vector<Molecule> &molecules)
        {
            for (std::size_t i = 0; i < molecules.size(); ++i)
            {
                if (i > 0)
                    out << " + ";
                out << molecules[i].name;
            }
        }
    }

    double Reaction::effective_rate() const
    {
        if (m_catalysts.empty())
            return m_baseRate;
        // Diminishing returns in the number of catalysts
        return m_baseRate * (1.0 + kCatalystFactor * std::log(1.0 + static_cast<double>(m_catalysts.size())));
    }

    double Reaction::entropy_reduction() const
    {
        const double change = total_complexity(m_reactants) - total_complexity(m_products);
        const double gain = is_catalyzed() ? kCatalyzedOrderGain : 1.0;
        return -change * gain;
    }

    std::set<std::string> Reaction::reactant_set() const
    {
        std::set<std::string> names;
        for (const auto &r : m_reactants)
            names.insert(r.name);
        return names;
    }

    std::string Reaction::to_string() const
    {
        std::ostringstream out;
        join_names(out, m_reactants);
        out << " -> ";
        join_names(out, m_products);
        return out.str();
    }

} // namespace primordia::chem
