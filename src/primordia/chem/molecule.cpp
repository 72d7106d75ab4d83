// SPDX-License-Identifier: AGPL-3.0-or-later
#include "primordia/chem/molecule.hpp"

#include <cmath>

#include "primordia/chem/random.hpp"
#include "primordia/chem/reaction.hpp"

namespace primordia::chem
{
    namespace
    {
        inline void reflect(double &p, double &v, double bound)
        {
            if (p < 0.0)
            {
                p = -p;
                v = -v;
            }
            else if (p > bound)
            {
                p = 2.0 * bound - p;
                v = -v;
            }
        }

        bool similar_names(const std::string &a, const std::string &b)
        {
            if (a.size() < Molecule::kMinCatalyticNameLength || b.size() < Molecule::kMinCatalyticNameLength)
                return false;
            return b.find(a) != std::string::npos || a.find(b) != std::string::npos;
        }
    }

    void Molecule::update_position(const math::Vec2 &bounds, Rng &rng)
    {
        double x = position.x + velocity.x;
        double y = position.y + velocity.y;
        double dx = velocity.x;
        double dy = velocity.y;

        reflect(x, dx, bounds.x);
        reflect(y, dy, bounds.y);

        dx += rng.uniform(-kBrownianKick, kBrownianKick);
        dy += rng.uniform(-kBrownianKick, kBrownianKick);

        const double magnitude = std::sqrt(dx * dx + dy * dy);
        if (magnitude > kMaxSpeed)
        {
            dx = dx / magnitude * kMaxSpeed;
            dy = dy / magnitude * kMaxSpeed;
        }

        position = {x, y};
        velocity = {dx, dy};
    }

    bool Molecule::can_catalyze(const Reaction &reaction) const
    {
        for (const auto &reactant : reaction.reactants())
        {
            if (similar_names(name, reactant.name))
                return true;
        }
        for (const auto &product : reaction.products())
        {
            if (similar_names(name, product.name))
                return true;
        }
        return false;
    }

} // namespace primordia::chem
