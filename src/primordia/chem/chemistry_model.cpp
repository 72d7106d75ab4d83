// SPDX-License-Identifier: AGPL-3.0-or-later
#include "primordia/chem/chemistry_model.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace primordia::chem
{
    namespace detail
    {
        static inline bool contains(const std::string &s, char c)
        {
            return s.find(c) != std::string::npos;
        }

        static inline int &count_of(ElementCounts &counts, const std::string &symbol)
        {
            auto it = std::find_if(counts.begin(), counts.end(),
                                   [&](const auto &e)
                                   { return e.first == symbol; });
            if (it == counts.end())
            {
                counts.emplace_back(symbol, 0);
                return counts.back().second;
            }
            return it->second;
        }

        static inline std::string canonical_pair(const std::string &a, const std::string &b)
        {
            if (a == "H2O" && b == "CO2")
                return "H2CO3"; // carbonic acid
            if (a == "H2" && b == "N2")
                return "NH3";
            if (a == "CH4" && b == "O2")
                return "CH3OH"; // methanol
            return {};
        }
    }

    ElementCounts HeuristicChemistry::count_elements(const std::string &formula)
    {
        ElementCounts counts;
        std::size_t i = 0;
        while (i < formula.size())
        {
            std::string symbol;
            const bool twoLetter = i + 1 < formula.size() &&
                                   std::isalpha(static_cast<unsigned char>(formula[i])) &&
                                   std::islower(static_cast<unsigned char>(formula[i + 1]));
            if (twoLetter)
            {
                symbol = formula.substr(i, 2);
                i += 2;
            }
            else
            {
                symbol = formula.substr(i, 1);
                i += 1;
            }

            int count = 1;
            if (i < formula.size() && std::isdigit(static_cast<unsigned char>(formula[i])))
            {
                count = 0;
                while (i < formula.size() && std::isdigit(static_cast<unsigned char>(formula[i])))
                {
                    count = count * 10 + (formula[i] - '0');
                    ++i;
                }
            }
            detail::count_of(counts, symbol) += count;
        }
        return counts;
    }

    std::string HeuristicChemistry::combine_names(const std::string &a, const std::string &b)
    {
        if (auto known = detail::canonical_pair(a, b); !known.empty())
            return known;

        // Condensation: each side loses one H, the first gains the bridging O.
        if (a.size() > 1 && b.size() > 1 && detail::contains(a, 'H') && detail::contains(b, 'H'))
        {
            ElementCounts left = count_elements(a);
            ElementCounts right = count_elements(b);

            int &hLeft = detail::count_of(left, "H");
            hLeft = std::max(0, hLeft - 1);
            int &hRight = detail::count_of(right, "H");
            hRight = std::max(0, hRight - 1);
            detail::count_of(left, "O") += 1;

            ElementCounts combined;
            for (const auto &[symbol, n] : left)
                detail::count_of(combined, symbol) += n;
            for (const auto &[symbol, n] : right)
                detail::count_of(combined, symbol) += n;

            std::ostringstream f;
            for (const auto &[symbol, n] : combined)
            {
                f << symbol;
                if (n > 1)
                    f << n;
            }
            return f.str();
        }

        return a + b;
    }

    Combination HeuristicChemistry::combine(const Molecule &a, const Molecule &b) const
    {
        return Combination{combine_names(a.name, b.name), a.is_amphiphilic || b.is_amphiphilic};
    }

    std::vector<Molecule> HeuristicChemistry::decompose(const Molecule &molecule) const
    {
        std::vector<Molecule> fragments;
        const std::string &name = molecule.name;
        if (name.size() < kMinDecomposableLength)
            return fragments;

        if (detail::contains(name, 'C') && detail::contains(name, 'H'))
        {
            if (detail::contains(name, 'O'))
            {
                fragments.emplace_back("CH2O", 2.0);
                fragments.emplace_back("CO2", 1.0);
            }
            else
            {
                fragments.emplace_back("CH4", 1.0);
            }
        }
        else if (detail::contains(name, 'N'))
        {
            fragments.emplace_back("NH3", 1.0);
        }

        if (fragments.empty())
        {
            const double half = molecule.complexity / 2.0;
            fragments.emplace_back("Fragment1_" + name, half);
            fragments.emplace_back("Fragment2_" + name, half);
        }
        return fragments;
    }

} // namespace primordia::chem
