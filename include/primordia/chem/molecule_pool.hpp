// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "primordia/chem/molecule.hpp"

namespace primordia::chem
{

    // Name-keyed molecule counts that remember first-insertion order. An entry
    // keeps the definition it was inserted with until its count drops to zero,
    // at which point it is erased; counts are never stored at or below zero.
    class MoleculePool
    {
    public:
        struct Entry
        {
            Molecule molecule;
            std::int64_t count{0};
        };

        // Insert with this definition if absent, otherwise increase the count.
        // Returns true when a new entry was created. Non-positive counts are ignored.
        bool add(const Molecule &molecule, std::int64_t count);

        // Subtract and erase at <= 0. Returns the count left (0 when erased or absent).
        std::int64_t remove(const std::string &name, std::int64_t count);

        void clear();

        bool contains(const std::string &name) const { return m_entries.count(name) != 0; }
        std::int64_t count(const std::string &name) const;
        const Molecule *find(const std::string &name) const;
        Molecule *find(const std::string &name);

        std::size_t type_count() const { return m_order.size(); }
        bool empty() const { return m_order.empty(); }
        std::int64_t total() const;

        // Names in first-insertion order.
        const std::vector<std::string> &names() const { return m_order; }

        template <class F>
        void for_each(F &&f) const
        {
            for (const auto &name : m_order)
            {
                const Entry &e = m_entries.at(name);
                f(e.molecule, e.count);
            }
        }

        template <class F>
        void for_each_mutable(F &&f)
        {
            for (const auto &name : m_order)
            {
                Entry &e = m_entries.at(name);
                f(e.molecule, e.count);
            }
        }

    private:
        std::vector<std::string> m_order;
        std::unordered_map<std::string, Entry> m_entries;
    };

} // namespace primordia::chem
