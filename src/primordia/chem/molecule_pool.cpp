// SPDX-License-Identifier: AGPL-3.0-or-later
#include "primordia/chem/molecule_pool.hpp"

#include <algorithm>

namespace primordia::chem
{

    bool MoleculePool::add(const Molecule &molecule, std::int64_t count)
    {
        if (count <= 0)
            return false;
        auto it = m_entries.find(molecule.name);
        if (it != m_entries.end())
        {
            it->second.count += count;
            return false;
        }
        m_entries.emplace(molecule.name, Entry{molecule, count});
        m_order.push_back(molecule.name);
        return true;
    }

    std::int64_t MoleculePool::remove(const std::string &name, std::int64_t count)
    {
        auto it = m_entries.find(name);
        if (it == m_entries.end())
            return 0;
        it->second.count -= count;
        if (it->second.count > 0)
            return it->second.count;

        m_order.erase(std::find(m_order.begin(), m_order.end(), name));
        m_entries.erase(it);
        return 0;
    }

    void MoleculePool::clear()
    {
        m_entries.clear();
        m_order.clear();
    }

    std::int64_t MoleculePool::count(const std::string &name) const
    {
        auto it = m_entries.find(name);
        return it == m_entries.end() ? 0 : it->second.count;
    }

    const Molecule *MoleculePool::find(const std::string &name) const
    {
        auto it = m_entries.find(name);
        return it == m_entries.end() ? nullptr : &it->second.molecule;
    }

    Molecule *MoleculePool::find(const std::string &name)
    {
        auto it = m_entries.find(name);
        return it == m_entries.end() ? nullptr : &it->second.molecule;
    }

    std::int64_t MoleculePool::total() const
    {
        std::int64_t sum = 0;
        for (const auto &[name, e] : m_entries)
            sum += e.count;
        return sum;
    }

} // namespace primordia::chem
