// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace primordia::chem
{
    class Reaction;

    // Directed multigraph of reactant -> product edges keyed by molecule name.
    // It is a derived view of the reaction catalog, never the source of truth.
    class ReactionGraph
    {
    public:
        static constexpr std::size_t kDefaultCycleBudget = 100000;

        void add_edge(const std::string &from, const std::string &to);

        // One edge per (reactant, product) pair of the reaction.
        void add_reaction(const Reaction &reaction);

        void clear();

        std::size_t node_count() const { return m_names.size(); }
        std::size_t edge_count() const { return m_edgeCount; }
        bool has_node(const std::string &name) const { return m_index.count(name) != 0; }
        bool has_edge(const std::string &from, const std::string &to) const;
        const std::vector<std::string> &nodes() const { return m_names; }

        // Tarjan; every node belongs to exactly one component.
        std::vector<std::vector<std::string>> strongly_connected_components() const;

        // Elementary cycles (parallel edges collapsed, self-loops are length-1
        // cycles). Throws std::length_error once more than `budget` cycles exist
        // or the path search expands more than 64 * budget nodes.
        std::vector<std::vector<std::string>> simple_cycles(std::size_t budget = kDefaultCycleBudget) const;

        std::size_t count_cycles_longer_than(std::size_t length, std::size_t budget = kDefaultCycleBudget) const;

    private:
        std::size_t node(const std::string &name);

        std::vector<std::string> m_names;
        std::unordered_map<std::string, std::size_t> m_index;
        std::vector<std::vector<std::size_t>> m_adjacency; // with parallel edges
        std::size_t m_edgeCount{0};
    };

} // namespace primordia::chem
