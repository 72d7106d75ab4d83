// SPDX-License-Identifier: AGPL-3.0-or-later
#include "primordia/chem/reaction_graph.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <stdexcept>

#include "primordia/chem/reaction.hpp"

namespace primordia::chem
{
    namespace
    {
        using Adjacency = std::vector<std::vector<std::size_t>>;

        Adjacency collapse_parallel_edges(const Adjacency &adj)
        {
            Adjacency out(adj.size());
            for (std::size_t v = 0; v < adj.size(); ++v)
            {
                out[v] = adj[v];
                std::sort(out[v].begin(), out[v].end());
                out[v].erase(std::unique(out[v].begin(), out[v].end()), out[v].end());
            }
            return out;
        }
    }

    std::size_t ReactionGraph::node(const std::string &name)
    {
        auto it = m_index.find(name);
        if (it != m_index.end())
            return it->second;
        const std::size_t id = m_names.size();
        m_names.push_back(name);
        m_index.emplace(name, id);
        m_adjacency.emplace_back();
        return id;
    }

    void ReactionGraph::add_edge(const std::string &from, const std::string &to)
    {
        const std::size_t a = node(from);
        const std::size_t b = node(to);
        m_adjacency[a].push_back(b);
        ++m_edgeCount;
    }

    void ReactionGraph::add_reaction(const Reaction &reaction)
    {
        for (const auto &reactant : reaction.reactants())
        {
            for (const auto &product : reaction.products())
                add_edge(reactant.name, product.name);
        }
    }

    void ReactionGraph::clear()
    {
        m_names.clear();
        m_index.clear();
        m_adjacency.clear();
        m_edgeCount = 0;
    }

    bool ReactionGraph::has_edge(const std::string &from, const std::string &to) const
    {
        auto a = m_index.find(from);
        auto b = m_index.find(to);
        if (a == m_index.end() || b == m_index.end())
            return false;
        const auto &out = m_adjacency[a->second];
        return std::find(out.begin(), out.end(), b->second) != out.end();
    }

    std::vector<std::vector<std::string>> ReactionGraph::strongly_connected_components() const
    {
        constexpr std::size_t kUnvisited = std::numeric_limits<std::size_t>::max();
        const std::size_t n = m_names.size();
        std::vector<std::size_t> index(n, kUnvisited), low(n, 0);
        std::vector<bool> onStack(n, false);
        std::vector<std::size_t> stack;
        std::vector<std::vector<std::string>> components;
        std::size_t counter = 0;

        // Iterative Tarjan: frames of (node, next edge position)
        std::vector<std::pair<std::size_t, std::size_t>> frames;
        for (std::size_t root = 0; root < n; ++root)
        {
            if (index[root] != kUnvisited)
                continue;
            frames.emplace_back(root, 0);
            index[root] = low[root] = counter++;
            stack.push_back(root);
            onStack[root] = true;

            while (!frames.empty())
            {
                auto &[v, edge] = frames.back();
                if (edge < m_adjacency[v].size())
                {
                    const std::size_t w = m_adjacency[v][edge++];
                    if (index[w] == kUnvisited)
                    {
                        index[w] = low[w] = counter++;
                        stack.push_back(w);
                        onStack[w] = true;
                        frames.emplace_back(w, 0);
                    }
                    else if (onStack[w])
                    {
                        low[v] = std::min(low[v], index[w]);
                    }
                    continue;
                }

                const std::size_t done = v;
                frames.pop_back();
                if (!frames.empty())
                {
                    const std::size_t parent = frames.back().first;
                    low[parent] = std::min(low[parent], low[done]);
                }
                if (low[done] == index[done])
                {
                    std::vector<std::string> component;
                    std::size_t w = 0;
                    do
                    {
                        w = stack.back();
                        stack.pop_back();
                        onStack[w] = false;
                        component.push_back(m_names[w]);
                    } while (w != done);
                    components.push_back(std::move(component));
                }
            }
        }
        return components;
    }

    std::vector<std::vector<std::string>> ReactionGraph::simple_cycles(std::size_t budget) const
    {
        const Adjacency adj = collapse_parallel_edges(m_adjacency);
        const std::size_t n = adj.size();
        std::vector<std::vector<std::string>> cycles;
        std::vector<bool> onPath(n, false);
        std::vector<std::size_t> path;
        const std::size_t maxExpansions = budget * 64;
        std::size_t expansions = 0;

        // Each cycle is reported once, rooted at its smallest node id.
        std::function<void(std::size_t, std::size_t)> walk = [&](std::size_t start, std::size_t v)
        {
            for (std::size_t w : adj[v])
            {
                if (w < start)
                    continue;
                if (w == start)
                {
                    if (cycles.size() >= budget)
                        throw std::length_error("reaction graph cycle budget exceeded");
                    std::vector<std::string> cycle;
                    cycle.reserve(path.size());
                    for (std::size_t p : path)
                        cycle.push_back(m_names[p]);
                    cycles.push_back(std::move(cycle));
                }
                else if (!onPath[w])
                {
                    if (++expansions > maxExpansions)
                        throw std::length_error("reaction graph path search budget exceeded");
                    onPath[w] = true;
                    path.push_back(w);
                    walk(start, w);
                    path.pop_back();
                    onPath[w] = false;
                }
            }
        };

        for (std::size_t start = 0; start < n; ++start)
        {
            onPath[start] = true;
            path.push_back(start);
            walk(start, start);
            path.pop_back();
            onPath[start] = false;
        }
        return cycles;
    }

    std::size_t ReactionGraph::count_cycles_longer_than(std::size_t length, std::size_t budget) const
    {
        const auto cycles = simple_cycles(budget);
        return static_cast<std::size_t>(std::count_if(cycles.begin(), cycles.end(),
                                                      [length](const auto &c)
                                                      { return c.size() > length; }));
    }

} // namespace primordia::chem
