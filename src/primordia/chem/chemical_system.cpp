// SPDX-License-Identifier: AGPL-3.0-or-later
#include "primordia/chem/chemical_system.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

namespace primordia::chem
{
    namespace
    {
        // Staged per-step deltas, kept apart from the live pool until commit.
        struct Ledger
        {
            std::vector<Molecule> order;
            std::unordered_map<std::string, std::int64_t> counts;

            void add(const Molecule &m, std::int64_t n)
            {
                auto [it, inserted] = counts.try_emplace(m.name, 0);
                if (inserted)
                    order.push_back(m);
                it->second += n;
            }
        };

        struct Pathway
        {
            const char *first;
            const char *second;
            Molecule product;
            double rate;
        };

        const std::vector<Pathway> &prebiotic_pathways()
        {
            static const std::vector<Pathway> table = {
                {"CH2O", "CH2O", Molecule{"C2H4O2", 4.0}, 0.005},    // formose: glycolaldehyde
                {"C2H4O2", "CH2O", Molecule{"C3H6O3", 6.0}, 0.003},  // glyceraldehyde
                {"HCN", "HCN", Molecule{"C2H2N2", 4.0}, 0.002},      // cyanide dimer
                {"C2H2N2", "H2O", Molecule{"C2H5NO2", 8.0}, 0.001},  // glycine
                {"CH4", "CO2", Molecule{"C2H4O2", 5.0}, 0.001},      // acetic acid
                {"C2H4O2", "C2H4O2", Molecule{"C4H8O2", 7.0, true}, 0.0005},
                {"C4H8O2", "C4H8O2", Molecule{"C8H16O2", 12.0, true}, 0.0003},
            };
            return table;
        }
    }

    ChemicalSystem::ChemicalSystem(SystemSettings settings,
                                   std::unique_ptr<Rng> rng,
                                   std::unique_ptr<ChemistryModel> chemistry)
        : m_settings(settings),
          m_rng(std::move(rng)),
          m_chemistry(std::move(chemistry))
    {
        if (!(m_settings.width > 0.0) || !(m_settings.height > 0.0))
            throw std::invalid_argument("ChemicalSystem world bounds must be positive");
        if (m_settings.formation_threshold <= 0)
            throw std::invalid_argument("ChemicalSystem formation threshold must be positive");
        if (!m_rng)
            m_rng = std::make_unique<MersenneRng>();
        if (!m_chemistry)
            m_chemistry = std::make_unique<HeuristicChemistry>();
    }

    void ChemicalSystem::deposit(const Molecule &molecule, std::int64_t count)
    {
        if (count <= 0)
            return;
        if (m_pool.contains(molecule.name))
        {
            m_pool.add(molecule, count);
            return;
        }
        Molecule placed = molecule;
        placed.position = {m_rng->random(), m_rng->random()};
        placed.velocity = {m_rng->uniform(-0.01, 0.01), m_rng->uniform(-0.01, 0.01)};
        m_pool.add(placed, count);
    }

    void ChemicalSystem::add_molecule(const Molecule &molecule, std::int64_t count)
    {
        deposit(molecule, count);
    }

    std::size_t ChemicalSystem::add_reaction(Reaction reaction)
    {
        m_graph.add_reaction(reaction);
        m_reactions.push_back(std::move(reaction));
        return m_reactions.size() - 1;
    }

    void ChemicalSystem::add_compartment(Compartment compartment)
    {
        m_compartments.push_back(std::move(compartment));
    }

    void ChemicalSystem::generate_initial_reactions()
    {
        std::vector<Molecule> molecules;
        molecules.reserve(m_pool.type_count());
        m_pool.for_each([&](const Molecule &m, std::int64_t)
                        { molecules.push_back(m); });

        const std::size_t limit = m_settings.pair_name_length_limit;
        for (std::size_t i = 0; i < molecules.size(); ++i)
        {
            for (std::size_t j = i; j < molecules.size(); ++j)
            {
                const Molecule &a = molecules[i];
                const Molecule &b = molecules[j];
                if (a.name.size() > limit && b.name.size() > limit)
                    continue;

                const Combination c = m_chemistry->combine(a, b);
                const double base = a.complexity + b.complexity;
                const double complexity = base * m_rng->uniform(1.0, 1.2);
                const bool amphiphilic = c.is_amphiphilic || (c.name.size() >= 7 && m_rng->random() < 0.2);

                add_reaction(Reaction({a, b}, {Molecule(c.name, complexity, amphiphilic)}, 0.01 / (1.0 + base / 5.0)));
            }
        }

        for (const auto &m : molecules)
        {
            auto fragments = m_chemistry->decompose(m);
            if (fragments.size() >= 2)
                add_reaction(Reaction({m}, std::move(fragments), 0.005));
        }

        spdlog::debug("Generated {} initial reactions from {} molecule types", m_reactions.size(), molecules.size());
    }

    void ChemicalSystem::add_prebiotic_pathways()
    {
        // Presence is judged on the pool as it was before any pathway was added.
        const MoleculePool snapshot = m_pool;
        for (const auto &p : prebiotic_pathways())
        {
            const Molecule *first = snapshot.find(p.first);
            const Molecule *second = snapshot.find(p.second);
            if (!first || !second)
                continue;
            add_reaction(Reaction({*first, *second}, {p.product}, p.rate));
        }
    }

    bool ChemicalSystem::is_active(const Reaction &reaction) const
    {
        for (const auto &r : reaction.reactants())
        {
            if (m_pool.count(r.name) <= 0)
                return false;
        }
        return true;
    }

    bool ChemicalSystem::has_reaction_between(const std::string &a, const std::string &b) const
    {
        const std::set<std::string> pair{a, b};
        return std::any_of(m_reactions.begin(), m_reactions.end(),
                           [&](const Reaction &r)
                           { return r.reactant_set() == pair; });
    }

    void ChemicalSystem::identify_catalysts()
    {
        m_pool.for_each([&](const Molecule &m, std::int64_t)
                        {
                            for (auto &reaction : m_reactions)
                            {
                                if (!reaction.has_catalyst(m.name) && m.can_catalyze(reaction))
                                    reaction.add_catalyst(m);
                            } });
    }

    void ChemicalSystem::update()
    {
        const NeutralEnvironment neutral{};
        update(neutral);
    }

    void ChemicalSystem::update(const Environment &env)
    {
        ++m_timeStep;

        move_molecules();
        refresh_active_reactions();
        execute_reactions(env);
        identify_catalysts();
        update_compartments(env);
        check_compartment_formation();
        record_metrics();

        if (m_settings.discovery_interval > 0 && m_timeStep % m_settings.discovery_interval == 0)
            discover_new_reactions();
    }

    void ChemicalSystem::move_molecules()
    {
        const math::Vec2 bounds{m_settings.width, m_settings.height};
        m_pool.for_each_mutable([&](Molecule &m, std::int64_t)
                                { m.update_position(bounds, *m_rng); });
    }

    void ChemicalSystem::refresh_active_reactions()
    {
        m_active.clear();
        for (std::size_t i = 0; i < m_reactions.size(); ++i)
        {
            if (is_active(m_reactions[i]))
                m_active.push_back(i);
        }
    }

    void ChemicalSystem::execute_reactions(const Environment &env)
    {
        Ledger consumed;
        Ledger produced;
        m_lastEvents.clear();

        for (std::size_t index : m_active)
        {
            const Reaction &reaction = m_reactions[index];

            std::int64_t available = m_settings.max_events_per_reaction;
            for (const auto &r : reaction.reactants())
                available = std::min(available, m_pool.count(r.name));
            if (available <= 0)
                continue;

            const double probability = reaction.effective_rate() * env.affect_reaction(reaction);
            std::int64_t events = 0;
            for (std::int64_t k = 0; k < available; ++k)
            {
                if (m_rng->random() < probability)
                    ++events;
            }
            if (events == 0)
                continue;

            for (const auto &r : reaction.reactants())
                consumed.add(r, events);
            for (const auto &p : reaction.products())
                produced.add(p, events);
            m_lastEvents.push_back({index, events});
        }

        // Commit: consumption first, so a product may re-enter a type that just ran out.
        for (const auto &m : consumed.order)
            m_pool.remove(m.name, consumed.counts.at(m.name));
        for (const auto &m : produced.order)
            deposit(m, produced.counts.at(m.name));
    }

    void ChemicalSystem::update_compartments(const Environment &env)
    {
        std::vector<Compartment> survivors;
        std::vector<Compartment> daughters;
        survivors.reserve(m_compartments.size());

        for (auto &compartment : m_compartments)
        {
            compartment.update();

            if (compartment.is_dissolved())
            {
                spdlog::debug("Compartment at ({:.3f}, {:.3f}) dissolved after {} steps",
                              compartment.position().x, compartment.position().y, compartment.age());
                continue;
            }

            if (compartment.can_divide())
            {
                auto [first, second] = compartment.divide(*m_rng);
                spdlog::debug("Compartment at ({:.3f}, {:.3f}) divided at radius {:.4f}",
                              compartment.position().x, compartment.position().y, compartment.radius());
                daughters.push_back(std::move(first));
                daughters.push_back(std::move(second));
                continue;
            }

            compartment.apply_environment(env);
            survivors.push_back(std::move(compartment));
        }

        for (auto &d : daughters)
            survivors.push_back(std::move(d));
        m_compartments = std::move(survivors);
    }

    void ChemicalSystem::check_compartment_formation()
    {
        const std::int64_t amphiphiles = amphiphilic_count();
        const std::int64_t threshold = m_settings.formation_threshold;
        if (amphiphiles < threshold)
            return;

        const double p = m_settings.formation_probability * (static_cast<double>(amphiphiles) / static_cast<double>(threshold));
        if (m_rng->random() >= p)
            return;

        Compartment compartment({m_rng->random() * m_settings.width, m_rng->random() * m_settings.height});

        std::vector<std::string> candidates;
        m_pool.for_each([&](const Molecule &m, std::int64_t count)
                        {
                            if (m.is_amphiphilic && count > 0)
                                candidates.push_back(m.name); });

        const std::int64_t pulls = std::min(m_settings.boundary_pull, amphiphiles);
        for (std::int64_t i = 0; i < pulls && !candidates.empty(); ++i)
        {
            const std::string &name = candidates[m_rng->choice(candidates.size())];
            const Molecule *molecule = m_pool.find(name);
            if (!molecule)
                continue; // that type ran out earlier in this draw
            compartment.add_to_boundary(*molecule);
            m_pool.remove(name, 1);
        }

        const std::vector<std::string> names = m_pool.names();
        for (const auto &name : names)
        {
            if (m_pool.count(name) <= m_settings.interior_abundance)
                continue;
            const int inside = m_rng->uniform_int(1, 5);
            m_pool.remove(name, inside);
            compartment.add_molecule(name, inside);
        }

        spdlog::debug("Compartment formed at ({:.3f}, {:.3f}) with {} membrane molecules",
                      compartment.position().x, compartment.position().y, compartment.boundary_molecules().size());
        m_compartments.push_back(std::move(compartment));
    }

    void ChemicalSystem::record_metrics()
    {
        const std::int64_t total = m_pool.total();
        const double avgComplexity = average_complexity();

        double energyCurrency = 0.0;
        m_pool.for_each([&](const Molecule &m, std::int64_t count)
                        {
                            if (m.name.find('P') != std::string::npos || m.complexity > 10.0)
                                energyCurrency += static_cast<double>(count); });

        double entropyReduction = 0.0;
        std::size_t activeNow = 0;
        std::size_t catalyzedNow = 0;
        for (const auto &reaction : m_reactions)
        {
            if (!is_active(reaction))
                continue;
            ++activeNow;
            entropyReduction += reaction.entropy_reduction();
            if (reaction.is_catalyzed())
                ++catalyzedNow;
        }
        const double catalyticActivity =
            activeNow > 0 ? static_cast<double>(catalyzedNow) / static_cast<double>(activeNow) : 0.0;

        double avgStability = 0.0;
        if (!m_compartments.empty())
        {
            for (const auto &c : m_compartments)
                avgStability += c.stability();
            avgStability /= static_cast<double>(m_compartments.size());
        }

        double entropyRatio = 1.0;
        if (avgComplexity > 0.0 && !m_metrics.complexity.empty())
        {
            const double initial = m_metrics.complexity.front() != 0.0 ? m_metrics.complexity.front() : 1.0;
            entropyRatio = initial / avgComplexity;
        }

        double catalyticRatio = 0.0;
        if (total > 0)
        {
            std::size_t catalystTypes = 0;
            m_pool.for_each([&](const Molecule &m, std::int64_t)
                            {
                                const bool catalyzes = std::any_of(m_reactions.begin(), m_reactions.end(),
                                                                   [&](const Reaction &r)
                                                                   { return r.has_catalyst(m.name); });
                                if (catalyzes)
                                    ++catalystTypes; });
            catalyticRatio = static_cast<double>(catalystTypes) / static_cast<double>(m_pool.type_count());
        }

        m_metrics.molecule_counts.push_back(static_cast<double>(m_pool.type_count()));
        m_metrics.reaction_counts.push_back(static_cast<double>(m_active.size()));
        m_metrics.complexity.push_back(avgComplexity);
        m_metrics.energy_currency.push_back(energyCurrency);
        m_metrics.entropy_reduction.push_back(entropyReduction);
        m_metrics.catalytic_activity.push_back(catalyticActivity);
        m_metrics.compartment_count.push_back(static_cast<double>(m_compartments.size()));
        m_metrics.avg_stability.push_back(avgStability);
        m_metrics.entropy_ratio.push_back(entropyRatio);
        m_metrics.catalytic_ratio.push_back(catalyticRatio);
    }

    void ChemicalSystem::discover_new_reactions()
    {
        const std::vector<std::string> names = m_pool.names();
        if (names.size() < 2)
            return;

        const auto picks = m_rng->sample(names.size(), m_settings.discovery_sample);
        std::size_t discovered = 0;
        for (std::size_t i = 0; i < picks.size(); ++i)
        {
            for (std::size_t j = i + 1; j < picks.size(); ++j)
            {
                const Molecule a = *m_pool.find(names[picks[i]]);
                const Molecule b = *m_pool.find(names[picks[j]]);
                if (has_reaction_between(a.name, b.name))
                    continue;
                if (m_rng->random() >= m_settings.discovery_probability)
                    continue;

                const Combination c = m_chemistry->combine(a, b);
                if (c.name.size() > m_settings.max_product_name_length)
                    continue;

                const double base = a.complexity + b.complexity;
                const double complexity = base * m_rng->uniform(1.0, 1.3);
                const bool amphiphilic = c.is_amphiphilic || (complexity > 8.0 && m_rng->random() < 0.3);

                add_reaction(Reaction({a, b}, {Molecule(c.name, complexity, amphiphilic)}, 0.005 / (1.0 + base / 10.0)));
                ++discovered;
            }
        }

        if (discovered > 0)
            spdlog::debug("Step {}: discovered {} new reactions ({} total)", m_timeStep, discovered, m_reactions.size());
    }

    std::int64_t ChemicalSystem::amphiphilic_count() const
    {
        std::int64_t sum = 0;
        m_pool.for_each([&](const Molecule &m, std::int64_t count)
                        {
                            if (m.is_amphiphilic)
                                sum += count; });
        return sum;
    }

    double ChemicalSystem::average_complexity() const
    {
        const std::int64_t total = m_pool.total();
        if (total <= 0)
            return 0.0;
        double weighted = 0.0;
        m_pool.for_each([&](const Molecule &m, std::int64_t count)
                        { weighted += m.complexity * static_cast<double>(count); });
        return weighted / static_cast<double>(total);
    }

    NetworkStatistics ChemicalSystem::get_statistics() const
    {
        NetworkStatistics s;
        s.total_molecules = m_pool.total();
        s.molecule_types = m_pool.type_count();
        s.active_reactions = m_active.size();
        s.catalysts = static_cast<std::size_t>(std::count_if(m_active.begin(), m_active.end(),
                                                             [&](std::size_t i)
                                                             { return m_reactions[i].is_catalyzed(); }));
        s.amphiphilic = amphiphilic_count();
        s.average_complexity = average_complexity();
        s.energy_currency = m_metrics.energy_currency.empty() ? 0.0 : m_metrics.energy_currency.back();
        return s;
    }

    std::size_t ChemicalSystem::detect_autocatalytic_cycles() const
    {
        try
        {
            ReactionGraph active;
            for (std::size_t i : m_active)
                active.add_reaction(m_reactions[i]);
            return active.count_cycles_longer_than(2);
        }
        catch (const std::exception &e)
        {
            spdlog::warn("Autocatalytic cycle detection degraded to 0: {}", e.what());
            return 0;
        }
    }

    double ChemicalSystem::calculate_feedback_coefficient() const
    {
        return feedback_coefficient(m_metrics.entropy_reduction, m_metrics.catalytic_activity);
    }

    double ChemicalSystem::complexity_score() const
    {
        const NetworkStatistics s = get_statistics();
        if (s.total_molecules <= 0)
            return 0.0;

        const double total = static_cast<double>(s.total_molecules);
        const double types = static_cast<double>(s.molecule_types);
        const double diversity = types / std::max(10.0, total / 10.0);
        const double reactionDensity = static_cast<double>(s.active_reactions) / std::max(10.0, types);
        const double catalystRatio = static_cast<double>(s.catalysts) / std::max(1.0, types);
        const double amphiphilicRatio = static_cast<double>(s.amphiphilic) / std::max(10.0, total / 10.0);

        const double score = 0.3 * s.average_complexity +
                             0.2 * diversity +
                             0.2 * reactionDensity +
                             0.2 * catalystRatio +
                             0.1 * amphiphilicRatio;
        return std::clamp(score * 2.0, 0.0, 10.0);
    }

    InformationMetrics ChemicalSystem::information_metrics() const
    {
        InformationMetrics info;
        info.chemical_diversity = m_pool.type_count();
        info.reaction_pathways = m_active.size();
        info.network_connectivity = static_cast<double>(m_active.size()) /
                                    static_cast<double>(std::max<std::size_t>(1, m_pool.type_count()));
        try
        {
            for (const auto &component : m_graph.strongly_connected_components())
                info.largest_reaction_cluster = std::max(info.largest_reaction_cluster, component.size());
        }
        catch (const std::exception &e)
        {
            spdlog::warn("Reaction cluster analysis degraded to 0: {}", e.what());
            info.largest_reaction_cluster = 0;
        }
        return info;
    }

    FinalAnalysis ChemicalSystem::get_final_analysis() const
    {
        FinalAnalysis out;
        out.autocatalytic_cycles = detect_autocatalytic_cycles();
        out.entropy_catalysis_feedback = calculate_feedback_coefficient();
        out.complexity_score = complexity_score();
        out.information = information_metrics();
        return out;
    }

    SystemSummary ChemicalSystem::get_summary() const
    {
        SystemSummary s;
        s.time_step = m_timeStep;
        s.total_molecules = m_pool.total();
        s.species_count = m_pool.type_count();
        s.compartment_count = m_compartments.size();
        s.reaction_count = m_reactions.size();
        s.amphiphilic_count = amphiphilic_count();
        s.avg_complexity = average_complexity();
        s.feedback_coefficient = calculate_feedback_coefficient();
        return s;
    }

    std::map<std::string, std::int64_t> ChemicalSystem::get_molecule_counts() const
    {
        std::map<std::string, std::int64_t> counts;
        m_pool.for_each([&](const Molecule &m, std::int64_t count)
                        { counts.emplace(m.name, count); });
        return counts;
    }

    std::vector<CompartmentSnapshot> ChemicalSystem::get_compartment_data() const
    {
        std::vector<CompartmentSnapshot> out;
        out.reserve(m_compartments.size());
        for (const auto &c : m_compartments)
        {
            out.push_back(CompartmentSnapshot{
                c.position().x,
                c.position().y,
                c.radius(),
                c.stability(),
                c.age(),
                c.interior_total(),
                c.boundary_molecules().size(),
                c.metabolic_activity()});
        }
        return out;
    }

} // namespace primordia::chem
