// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "primordia/chem/chemistry_model.hpp"
#include "primordia/chem/compartment.hpp"
#include "primordia/chem/environment.hpp"
#include "primordia/chem/molecule_pool.hpp"
#include "primordia/chem/random.hpp"
#include "primordia/chem/reaction.hpp"
#include "primordia/chem/reaction_graph.hpp"
#include "primordia/chem/statistics.hpp"

namespace primordia::chem
{

    struct SystemSettings
    {
        double width{1.0};
        double height{1.0};

        // Spontaneous compartment formation
        std::int64_t formation_threshold{20};     // free amphiphiles needed
        double formation_probability{0.01};       // scaled by count / threshold
        std::int64_t boundary_pull{10};           // amphiphiles moved into a new membrane
        std::int64_t interior_abundance{10};      // types above this seed the interior

        // Reaction execution
        std::int64_t max_events_per_reaction{10};

        // Initial generation and discovery
        std::size_t pair_name_length_limit{4};    // skip pairs where both names are longer
        long discovery_interval{10};              // steps; 0 disables discovery
        std::size_t discovery_sample{5};
        double discovery_probability{0.3};
        std::size_t max_product_name_length{15};
    };

    struct ReactionEvent
    {
        std::size_t reaction{0}; // index into reactions()
        std::int64_t events{0};
    };

    // Orchestrates the molecule pool, the reaction catalog and its graph, and
    // the compartment population. Single-threaded: one update() is one step and
    // must be treated as a critical section by multi-threaded hosts.
    class ChemicalSystem
    {
    public:
        explicit ChemicalSystem(SystemSettings settings = {},
                                std::unique_ptr<Rng> rng = nullptr,
                                std::unique_ptr<ChemistryModel> chemistry = nullptr);

        // Molecules new to the pool get a random position and drift velocity.
        void add_molecule(const Molecule &molecule, std::int64_t count = 1);
        // Returns the index of the new reaction.
        std::size_t add_reaction(Reaction reaction);
        void add_compartment(Compartment compartment);

        // Condensation for every unordered pair (self-pairs included) plus a
        // slow decomposition for every molecule that fragments into two or more.
        void generate_initial_reactions();

        // Curated formose, HCN and fatty-acid pathways whose reactants are present.
        void add_prebiotic_pathways();

        void identify_catalysts();

        // Advance one step under a neutral environment.
        void update();
        void update(const Environment &env);

        // Sample a few current types and maybe add condensations for uncovered pairs.
        void discover_new_reactions();

        bool has_reaction_between(const std::string &a, const std::string &b) const;
        bool is_active(const Reaction &reaction) const;

        NetworkStatistics get_statistics() const;
        FinalAnalysis get_final_analysis() const;
        double calculate_feedback_coefficient() const;
        std::size_t detect_autocatalytic_cycles() const;
        double complexity_score() const;
        InformationMetrics information_metrics() const;
        SystemSummary get_summary() const;
        std::map<std::string, std::int64_t> get_molecule_counts() const;
        std::vector<CompartmentSnapshot> get_compartment_data() const;

        const SystemSettings &settings() const { return m_settings; }
        const MoleculePool &molecules() const { return m_pool; }
        const std::vector<Reaction> &reactions() const { return m_reactions; }
        const std::vector<std::size_t> &active_reactions() const { return m_active; }
        const std::vector<ReactionEvent> &last_reaction_events() const { return m_lastEvents; }
        const std::vector<Compartment> &compartments() const { return m_compartments; }
        const ReactionGraph &reaction_graph() const { return m_graph; }
        const Metrics &metrics() const { return m_metrics; }
        long time_step() const { return m_timeStep; }
        Rng &rng() { return *m_rng; }

        std::int64_t amphiphilic_count() const;
        double average_complexity() const;

    private:
        void move_molecules();
        void refresh_active_reactions();
        void execute_reactions(const Environment &env);
        void update_compartments(const Environment &env);
        void check_compartment_formation();
        void record_metrics();
        void deposit(const Molecule &molecule, std::int64_t count);

        SystemSettings m_settings;
        std::unique_ptr<Rng> m_rng;
        std::unique_ptr<ChemistryModel> m_chemistry;

        MoleculePool m_pool;
        std::vector<Reaction> m_reactions;
        std::vector<std::size_t> m_active;
        std::vector<ReactionEvent> m_lastEvents;
        ReactionGraph m_graph;
        std::vector<Compartment> m_compartments;
        Metrics m_metrics;
        long m_timeStep{0};
    };

} // namespace primordia::chem
