// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

namespace primordia::chem
{

    // Parallel per-step time series; every update() appends one value to each.
    struct Metrics
    {
        std::vector<double> molecule_counts;    // distinct types
        std::vector<double> reaction_counts;    // active reactions
        std::vector<double> complexity;         // count-weighted mean complexity
        std::vector<double> energy_currency;    // phosphate-bearing or complexity > 10
        std::vector<double> entropy_reduction;  // summed over active reactions
        std::vector<double> catalytic_activity; // catalyzed share of active reactions
        std::vector<double> compartment_count;
        std::vector<double> avg_stability;
        std::vector<double> entropy_ratio;   // first mean complexity / current
        std::vector<double> catalytic_ratio; // share of types that catalyze something

        std::size_t size() const { return complexity.size(); }
    };

    struct NetworkStatistics
    {
        std::int64_t total_molecules{0};
        std::size_t molecule_types{0};
        std::size_t active_reactions{0};
        std::size_t catalysts{0}; // catalyzed active reactions
        std::int64_t amphiphilic{0};
        double average_complexity{0.0};
        double energy_currency{0.0};
    };

    struct InformationMetrics
    {
        std::size_t chemical_diversity{0};
        std::size_t reaction_pathways{0};
        double network_connectivity{0.0};
        std::size_t largest_reaction_cluster{0}; // largest strongly connected component
    };

    struct FinalAnalysis
    {
        std::size_t autocatalytic_cycles{0};
        double entropy_catalysis_feedback{0.0};
        double complexity_score{0.0}; // 0..10
        InformationMetrics information{};
    };

    struct CompartmentSnapshot
    {
        double x{0.0};
        double y{0.0};
        double radius{0.0};
        double stability{0.0};
        int age{0};
        std::int64_t molecule_count{0};
        std::size_t boundary_size{0};
        double metabolic_activity{0.0};
    };

    struct SystemSummary
    {
        long time_step{0};
        std::int64_t total_molecules{0};
        std::size_t species_count{0};
        std::size_t compartment_count{0};
        std::size_t reaction_count{0};
        std::int64_t amphiphilic_count{0};
        double avg_complexity{0.0};
        double feedback_coefficient{0.0};
    };

    // Lag-1 Pearson correlation of entropy reduction against catalytic activity
    // over a recent window. Returns 0 with fewer than 10 samples, near-zero
    // variance or a non-finite result; otherwise clamped to [-1, 1].
    double feedback_coefficient(const std::vector<double> &entropyReduction,
                                const std::vector<double> &catalyticActivity);

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Metrics, molecule_counts, reaction_counts, complexity, energy_currency,
                                       entropy_reduction, catalytic_activity, compartment_count, avg_stability,
                                       entropy_ratio, catalytic_ratio)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(NetworkStatistics, total_molecules, molecule_types, active_reactions,
                                       catalysts, amphiphilic, average_complexity, energy_currency)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(InformationMetrics, chemical_diversity, reaction_pathways,
                                       network_connectivity, largest_reaction_cluster)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FinalAnalysis, autocatalytic_cycles, entropy_catalysis_feedback,
                                       complexity_score, information)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CompartmentSnapshot, x, y, radius, stability, age, molecule_count,
                                       boundary_size, metabolic_activity)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SystemSummary, time_step, total_molecules, species_count,
                                       compartment_count, reaction_count, amphiphilic_count, avg_complexity,
                                       feedback_coefficient)

} // namespace primordia::chem
