// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>

#include "primordia/chem/chemical_system.hpp"
#include "primordia/chem/food_set.hpp"
#include "scripted_rng.hpp"

using namespace primordia::chem;
using primordia::test::ScriptedRng;

namespace
{
    // Splits every molecule, whatever its name length.
    class SplittingChemistry final : public ChemistryModel
    {
    public:
        Combination combine(const Molecule &a, const Molecule &b) const override
        {
            return Combination{a.name + b.name, false};
        }

        std::vector<Molecule> decompose(const Molecule &m) const override
        {
            return {Molecule(m.name + "a", m.complexity / 2.0), Molecule(m.name + "b", m.complexity / 2.0)};
        }
    };

    ChemicalSystem scripted_system(double value, SystemSettings settings = {})
    {
        return ChemicalSystem(settings, std::make_unique<ScriptedRng>(value));
    }

    bool has_reaction(const ChemicalSystem &sys, const std::string &a, const std::string &b, const std::string &product)
    {
        return std::any_of(sys.reactions().begin(), sys.reactions().end(),
                           [&](const Reaction &r)
                           {
                               return r.reactant_set() == std::set<std::string>{a, b} &&
                                      r.products().size() == 1 && r.products()[0].name == product;
                           });
    }
}

TEST(ChemicalSystem, RejectsEmptyWorld)
{
    SystemSettings s;
    s.width = 0.0;
    EXPECT_THROW(ChemicalSystem{s}, std::invalid_argument);
}

TEST(ChemicalSystem, WaterAndCarbonDioxideMakeCarbonicAcid)
{
    ChemicalSystem sys(SystemSettings{}, std::make_unique<MersenneRng>(42));
    sys.add_molecule(Molecule("H2O", 1.0), 100);
    sys.add_molecule(Molecule("CO2", 1.0), 100);

    sys.generate_initial_reactions();
    ASSERT_EQ(sys.reactions().size(), 3u); // two self-pairs and the cross pair
    EXPECT_TRUE(has_reaction(sys, "H2O", "CO2", "H2CO3"));
    EXPECT_TRUE(sys.has_reaction_between("CO2", "H2O"));
    EXPECT_TRUE(sys.has_reaction_between("H2O", "H2O"));

    sys.identify_catalysts();

    bool formed = false;
    for (int step = 0; step < 40 && !formed; ++step)
    {
        sys.update();
        formed = sys.molecules().count("H2CO3") > 0;
    }
    EXPECT_TRUE(formed);
}

TEST(ChemicalSystem, InitialReactionsSkipLongPairsAndAddDecompositions)
{
    ChemicalSystem sys(SystemSettings{}, std::make_unique<MersenneRng>(1));
    sys.add_molecule(Molecule("C2H4O2", 3.0), 10);
    sys.add_molecule(Molecule("C8H16O2", 10.0, true), 10);

    sys.generate_initial_reactions();
    // Both names exceed four characters, so only decompositions remain.
    ASSERT_EQ(sys.reactions().size(), 2u);
    for (const auto &r : sys.reactions())
    {
        EXPECT_EQ(r.reactants().size(), 1u);
        EXPECT_EQ(r.products().size(), 2u);
        EXPECT_DOUBLE_EQ(r.base_rate(), 0.005);
    }
}

TEST(ChemicalSystem, InitialRateFallsWithComplexity)
{
    ChemicalSystem sys = scripted_system(0.0);
    sys.add_molecule(Molecule("CH4", 1.0), 5);
    sys.add_molecule(Molecule("NH3", 1.5), 5);
    sys.generate_initial_reactions();

    const auto it = std::find_if(sys.reactions().begin(), sys.reactions().end(),
                                 [](const Reaction &r)
                                 { return r.products()[0].name == "CH5ON"; });
    ASSERT_NE(it, sys.reactions().end());
    EXPECT_NEAR(it->base_rate(), 0.01 / (1.0 + 2.5 / 5.0), 1e-12);
    EXPECT_NEAR(it->products()[0].complexity, 2.5, 1e-12);
    // CH5ON is too short for the random amphiphile roll
    EXPECT_FALSE(it->products()[0].is_amphiphilic);
}

TEST(ChemicalSystem, ReactionsConserveStagedMass)
{
    ChemicalSystem sys = scripted_system(0.0);
    sys.add_molecule(Molecule("A", 1.0), 3);
    sys.add_molecule(Molecule("B", 1.0), 5);
    sys.add_reaction(Reaction({Molecule("A", 1.0), Molecule("B", 1.0)}, {Molecule("C", 2.0)}, 0.5));

    sys.update();

    EXPECT_FALSE(sys.molecules().contains("A"));
    EXPECT_EQ(sys.molecules().count("B"), 2);
    EXPECT_EQ(sys.molecules().count("C"), 3);
    ASSERT_EQ(sys.last_reaction_events().size(), 1u);
    EXPECT_EQ(sys.last_reaction_events()[0].events, 3);
}

TEST(ChemicalSystem, EventsAreCappedPerReaction)
{
    ChemicalSystem sys = scripted_system(0.0);
    sys.add_molecule(Molecule("A", 1.0), 500);
    sys.add_molecule(Molecule("B", 1.0), 500);
    sys.add_reaction(Reaction({Molecule("A", 1.0), Molecule("B", 1.0)}, {Molecule("C", 2.0)}, 0.5));

    sys.update();
    EXPECT_EQ(sys.molecules().count("C"), 10);
    EXPECT_EQ(sys.molecules().count("A"), 490);
}

TEST(ChemicalSystem, SharedReactantNeverGoesNegative)
{
    ChemicalSystem sys = scripted_system(0.0);
    sys.add_molecule(Molecule("A", 1.0), 2);
    sys.add_molecule(Molecule("B", 1.0), 5);
    sys.add_molecule(Molecule("D", 1.0), 5);
    sys.add_reaction(Reaction({Molecule("A", 1.0), Molecule("B", 1.0)}, {Molecule("C", 2.0)}, 0.5));
    sys.add_reaction(Reaction({Molecule("A", 1.0), Molecule("D", 1.0)}, {Molecule("E", 2.0)}, 0.5));

    sys.update();

    EXPECT_FALSE(sys.molecules().contains("A"));
    EXPECT_EQ(sys.molecules().count("C"), 2);
    EXPECT_EQ(sys.molecules().count("E"), 2);
    for (const auto &[name, count] : sys.get_molecule_counts())
        EXPECT_GT(count, 0) << name;
}

TEST(ChemicalSystem, NoEventsWhenDrawsMiss)
{
    ChemicalSystem sys = scripted_system(0.99);
    sys.add_molecule(Molecule("A", 1.0), 5);
    sys.add_molecule(Molecule("B", 1.0), 5);
    sys.add_reaction(Reaction({Molecule("A", 1.0), Molecule("B", 1.0)}, {Molecule("C", 2.0)}, 0.5));

    sys.update();
    EXPECT_TRUE(sys.last_reaction_events().empty());
    EXPECT_EQ(sys.molecules().count("A"), 5);
    EXPECT_EQ(sys.active_reactions().size(), 1u);
}

TEST(ChemicalSystem, AmphiphilesAssembleIntoACompartment)
{
    ChemicalSystem sys = scripted_system(0.0);
    sys.add_molecule(Molecule("LIPID", 10.0, true), 25);

    sys.update();

    ASSERT_EQ(sys.compartments().size(), 1u);
    const Compartment &c = sys.compartments()[0];
    EXPECT_EQ(c.boundary_molecules().size(), 10u);
    EXPECT_EQ(c.molecules().at("LIPID"), 1);
    EXPECT_EQ(sys.molecules().count("LIPID"), 14);
    EXPECT_EQ(sys.amphiphilic_count(), 14);

    const auto data = sys.get_compartment_data();
    ASSERT_EQ(data.size(), 1u);
    EXPECT_EQ(data[0].boundary_size, 10u);
    EXPECT_EQ(data[0].molecule_count, 1);
    EXPECT_DOUBLE_EQ(data[0].radius, Compartment::kDefaultRadius);
}

TEST(ChemicalSystem, TooFewAmphiphilesFormNothing)
{
    ChemicalSystem sys = scripted_system(0.0);
    sys.add_molecule(Molecule("LIPID", 10.0, true), 19);
    sys.add_molecule(Molecule("H2O", 1.0), 500);
    sys.update();
    EXPECT_TRUE(sys.compartments().empty());
    EXPECT_EQ(sys.molecules().count("LIPID"), 19);
}

TEST(ChemicalSystem, BareCompartmentDissolves)
{
    ChemicalSystem sys(SystemSettings{}, std::make_unique<MersenneRng>(3));
    sys.add_compartment(Compartment({0.5, 0.5}));

    double previous = Compartment::kInitialStability;
    bool dissolved = false;
    for (int step = 0; step < 20 && !dissolved; ++step)
    {
        sys.update();
        if (sys.compartments().empty())
        {
            EXPECT_LE(previous - Compartment::kUnboundDecay, Compartment::kDissolutionStability + 1e-9);
            dissolved = true;
            break;
        }
        const double s = sys.compartments()[0].stability();
        EXPECT_NEAR(s, previous - Compartment::kUnboundDecay, 1e-9);
        EXPECT_GT(s, Compartment::kDissolutionStability);
        previous = s;
    }
    EXPECT_TRUE(dissolved);
    EXPECT_LE(sys.time_step(), 9);
}

TEST(ChemicalSystem, MatureCompartmentDivides)
{
    ChemicalSystem sys(SystemSettings{}, std::make_unique<MersenneRng>(5));
    Compartment c({0.5, 0.5}, 0.2);
    for (int i = 0; i < 150; ++i)
        c.add_to_boundary(Molecule("C8H16O2", 10.0, true));
    c.add_molecule("H2O", 100);
    c.set_age(10);
    sys.add_compartment(std::move(c));

    sys.update();

    ASSERT_EQ(sys.compartments().size(), 2u);
    std::int64_t interior = 0;
    std::size_t membrane = 0;
    for (const auto &d : sys.compartments())
    {
        interior += d.interior_total();
        membrane += d.boundary_molecules().size();
        EXPECT_EQ(d.age(), 0);
    }
    EXPECT_EQ(interior, 100);
    EXPECT_EQ(membrane, 150u);
}

TEST(ChemicalSystem, CatalystSetsOnlyGrow)
{
    ChemicalSystem sys(SystemSettings{}, std::make_unique<MersenneRng>(8));
    for (const auto &item : initial_food_set())
        sys.add_molecule(item.molecule, item.count);
    sys.generate_initial_reactions();
    sys.identify_catalysts();

    std::vector<std::size_t> sizes;
    for (int step = 0; step < 30; ++step)
    {
        sys.update();
        for (std::size_t i = 0; i < sys.reactions().size(); ++i)
        {
            const std::size_t n = sys.reactions()[i].catalysts().size();
            if (i < sizes.size())
                EXPECT_GE(n, sizes[i]);
            else
                sizes.push_back(n);
            sizes[i] = n;
        }
        for (const auto &[name, count] : sys.get_molecule_counts())
            EXPECT_GT(count, 0) << name;
    }
    EXPECT_EQ(sys.metrics().size(), 30u);
    EXPECT_EQ(sys.metrics().catalytic_ratio.size(), 30u);
}

TEST(ChemicalSystem, PrebioticPathwaysNeedTheirReactants)
{
    ChemicalSystem sys(SystemSettings{}, std::make_unique<MersenneRng>(1));
    for (const auto &item : initial_food_set())
        sys.add_molecule(item.molecule, item.count);
    const std::size_t types = sys.molecules().type_count();

    sys.add_prebiotic_pathways();

    // Formose, HCN dimerization and CH4 + CO2; the rest need intermediates.
    ASSERT_EQ(sys.reactions().size(), 3u);
    EXPECT_TRUE(has_reaction(sys, "CH2O", "CH2O", "C2H4O2"));
    EXPECT_TRUE(has_reaction(sys, "HCN", "HCN", "C2H2N2"));
    EXPECT_TRUE(has_reaction(sys, "CH4", "CO2", "C2H4O2"));
    EXPECT_EQ(sys.molecules().type_count(), types);
}

TEST(ChemicalSystem, DiscoveryAddsEachPairOnce)
{
    ChemicalSystem sys = scripted_system(0.0);
    sys.add_molecule(Molecule("CH4", 1.0), 10);
    sys.add_molecule(Molecule("NH3", 1.0), 10);

    sys.discover_new_reactions();
    ASSERT_EQ(sys.reactions().size(), 1u);
    const Reaction &r = sys.reactions()[0];
    EXPECT_EQ(r.products()[0].name, "CH5ON");
    EXPECT_NEAR(r.base_rate(), 0.005 / 1.2, 1e-12);
    EXPECT_FALSE(r.products()[0].is_amphiphilic);

    sys.discover_new_reactions();
    EXPECT_EQ(sys.reactions().size(), 1u);
}

TEST(ChemicalSystem, DiscoverySkipsLongProducts)
{
    ChemicalSystem sys = scripted_system(0.0);
    sys.add_molecule(Molecule("CCCCCCCC", 4.0), 10);
    sys.add_molecule(Molecule("NNNNNNNN", 4.0), 10);
    sys.discover_new_reactions();
    EXPECT_TRUE(sys.reactions().empty());
}

TEST(ChemicalSystem, DiscoveryRunsOnSchedule)
{
    SystemSettings settings;
    settings.discovery_interval = 2;
    ChemicalSystem sys = scripted_system(0.0, settings);
    sys.add_molecule(Molecule("CH4", 1.0), 10);
    sys.add_molecule(Molecule("NH3", 1.0), 10);

    sys.update();
    EXPECT_TRUE(sys.reactions().empty());
    sys.update();
    EXPECT_EQ(sys.reactions().size(), 1u);
}

TEST(ChemicalSystem, AutocatalyticCyclesNeedThreeMembers)
{
    ChemicalSystem sys = scripted_system(0.99);
    for (const char *name : {"A", "B", "C", "D"})
        sys.add_molecule(Molecule(name, 1.0), 5);
    sys.add_reaction(Reaction({Molecule("A")}, {Molecule("B")}));
    sys.add_reaction(Reaction({Molecule("B")}, {Molecule("C")}));
    sys.add_reaction(Reaction({Molecule("C")}, {Molecule("A")}));
    sys.add_reaction(Reaction({Molecule("C")}, {Molecule("D")}));
    sys.add_reaction(Reaction({Molecule("D")}, {Molecule("C")}));

    EXPECT_EQ(sys.detect_autocatalytic_cycles(), 0u); // nothing active yet
    sys.update();
    EXPECT_EQ(sys.active_reactions().size(), 5u);
    EXPECT_EQ(sys.detect_autocatalytic_cycles(), 1u);

    const auto info = sys.information_metrics();
    EXPECT_EQ(info.largest_reaction_cluster, 4u);
    EXPECT_EQ(info.reaction_pathways, 5u);
    EXPECT_DOUBLE_EQ(info.network_connectivity, 5.0 / 4.0);
}

TEST(ChemicalSystem, EmptySystemReportsNeutralValues)
{
    ChemicalSystem sys;
    sys.update();

    const auto stats = sys.get_statistics();
    EXPECT_EQ(stats.total_molecules, 0);
    EXPECT_EQ(stats.molecule_types, 0u);
    EXPECT_DOUBLE_EQ(stats.average_complexity, 0.0);
    EXPECT_DOUBLE_EQ(sys.complexity_score(), 0.0);
    EXPECT_DOUBLE_EQ(sys.calculate_feedback_coefficient(), 0.0);
    EXPECT_EQ(sys.detect_autocatalytic_cycles(), 0u);

    const auto info = sys.information_metrics();
    EXPECT_DOUBLE_EQ(info.network_connectivity, 0.0);
    EXPECT_EQ(info.largest_reaction_cluster, 0u);

    ASSERT_EQ(sys.metrics().size(), 1u);
    EXPECT_DOUBLE_EQ(sys.metrics().entropy_ratio[0], 1.0);
    EXPECT_DOUBLE_EQ(sys.metrics().catalytic_ratio[0], 0.0);

    const auto summary = sys.get_summary();
    EXPECT_EQ(summary.time_step, 1);
    EXPECT_EQ(summary.species_count, 0u);
}

TEST(ChemicalSystem, ComplexityScoreIsBounded)
{
    ChemicalSystem sys(SystemSettings{}, std::make_unique<MersenneRng>(77));
    sys.add_molecule(Molecule("BIG", 100.0), 10);
    EXPECT_DOUBLE_EQ(sys.complexity_score(), 10.0);

    ChemicalSystem small(SystemSettings{}, std::make_unique<MersenneRng>(77));
    small.add_molecule(Molecule("H2O", 1.0), 10);
    // 0.3 * 1 + 0.2 * 1/10, doubled
    EXPECT_NEAR(small.complexity_score(), 0.64, 1e-12);
}

TEST(ChemicalSystem, MetricsTrackEnergyCurrency)
{
    ChemicalSystem sys = scripted_system(0.99);
    sys.add_molecule(Molecule("C10H18O8P", 15.0, true), 5);
    sys.add_molecule(Molecule("CH4", 1.0), 7);
    sys.add_molecule(Molecule("BIGX", 11.0), 2);

    sys.update();
    ASSERT_EQ(sys.metrics().size(), 1u);
    EXPECT_DOUBLE_EQ(sys.metrics().energy_currency[0], 7.0);
    EXPECT_DOUBLE_EQ(sys.metrics().molecule_counts[0], 3.0);
    EXPECT_DOUBLE_EQ(sys.get_statistics().energy_currency, 7.0);
}

TEST(ChemicalSystem, InjectedChemistryDecidesDecomposition)
{
    ChemicalSystem sys(SystemSettings{}, std::make_unique<MersenneRng>(4), std::make_unique<SplittingChemistry>());
    sys.add_molecule(Molecule("H2O", 1.0), 10);

    sys.generate_initial_reactions();

    // One self-pair condensation plus a decomposition of the short name.
    ASSERT_EQ(sys.reactions().size(), 2u);
    const Reaction &breakdown = sys.reactions()[1];
    ASSERT_EQ(breakdown.reactants().size(), 1u);
    EXPECT_EQ(breakdown.reactants()[0].name, "H2O");
    ASSERT_EQ(breakdown.products().size(), 2u);
    EXPECT_EQ(breakdown.products()[0].name, "H2Oa");
    EXPECT_EQ(sys.reactions()[0].products()[0].name, "H2OH2O");
}

TEST(ChemicalSystem, DefaultChemistryLeavesShortNamesWhole)
{
    ChemicalSystem sys(SystemSettings{}, std::make_unique<MersenneRng>(4));
    sys.add_molecule(Molecule("CH2O", 2.0), 10);
    sys.generate_initial_reactions();
    ASSERT_EQ(sys.reactions().size(), 1u);
    EXPECT_EQ(sys.reactions()[0].reactants().size(), 2u);
}
