// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>

#include <cmath>

#include "primordia/chem/reaction.hpp"

using namespace primordia::chem;

namespace
{
    Reaction carbonic()
    {
        return Reaction({Molecule("H2O", 1.0), Molecule("CO2", 1.0)}, {Molecule("H2CO3", 3.0)}, 0.02);
    }
}

TEST(Reaction, EffectiveRateGrowsLogarithmicallyWithCatalysts)
{
    Reaction r = carbonic();
    EXPECT_DOUBLE_EQ(r.effective_rate(), 0.02);

    EXPECT_TRUE(r.add_catalyst(Molecule("H2O")));
    EXPECT_NEAR(r.effective_rate(), 0.02 * (1.0 + 5.0 * std::log(2.0)), 1e-12);

    EXPECT_TRUE(r.add_catalyst(Molecule("CO2")));
    EXPECT_NEAR(r.effective_rate(), 0.02 * (1.0 + 5.0 * std::log(3.0)), 1e-12);
}

TEST(Reaction, CatalystSetIgnoresDuplicates)
{
    Reaction r = carbonic();
    EXPECT_FALSE(r.is_catalyzed());
    EXPECT_TRUE(r.add_catalyst(Molecule("H2O")));
    EXPECT_FALSE(r.add_catalyst(Molecule("H2O", 9.0)));
    EXPECT_EQ(r.catalysts().size(), 1u);
    EXPECT_TRUE(r.has_catalyst("H2O"));
    EXPECT_TRUE(r.is_catalyzed());
}

TEST(Reaction, EntropyReductionIsProductComplexityGain)
{
    Reaction r = carbonic();
    EXPECT_DOUBLE_EQ(r.entropy_reduction(), 1.0);

    r.add_catalyst(Molecule("H2O"));
    EXPECT_DOUBLE_EQ(r.entropy_reduction(), 1.5);

    Reaction breakdown({Molecule("C2H4O2", 4.0)}, {Molecule("CH2O", 2.0), Molecule("CO2", 1.0)}, 0.005);
    EXPECT_DOUBLE_EQ(breakdown.entropy_reduction(), -1.0);
}

TEST(Reaction, ReactantSetCollapsesSelfPairs)
{
    Reaction dimer({Molecule("HCN", 2.0), Molecule("HCN", 2.0)}, {Molecule("C2H2N2", 4.0)});
    EXPECT_EQ(dimer.reactant_set(), (std::set<std::string>{"HCN"}));
    EXPECT_EQ(dimer.to_string(), "HCN + HCN -> C2H2N2");
    EXPECT_EQ(carbonic().to_string(), "H2O + CO2 -> H2CO3");
}

TEST(Reaction, EnvironmentHintsDefault)
{
    Reaction r = carbonic();
    EXPECT_DOUBLE_EQ(r.optimal_ph, 8.0);
    EXPECT_TRUE(r.prefers_wet);
    EXPECT_FALSE(r.metal_catalyzed);
}
