// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>

#include <cmath>

#include "primordia/chem/environment.hpp"
#include "primordia/chem/reaction.hpp"
#include "scripted_rng.hpp"

using namespace primordia::chem;
using primordia::test::ScriptedRng;

namespace
{
    Reaction sample_reaction()
    {
        return Reaction({Molecule("CH2O", 2.0), Molecule("CH2O", 2.0)}, {Molecule("C2H4O2", 4.0)}, 0.005);
    }
}

TEST(NeutralEnvironment, LeavesEverythingAlone)
{
    NeutralEnvironment env;
    EXPECT_DOUBLE_EQ(env.affect_reaction(sample_reaction()), 1.0);
    EXPECT_FALSE(env.wet_phase().has_value());
    EXPECT_FALSE(env.temperature().has_value());
}

TEST(PrebioticEnvironment, DefaultsAreNeutralForDefaultReactions)
{
    PrebioticEnvironment env;
    ASSERT_TRUE(env.wet_phase().has_value());
    EXPECT_DOUBLE_EQ(*env.wet_phase(), 1.0);
    EXPECT_DOUBLE_EQ(*env.temperature(), 85.0);
    EXPECT_DOUBLE_EQ(env.affect_reaction(sample_reaction()), 1.0);
}

TEST(PrebioticEnvironment, EnvironmentPresets)
{
    PrebioticEnvironment env;
    EXPECT_FALSE(env.set_environment_type("lava_lake"));
    EXPECT_EQ(env.type(), "prebiotic_ocean");
    EXPECT_DOUBLE_EQ(env.parameters().temperature_C, 85.0);

    EXPECT_TRUE(env.set_environment_type("hydrothermal_vent"));
    EXPECT_EQ(env.type(), "hydrothermal_vent");
    EXPECT_DOUBLE_EQ(env.parameters().temperature_C, 90.0);
    EXPECT_TRUE(env.parameters().metal_catalysts);
    EXPECT_EQ(env.parameters().energy_input, EnergyInput::High);
}

TEST(PrebioticEnvironment, ConstraintLevelIsClamped)
{
    PrebioticEnvironment env;
    env.set_constraint_level(9);
    EXPECT_EQ(env.constraint_level(), 5);
    EXPECT_TRUE(env.parameters().concentrated);

    env.set_constraint_level(-2);
    EXPECT_EQ(env.constraint_level(), 1);
    EXPECT_FALSE(env.parameters().wet_dry_cycle);
}

TEST(PrebioticEnvironment, WetPhaseFollowsCosineCycle)
{
    ScriptedRng rng(0.5); // no temperature jitter
    PrebioticEnvironment env;

    env.update(rng);
    EXPECT_NEAR(*env.wet_phase(), 0.5 + 0.5 * std::cos(0.1 * 3.14159265358979323846), 1e-12);

    for (int i = 0; i < 9; ++i)
        env.update(rng);
    EXPECT_EQ(env.time_step(), 10);
    EXPECT_NEAR(*env.wet_phase(), 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(*env.temperature(), 85.0);
}

TEST(PrebioticEnvironment, TemperatureJitters)
{
    ScriptedRng rng(1.0);
    PrebioticEnvironment env;
    env.update(rng);
    EXPECT_DOUBLE_EQ(*env.temperature(), 85.5);
}

TEST(PrebioticEnvironment, MetalCatalysisTriplesMarkedReactions)
{
    PrebioticEnvironment env;
    env.set_constraint_level(3);

    Reaction r = sample_reaction();
    EXPECT_DOUBLE_EQ(env.affect_reaction(r), 1.0);
    r.metal_catalyzed = true;
    EXPECT_DOUBLE_EQ(env.affect_reaction(r), 3.0);
}

TEST(PrebioticEnvironment, EnergyInputScalesRates)
{
    EXPECT_DOUBLE_EQ(energy_input_rate(EnergyInput::VeryLow), 0.2);
    EXPECT_DOUBLE_EQ(energy_input_rate(EnergyInput::VeryHigh), 5.0);

    PrebioticEnvironment::Parameters p;
    p.energy_input = EnergyInput::High;
    PrebioticEnvironment env(p);
    EXPECT_DOUBLE_EQ(env.affect_reaction(sample_reaction()), 2.0);
}
