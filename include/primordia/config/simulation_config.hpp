// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "primordia/chem/chemical_system.hpp"
#include "primordia/chem/environment.hpp"
#include "primordia/chem/food_set.hpp"

namespace primordia::config
{
    using json = nlohmann::json;

// Define a default assets root if the build didn't provide one
#ifndef PRIMORDIA_ASSETS_DIR
#define PRIMORDIA_ASSETS_DIR "assets"
#endif

    struct SimulationConfig
    {
        chem::SystemSettings system{};
        std::uint64_t seed{1234567ULL};
        std::string log_level{"info"};
        long steps{200};

        // Used only when `food` is empty: "initial" or "prebiotic".
        std::string food_preset{"initial"};
        std::vector<chem::FoodItem> food;
        bool use_prebiotic_pathways{true};

        std::string environment_type{"prebiotic_ocean"};
        // Applied after the environment preset, overriding it, only when set.
        std::optional<int> constraint_level;
    };

    void to_json(json &j, const SimulationConfig &c);
    // Missing keys keep their defaults. Values the engine would reject
    // (non-positive bounds or formation threshold) are warned about and
    // left at their defaults.
    void from_json(const json &j, SimulationConfig &c);

    std::string default_config_path();

    // Missing file or malformed JSON: warn and return defaults.
    SimulationConfig load_simulation_config(const std::string &path);

    // Food items from the config, or the named preset when none are listed:
    // initial_food_set(), or prebiotic_food_set() at kPrebioticSeedCount each.
    std::vector<chem::FoodItem> resolve_food(const SimulationConfig &c);

    // Environment preset, then the constraint level when one is configured.
    chem::PrebioticEnvironment make_environment(const SimulationConfig &c);

} // namespace primordia::config
