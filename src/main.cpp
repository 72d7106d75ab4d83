// SPDX-License-Identifier: AGPL-3.0-or-later
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "primordia/chem/chemical_system.hpp"
#include "primordia/chem/random.hpp"
#include "primordia/config/simulation_config.hpp"

int main(int argc, char **argv)
{
    using namespace primordia;
    using json = nlohmann::json;

    const std::string path = argc > 1 ? argv[1] : config::default_config_path();
    const config::SimulationConfig cfg = config::load_simulation_config(path);

    auto level = spdlog::level::from_str(cfg.log_level);
    if (level == spdlog::level::off && cfg.log_level != "off")
    {
        spdlog::warn("Unknown log level '{}', using info", cfg.log_level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
    spdlog::info("Loaded configuration from {} (seed {}, {} steps)", path, cfg.seed, cfg.steps);

    std::unique_ptr<chem::ChemicalSystem> owned;
    try
    {
        owned = std::make_unique<chem::ChemicalSystem>(cfg.system, std::make_unique<chem::MersenneRng>(cfg.seed));
    }
    catch (const std::invalid_argument &e)
    {
        spdlog::error("Invalid simulation settings: {}", e.what());
        return 1;
    }
    chem::ChemicalSystem &system = *owned;

    for (const auto &item : config::resolve_food(cfg))
        system.add_molecule(item.molecule, item.count);

    system.generate_initial_reactions();
    if (cfg.use_prebiotic_pathways)
        system.add_prebiotic_pathways();
    system.identify_catalysts();

    chem::PrebioticEnvironment env = config::make_environment(cfg);

    spdlog::info("Starting run: {} molecule types, {} reactions, environment {}",
                 system.molecules().type_count(), system.reactions().size(), env.type());

    for (long step = 0; step < cfg.steps; ++step)
    {
        env.update(system.rng());
        system.update(env);

        if ((step + 1) % 50 == 0)
        {
            const auto s = system.get_statistics();
            spdlog::info("Step {}: {} molecules / {} types, {} active reactions, {} compartments",
                         system.time_step(), s.total_molecules, s.molecule_types, s.active_reactions,
                         system.compartments().size());
        }
    }

    json out;
    out["summary"] = system.get_summary();
    out["statistics"] = system.get_statistics();
    out["final_analysis"] = system.get_final_analysis();
    out["compartments"] = system.get_compartment_data();
    std::cout << out.dump(2) << "\n";

    spdlog::info("Run finished after {} steps", system.time_step());
    return 0;
}
