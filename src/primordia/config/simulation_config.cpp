// SPDX-License-Identifier: AGPL-3.0-or-later
#include "primordia/config/simulation_config.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

namespace primordia::config
{
    namespace
    {
        json food_to_json(const chem::FoodItem &f)
        {
            return json{
                {"name", f.molecule.name},
                {"complexity", f.molecule.complexity},
                {"amphiphilic", f.molecule.is_amphiphilic},
                {"count", f.count}};
        }

        bool food_from_json(const json &j, chem::FoodItem &out)
        {
            if (!j.is_object())
                return false;
            std::string name = j.value("name", std::string{});
            if (name.empty())
                return false;
            out.molecule = chem::Molecule(std::move(name),
                                          j.value("complexity", 1.0),
                                          j.value("amphiphilic", false));
            out.count = j.value("count", std::int64_t{0});
            return true;
        }

        template <class T>
        T positive_or_default(const json &j, const char *key, T fallback)
        {
            const T v = j.value(key, fallback);
            if (v > T{0})
                return v;
            spdlog::warn("Config '{}' must be positive, keeping {}", key, fallback);
            return fallback;
        }
    }

    void to_json(json &j, const SimulationConfig &c)
    {
        const auto &s = c.system;
        j = json{
            {"width", s.width},
            {"height", s.height},
            {"seed", c.seed},
            {"log_level", c.log_level},
            {"steps", c.steps},
            {"formation_threshold", s.formation_threshold},
            {"formation_probability", s.formation_probability},
            {"boundary_pull", s.boundary_pull},
            {"interior_abundance", s.interior_abundance},
            {"max_events_per_reaction", s.max_events_per_reaction},
            {"pair_name_length_limit", s.pair_name_length_limit},
            {"discovery_interval", s.discovery_interval},
            {"discovery_sample", s.discovery_sample},
            {"discovery_probability", s.discovery_probability},
            {"max_product_name_length", s.max_product_name_length},
            {"use_prebiotic_pathways", c.use_prebiotic_pathways},
            {"food_preset", c.food_preset},
            {"environment_type", c.environment_type}};
        if (c.constraint_level)
            j["constraint_level"] = *c.constraint_level;

        json food = json::array();
        for (const auto &f : c.food)
            food.push_back(food_to_json(f));
        j["food"] = std::move(food);
    }

    void from_json(const json &j, SimulationConfig &c)
    {
        auto &s = c.system;
        s.width = positive_or_default(j, "width", s.width);
        s.height = positive_or_default(j, "height", s.height);
        c.seed = j.value("seed", c.seed);
        c.log_level = j.value("log_level", c.log_level);
        c.steps = j.value("steps", c.steps);

        s.formation_threshold = positive_or_default(j, "formation_threshold", s.formation_threshold);
        s.formation_probability = j.value("formation_probability", s.formation_probability);
        s.boundary_pull = j.value("boundary_pull", s.boundary_pull);
        s.interior_abundance = j.value("interior_abundance", s.interior_abundance);
        s.max_events_per_reaction = j.value("max_events_per_reaction", s.max_events_per_reaction);
        s.pair_name_length_limit = j.value("pair_name_length_limit", s.pair_name_length_limit);
        s.discovery_interval = j.value("discovery_interval", s.discovery_interval);
        s.discovery_sample = j.value("discovery_sample", s.discovery_sample);
        s.discovery_probability = j.value("discovery_probability", s.discovery_probability);
        s.max_product_name_length = j.value("max_product_name_length", s.max_product_name_length);

        c.use_prebiotic_pathways = j.value("use_prebiotic_pathways", c.use_prebiotic_pathways);
        c.food_preset = j.value("food_preset", c.food_preset);
        c.environment_type = j.value("environment_type", c.environment_type);
        if (auto it = j.find("constraint_level"); it != j.end() && !it->is_null())
            c.constraint_level = it->get<int>();
        else
            c.constraint_level.reset();

        c.food.clear();
        if (auto it = j.find("food"); it != j.end() && it->is_array())
        {
            for (const auto &item : *it)
            {
                chem::FoodItem f;
                if (food_from_json(item, f))
                    c.food.push_back(std::move(f));
                else
                    spdlog::warn("Skipping food entry without a name: {}", item.dump());
            }
        }
    }

    std::string default_config_path()
    {
        return std::string(PRIMORDIA_ASSETS_DIR) + "/config/simulation.json";
    }

    SimulationConfig load_simulation_config(const std::string &path)
    {
        SimulationConfig cfg;

        std::ifstream f(path);
        if (!f)
        {
            spdlog::warn("Config file '{}' not found, using defaults", path);
            return cfg;
        }

        try
        {
            json doc;
            f >> doc;
            if (!doc.is_object())
            {
                spdlog::warn("Config file '{}' is not a JSON object, using defaults", path);
                return cfg;
            }
            cfg = doc.get<SimulationConfig>();
        }
        catch (const json::exception &e)
        {
            spdlog::warn("Failed to parse config '{}': {}; using defaults", path, e.what());
            return SimulationConfig{};
        }

        return cfg;
    }

    std::vector<chem::FoodItem> resolve_food(const SimulationConfig &c)
    {
        if (!c.food.empty())
            return c.food;
        if (c.food_preset == "prebiotic")
            return chem::uniform_food(chem::prebiotic_food_set(), chem::kPrebioticSeedCount);
        if (c.food_preset != "initial")
            spdlog::warn("Unknown food preset '{}', using initial", c.food_preset);
        return chem::initial_food_set();
    }

    chem::PrebioticEnvironment make_environment(const SimulationConfig &c)
    {
        chem::PrebioticEnvironment env;
        if (!env.set_environment_type(c.environment_type))
            spdlog::warn("Unknown environment type '{}', keeping {}", c.environment_type, env.type());
        if (c.constraint_level)
            env.set_constraint_level(*c.constraint_level);
        return env;
    }

} // namespace primordia::config
