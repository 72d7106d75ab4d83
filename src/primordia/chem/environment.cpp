// SPDX-License-Identifier: AGPL-3.0-or-later
#include "primordia/chem/environment.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include "primordia/chem/random.hpp"
#include "primordia/chem/reaction.hpp"

namespace primordia::chem
{

    double energy_input_rate(EnergyInput level)
    {
        switch (level)
        {
        case EnergyInput::VeryLow:
            return 0.2;
        case EnergyInput::Low:
            return 0.5;
        case EnergyInput::Medium:
            return 1.0;
        case EnergyInput::High:
            return 2.0;
        case EnergyInput::VeryHigh:
            return 5.0;
        }
        return 1.0;
    }

    bool PrebioticEnvironment::set_environment_type(const std::string &type)
    {
        Parameters p = m_params;
        if (type == "prebiotic_ocean")
        {
            p.temperature_C = 25.0;
            p.ph = 8.0;
            p.uv_intensity = 0.2;
            p.wet_dry_cycle = false;
            p.metal_catalysts = false;
            p.energy_input = EnergyInput::Low;
        }
        else if (type == "hydrothermal_vent")
        {
            p.temperature_C = 90.0;
            p.ph = 5.0;
            p.uv_intensity = 0.0;
            p.wet_dry_cycle = false;
            p.metal_catalysts = true;
            p.energy_input = EnergyInput::High;
        }
        else if (type == "tidal_pool")
        {
            p.temperature_C = 30.0;
            p.ph = 7.5;
            p.uv_intensity = 0.4;
            p.wet_dry_cycle = true;
            p.cycle_period = 15;
            p.metal_catalysts = false;
            p.concentrated = true;
            p.concentration_factor = 2.0;
            p.energy_input = EnergyInput::Medium;
        }
        else if (type == "clay_surfaces")
        {
            p.temperature_C = 40.0;
            p.ph = 6.5;
            p.uv_intensity = 0.3;
            p.wet_dry_cycle = true;
            p.cycle_period = 25;
            p.metal_catalysts = true;
            p.concentrated = true;
            p.concentration_factor = 3.0;
            p.energy_input = EnergyInput::Medium;
        }
        else if (type == "hot_spring")
        {
            p.temperature_C = 70.0;
            p.ph = 9.0;
            p.uv_intensity = 0.5;
            p.wet_dry_cycle = false;
            p.metal_catalysts = true;
            p.energy_input = EnergyInput::High;
        }
        else
        {
            return false;
        }
        m_params = p;
        m_type = type;
        return true;
    }

    void PrebioticEnvironment::set_constraint_level(int level)
    {
        m_constraintLevel = std::clamp(level, 1, 5);
        Parameters &p = m_params;
        switch (m_constraintLevel)
        {
        case 1:
            p.temperature_C = 70.0;
            p.ph = 7.0;
            p.wet_dry_cycle = false;
            p.energy_input = EnergyInput::High;
            p.metal_catalysts = false;
            p.concentrated = false;
            break;
        case 2:
            p.temperature_C = 80.0;
            p.ph = 7.5;
            p.wet_dry_cycle = true;
            p.cycle_period = 25;
            p.energy_input = EnergyInput::Medium;
            p.metal_catalysts = false;
            p.concentrated = false;
            break;
        case 3:
            p.temperature_C = 85.0;
            p.ph = 8.0;
            p.wet_dry_cycle = true;
            p.cycle_period = 20;
            p.energy_input = EnergyInput::Medium;
            p.metal_catalysts = true;
            p.concentrated = false;
            break;
        case 4:
            p.temperature_C = 90.0;
            p.ph = 8.5;
            p.wet_dry_cycle = true;
            p.cycle_period = 15;
            p.energy_input = EnergyInput::Low;
            p.metal_catalysts = true;
            p.concentrated = false;
            break;
        default:
            p.temperature_C = 95.0;
            p.ph = 9.0;
            p.wet_dry_cycle = true;
            p.cycle_period = 10;
            p.energy_input = EnergyInput::VeryLow;
            p.metal_catalysts = true;
            p.concentrated = true;
            p.concentration_factor = 5.0;
            break;
        }
    }

    void PrebioticEnvironment::update(Rng &rng)
    {
        ++m_timeStep;
        if (m_params.wet_dry_cycle && m_params.cycle_period > 0)
        {
            const double fraction = static_cast<double>(m_timeStep % m_params.cycle_period) /
                                    static_cast<double>(m_params.cycle_period);
            m_wetPhase = 0.5 + 0.5 * std::cos(fraction * 2.0 * std::numbers::pi);
        }
        m_params.temperature_C += rng.uniform(-0.5, 0.5);
    }

    double PrebioticEnvironment::affect_reaction(const Reaction &reaction) const
    {
        double multiplier = 1.0;

        // Arrhenius-like: warmer is faster, around an 85 C reference
        const double tempFactor = 1.0 + (m_params.temperature_C - 85.0) / 100.0;
        multiplier *= std::clamp(tempFactor, 0.1, 3.0);

        const double phFactor = 1.0 - std::abs(m_params.ph - reaction.optimal_ph) / 10.0;
        multiplier *= std::clamp(phFactor, 0.1, 1.0);

        if (m_params.wet_dry_cycle)
        {
            const double wet = reaction.prefers_wet ? m_wetPhase : 1.0 - m_wetPhase;
            multiplier *= 0.2 + 0.8 * wet;
        }

        multiplier *= energy_input_rate(m_params.energy_input);

        if (m_params.metal_catalysts && reaction.metal_catalyzed)
            multiplier *= 3.0;

        if (m_params.concentrated)
            multiplier *= m_params.concentration_factor;

        return multiplier;
    }

} // namespace primordia::chem
