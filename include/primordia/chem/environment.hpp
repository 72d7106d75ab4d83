// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <optional>
#include <string>

namespace primordia::chem
{
    class Reaction;
    class Rng;

    // Conditions the chemistry runs under. The engine only reads from it.
    class Environment
    {
    public:
        virtual ~Environment() = default;

        // Multiplier on a reaction's per-event probability.
        virtual double affect_reaction(const Reaction &) const { return 1.0; }

        // Wet/dry phase in [0,1] (0 = dry); unset when the environment has no cycle.
        virtual std::optional<double> wet_phase() const { return std::nullopt; }

        // Temperature in Celsius; unset when the environment does not model it.
        virtual std::optional<double> temperature() const { return std::nullopt; }
    };

    class NeutralEnvironment final : public Environment
    {
    };

    enum class EnergyInput : int
    {
        VeryLow = 0,
        Low,
        Medium,
        High,
        VeryHigh
    };

    double energy_input_rate(EnergyInput level);

    // Reference environment: temperature drift, pH optimum, cosine wet/dry cycle,
    // energy input, mineral (metal) catalysis and concentration.
    class PrebioticEnvironment final : public Environment
    {
    public:
        struct Parameters
        {
            double temperature_C{85.0};
            double ph{8.0};
            double uv_intensity{0.2};
            bool wet_dry_cycle{true};
            int cycle_period{20}; // steps per full wet/dry cycle
            bool metal_catalysts{false};
            EnergyInput energy_input{EnergyInput::Medium};
            bool concentrated{false};
            double concentration_factor{1.0};
        };

        PrebioticEnvironment() = default;
        explicit PrebioticEnvironment(const Parameters &p) : m_params(p) {}

        // prebiotic_ocean, hydrothermal_vent, tidal_pool, clay_surfaces, hot_spring.
        // Returns false (and leaves the parameters untouched) for unknown names.
        bool set_environment_type(const std::string &type);

        // 1 (loose) .. 5 (most constrained); out-of-range levels are clamped.
        void set_constraint_level(int level);

        // Advance the wet/dry cycle and jitter the temperature by U(-0.5, 0.5).
        void update(Rng &rng);

        double affect_reaction(const Reaction &reaction) const override;
        // Stays at its last value (1.0 initially) while the cycle is disabled.
        std::optional<double> wet_phase() const override { return m_wetPhase; }
        std::optional<double> temperature() const override { return m_params.temperature_C; }

        const Parameters &parameters() const { return m_params; }
        const std::string &type() const { return m_type; }
        int constraint_level() const { return m_constraintLevel; }
        long time_step() const { return m_timeStep; }

    private:
        Parameters m_params{};
        std::string m_type{"prebiotic_ocean"};
        int m_constraintLevel{3};
        double m_wetPhase{1.0};
        long m_timeStep{0};
    };

} // namespace primordia::chem
