#pragma once

/**
 * @file Simulator.hpp
 * @brief Reference host for the floating sphere simulation
 *
 * The Simulator is NOT templated - it runs the double-precision components.
 * It owns the SimulationState for its whole lifetime and hands it to
 * components::Update once per tick.
 */

#include <archimedes/core/ErrorLogging.hpp>
#include <archimedes/io/Console.hpp>
#include <archimedes/io/LogService.hpp>
#include <archimedes/sim/SimulatorConfig.hpp>

#include <dynamics/FloatingSphere.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace archimedes {

/**
 * @brief Host that owns the simulation state and drives ticks
 *
 * Provides a small external interface:
 * - FromConfig() - Initialize from YAML
 * - Step() / Run() - Advance simulation
 * - GetState() / SetState() - Snapshot and restore
 * - ~Simulator() - Cleanup (RAII, detaches its log sinks)
 */
class Simulator {
  public:
    using State = components::SimulationState<double>;
    using Diagnostics = components::StepDiagnostics<double>;
    using DiagnosticSink = components::DiagnosticSink<double>;

    /// Log context attached to per-tick diagnostics
    static constexpr const char *kEntity = "sphere";
    static constexpr const char *kComponent = "buoyancy";

    // =========================================================================
    // CONSTRUCTION
    // =========================================================================

    /**
     * @brief Create simulator from configuration file
     *
     * @param config_path Path to simulation YAML configuration
     * @throws IOError, ConfigError
     */
    [[nodiscard]] static std::unique_ptr<Simulator> FromConfig(const std::string &config_path);

    /**
     * @brief Create simulator from configuration struct
     */
    [[nodiscard]] static std::unique_ptr<Simulator> FromConfig(const SimulatorConfig &config);

    /// Default scenario
    Simulator();

    /**
     * @throws ConfigError if the config does not validate
     * @throws IOError if file logging is enabled and the log cannot be opened
     */
    explicit Simulator(SimulatorConfig config);

    ~Simulator();

    // Non-copyable, non-movable (log sinks hold a reference to console_)
    Simulator(const Simulator &) = delete;
    Simulator &operator=(const Simulator &) = delete;
    Simulator(Simulator &&) = delete;
    Simulator &operator=(Simulator &&) = delete;

    // =========================================================================
    // EXECUTION
    // =========================================================================

    /**
     * @brief Execute one tick
     *
     * @param dt Elapsed time [s]
     * @throws IntegrationError if dt is not finite or negative (state untouched)
     */
    void Step(double dt);
    void Step(); // Uses config dt

    /**
     * @brief Step with the configured dt until EndTime()
     * @return Number of ticks executed
     */
    std::size_t Run();

    // =========================================================================
    // QUERY INTERFACE
    // =========================================================================

    [[nodiscard]] const std::string &Name() const { return config_.name; }
    [[nodiscard]] double Dt() const { return config_.dt; }
    [[nodiscard]] double EndTime() const { return config_.t_end; }
    [[nodiscard]] double Time() const { return time_; }
    [[nodiscard]] std::size_t StepCount() const { return step_count_; }
    [[nodiscard]] const SimulatorConfig &GetConfig() const { return config_; }

    /// Sphere height after the most recent tick (initial height before any)
    [[nodiscard]] double Height() const { return state_.sphere.Height(); }
    [[nodiscard]] double Velocity() const { return state_.sphere.Velocity(); }

    /// Intermediate quantities of the most recent tick
    [[nodiscard]] const std::optional<Diagnostics> &LastDiagnostics() const {
        return last_diagnostics_;
    }

    /// Analytic floating height for the current state (nullopt if it sinks)
    [[nodiscard]] std::optional<double> EquilibriumHeight() const {
        return components::EquilibriumHeight(state_);
    }

    // =========================================================================
    // CONTROL INTERFACE
    // =========================================================================

    /**
     * @brief Register an additional consumer of the per-tick height
     */
    void AddDiagnosticSink(DiagnosticSink sink);
    void ClearDiagnosticSinks() { diagnostic_sinks_.clear(); }

    /// Snapshot of the current state
    [[nodiscard]] State GetState() const { return state_; }

    /**
     * @brief Restore a snapshot
     * @throws StateError if height, velocity or gravity is not finite
     */
    void SetState(const State &state);

    /// Rebuild the state from config and rewind time to t_start
    void Reset();

    /**
     * @brief Set simulation time (for warm restarts alongside SetState)
     * @throws StateError if @p t is not finite
     */
    void SetTime(double t);

  private:
    SimulatorConfig config_;
    State state_;
    double time_ = 0.0;
    std::size_t step_count_ = 0;

    std::vector<DiagnosticSink> diagnostic_sinks_;
    std::optional<Diagnostics> last_diagnostics_;

    Console console_;

    static State BuildState(const SimulatorConfig &config);
    void ConfigureLogging();
    void EmitHeight(double height);
};

} // namespace archimedes
