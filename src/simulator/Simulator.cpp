/**
 * @file Simulator.cpp
 * @brief Simulator implementation
 */

#include <archimedes/sim/Simulator.hpp>

#include <archimedes/io/LogSink.hpp>
#include <archimedes/io/SimulationLoader.hpp>

#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace archimedes {

// =============================================================================
// Construction
// =============================================================================

std::unique_ptr<Simulator> Simulator::FromConfig(const std::string &config_path) {
    return std::make_unique<Simulator>(io::SimulationLoader::Load(config_path));
}

std::unique_ptr<Simulator> Simulator::FromConfig(const SimulatorConfig &config) {
    return std::make_unique<Simulator>(config);
}

Simulator::Simulator() : Simulator(SimulatorConfig::Default()) {}

Simulator::Simulator(SimulatorConfig config)
    : config_(std::move(config)), state_(BuildState(config_)), time_(config_.t_start) {
    ConfigureLogging();

    std::ostringstream oss;
    oss << "Simulator '" << config_.name << "' ready: radius=" << state_.sphere.Radius()
        << " m, mass=" << state_.sphere.Mass() << " kg, water=" << state_.water.Density()
        << " kg/m^3, g=" << state_.gravity << " m/s^2";
    ARCHIMEDES_LOG_INFO(time_, oss.str());
}

Simulator::~Simulator() {
    // Sinks capture console_ by reference
    auto &log = GetLogService();
    log.Flush();
    log.ClearSinks();
}

Simulator::State Simulator::BuildState(const SimulatorConfig &config) {
    auto errors = config.Validate();
    if (!errors.empty()) {
        throw ConfigError(JoinErrors(errors), config.source_file);
    }
    return components::NewSim<double>(config.physics);
}

void Simulator::ConfigureLogging() {
    // Open the file first so a failure leaves the service untouched
    LogService::Sink file_sink;
    if (config_.logging.file_enabled) {
        file_sink = LogSinks::ToFile(config_.logging.file_path);
    }

    auto &log = GetLogService();
    log.ClearSinks();
    log.ResetCounts();
    log.SetMinLevel(config_.logging.MinLevel());

    console_.SetLogLevel(config_.logging.console_level);
    log.AddSink(LogSinks::ToConsole(console_), config_.logging.console_level);
    if (file_sink) {
        log.AddSink(std::move(file_sink), config_.logging.file_level);
    }
}

// =============================================================================
// Execution
// =============================================================================

void Simulator::Step(double dt) {
    if (!std::isfinite(dt)) {
        ThrowAndLog(IntegrationError::NonFiniteStep(time_, dt), time_, "Simulator");
    }
    if (dt < 0.0) {
        ThrowAndLog(IntegrationError::NegativeStep(time_, dt), time_, "Simulator");
    }

    LogContextManager::ScopedContext ctx(kEntity, kComponent);

    // The tick is fully committed before any sink runs
    auto diag = components::Update(state_, dt);
    time_ += dt;
    ++step_count_;
    last_diagnostics_ = diag;

    const bool now_submerged = components::SubmergedRatio(state_.sphere) > 0.0;
    if (now_submerged != diag.Submerged()) {
        ARCHIMEDES_LOG_EVENT(time_, now_submerged ? "Sphere entered the water"
                                                  : "Sphere left the water");
    }

    EmitHeight(diag.height);
}

void Simulator::Step() { Step(config_.dt); }

std::size_t Simulator::Run() {
    const double remaining = config_.t_end - time_;
    if (!std::isfinite(remaining) || remaining <= 0.0) {
        return 0;
    }

    // Tolerance absorbs round-off in (t_end - t) / dt
    const auto ticks = static_cast<std::size_t>(std::floor(remaining / config_.dt + 1e-9));

    ARCHIMEDES_LOG_INFO(time_, "Running " + std::to_string(ticks) + " ticks at dt=" +
                                   std::to_string(config_.dt) + " s");

    {
        LogService::BufferedScope buffered(GetLogService());
        for (std::size_t i = 0; i < ticks; ++i) {
            Step(config_.dt);
        }
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << "Run complete: height=" << Height()
        << " m, velocity=" << Velocity() << " m/s";
    ARCHIMEDES_LOG_INFO(time_, oss.str());
    return ticks;
}

void Simulator::EmitHeight(double height) {
    if (GetLogService().Enabled(LogLevel::Debug)) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(6) << "height=" << height;
        ARCHIMEDES_LOG_DEBUG(time_, oss.str());
    }

    for (const auto &sink : diagnostic_sinks_) {
        sink(height);
    }
}

// =============================================================================
// Control
// =============================================================================

void Simulator::AddDiagnosticSink(DiagnosticSink sink) {
    if (!sink) {
        throw ConfigError("diagnostic sink must be callable");
    }
    diagnostic_sinks_.push_back(std::move(sink));
}

void Simulator::SetState(const State &state) {
    if (!std::isfinite(state.sphere.Height()) || !std::isfinite(state.sphere.Velocity())) {
        throw StateError("sphere height and velocity must be finite");
    }
    if (!std::isfinite(state.gravity)) {
        throw StateError("gravity must be finite");
    }
    state_ = state;
    last_diagnostics_.reset();
}

void Simulator::SetTime(double t) {
    if (!std::isfinite(t)) {
        throw StateError("simulation time must be finite");
    }
    time_ = t;
}

void Simulator::Reset() {
    state_ = BuildState(config_);
    time_ = config_.t_start;
    step_count_ = 0;
    last_diagnostics_.reset();
    ARCHIMEDES_LOG_INFO(time_, "Simulator reset");
}

} // namespace archimedes
