/**
 * @file floating_sphere_demo.cpp
 * @brief Floating Sphere Example
 *
 * Demonstrates the Simulator API:
 * - Simulator::FromConfig("config.yaml") loads and configures
 * - Diagnostic sink capturing the height each tick
 * - Step() loop with a periodic table
 *
 * Physics: a 1 m sphere (250 kg/m^3) is released 1 m above water
 * (1000 kg/m^3). It falls in, overshoots and bobs around the height where
 * buoyancy balances weight.
 *
 * Usage: ./floating_sphere_demo [config_path]
 *        Default: config/floating_sphere.yaml (built-in defaults if missing)
 */

#include <archimedes/archimedes.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

using namespace archimedes;
namespace fs = std::filesystem;

int main(int argc, char *argv[]) {
    std::string config_path = "config/floating_sphere.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    std::unique_ptr<Simulator> sim;
    try {
        if (fs::exists(config_path)) {
            std::cout << "Loading: " << config_path << "\n";
            sim = Simulator::FromConfig(config_path);
        } else {
            std::cout << "Config not found: " << config_path << " (using built-in defaults)\n";
            sim = std::make_unique<Simulator>();
        }
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // Track the extremes of the logged height
    double min_height = std::numeric_limits<double>::infinity();
    double max_height = -std::numeric_limits<double>::infinity();
    sim->AddDiagnosticSink([&](double height) {
        min_height = std::min(min_height, height);
        max_height = std::max(max_height, height);
    });

    // =========================================================================
    // Run Simulation
    // =========================================================================

    const double dt = sim->Dt();
    const auto print_every = std::max<long>(1, std::lround(0.5 / dt)); // 0.5 s intervals

    Console console;
    const std::size_t table_width = 4 * 12;

    console.Line();
    console.Line(Console::Header({"Time [s]", "z [m]", "v [m/s]", "ratio"}));
    console.Line(Console::Rule(table_width));

    long step = 0;
    try {
        while (sim->Time() + 0.5 * dt < sim->EndTime()) {
            sim->Step();

            if (++step % print_every == 0) {
                const auto &diag = sim->LastDiagnostics();
                console.Line(Console::Row(
                    {sim->Time(), sim->Height(), sim->Velocity(), diag ? diag->ratio : 0.0}));
            }
        }
    } catch (const Error &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    console.Line(Console::Rule(table_width));
    console.Line();

    // =========================================================================
    // Results
    // =========================================================================

    std::cout << "Final Results:\n";
    std::cout << "  Ticks:    " << sim->StepCount() << "\n";
    std::cout << "  Time:     " << std::fixed << std::setprecision(4) << sim->Time() << " s\n";
    std::cout << "  Height:   " << sim->Height() << " m\n";
    std::cout << "  Velocity: " << sim->Velocity() << " m/s\n";
    std::cout << "  Range:    [" << min_height << ", " << max_height << "] m\n";

    if (auto eq = sim->EquilibriumHeight()) {
        std::cout << "  Floating height (analytic): " << *eq << " m\n";
    } else {
        std::cout << "  Sphere is denser than the water and sinks\n";
    }

    return 0;
}
