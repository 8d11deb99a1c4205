// fleet_simulation.cpp
// Runs one alignment pass against an in-memory fleet described in JSON
// Usage: fleet_simulation <config.json> <fleet.json>

#include <iostream>
#include "vdalign/vdalign.hpp"
#include "vdalign/fake_broker.hpp"

using namespace vdalign;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.json> <fleet.json>" << std::endl;
        return 1;
    }

    std::cout << "🚀 vdalign " << version() << " - Fleet Simulation\n" << std::endl;

    try {
        Config config = JsonConfig::from_file(argv[1]);
        EnvConfig::apply(config);

        FleetFixture fleet = load_fleet_fixture_file(argv[2]);
        Orchestrator orchestrator(config, fleet.broker, fleet.resolver);

        RunReport report = orchestrator.run();
        std::cout << ReportAggregator::to_text(report) << std::endl;

        std::cout << "✅ " << fleet.broker->restarted_machines().size() << " restart(s) and "
                  << fleet.broker->notifications().size() << " notification(s) reached the fleet"
                  << std::endl;

    } catch (const ConfigError& e) {
        std::cerr << "❌ Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const FatalError& e) {
        std::cerr << "❌ Run aborted: " << e.what() << std::endl;
        return 2;
    }

    return 0;
}
