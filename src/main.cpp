#include "engine/Simulation.hpp"
#include "engine/Log.hpp"

int main(int argc, char** argv) {
    skyraid::Simulation simulation;

    if (!simulation.init(argc > 1 ? argv[1] : "")) {
        skyraid::Log::shutdown();
        return 1;
    }

    simulation.run();
    simulation.shutdown();
    skyraid::Log::shutdown();

    return 0;
}
