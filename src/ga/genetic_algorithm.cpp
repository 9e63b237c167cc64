#include "ga/genetic_algorithm.h"
#include <exception>
#include <stdexcept>

namespace ga {

void GeneticAlgorithm::initialize() {
    if (state_ != State::UNINITIALIZED) {
        throw std::logic_error("GeneticAlgorithm: initialize() called in state " + to_string(state_));
    }

    try {
        population_ = std::make_unique<Population>(create_initial_population());
    } catch (const std::exception&) {
        state_ = State::TERMINATED;
        throw;
    }

    generation_ = 0;
    state_ = State::INITIALIZED;
}

void GeneticAlgorithm::step() {
    if (state_ != State::INITIALIZED && state_ != State::EVOLVING) {
        throw std::logic_error("GeneticAlgorithm: step() called in state " + to_string(state_));
    }

    state_ = State::EVOLVING;
    try {
        std::vector<std::unique_ptr<Individual>> offspring = create_offspring();
        insert_offspring(std::move(offspring));
        ++generation_;
        print_state();
    } catch (const std::exception&) {
        // No partial-generation recovery: the run is over
        state_ = State::TERMINATED;
        throw;
    }
}

Population& GeneticAlgorithm::get_population() {
    if (!population_) {
        throw std::logic_error("GeneticAlgorithm: population requested before initialize()");
    }
    return *population_;
}

const Population& GeneticAlgorithm::get_population() const {
    if (!population_) {
        throw std::logic_error("GeneticAlgorithm: population requested before initialize()");
    }
    return *population_;
}

std::string to_string(GeneticAlgorithm::State state) {
    switch (state) {
    case GeneticAlgorithm::State::UNINITIALIZED: return "UNINITIALIZED";
    case GeneticAlgorithm::State::INITIALIZED:   return "INITIALIZED";
    case GeneticAlgorithm::State::EVOLVING:      return "EVOLVING";
    case GeneticAlgorithm::State::TERMINATED:    return "TERMINATED";
    }
    return "UNKNOWN";
}

} // namespace ga
