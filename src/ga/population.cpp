#include "ga/population.h"
#include "core/errors.h"
#include <stdexcept>

namespace ga {

void Population::add_individual(std::unique_ptr<Individual> individual) {
    if (!individual) {
        throw std::invalid_argument("Population: cannot add a null individual");
    }
    if (!individuals_.empty() && !individuals_.front()->is_compatible(*individual)) {
        throw core::IncompatibleGenome("Population: individual was built over a different problem instance");
    }
    individuals_.push_back(std::move(individual));
}

const Individual& Population::get_fittest_individual() const {
    if (individuals_.empty()) {
        throw core::EmptyPopulation("Population: no fittest individual in an empty population");
    }

    // Strict comparison keeps the earliest individual on ties
    const Individual* fittest = individuals_.front().get();
    float best_fitness = fittest->get_fitness();
    for (size_t i = 1; i < individuals_.size(); ++i) {
        float fitness = individuals_[i]->get_fitness();
        if (fitness > best_fitness) {
            best_fitness = fitness;
            fittest = individuals_[i].get();
        }
    }
    return *fittest;
}

float Population::get_average_fitness() const {
    if (individuals_.empty()) {
        throw core::EmptyPopulation("Population: no average fitness for an empty population");
    }

    double sum = 0.0;
    for (const auto& individual : individuals_) {
        sum += individual->get_fitness();
    }
    return static_cast<float>(sum / individuals_.size());
}

} // namespace ga
