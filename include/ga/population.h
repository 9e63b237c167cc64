#pragma once

#include <cstddef>
#include <memory>
#include <vector>
#include "ga/individual.h"

namespace ga {

/**
 * Population - One generation of individuals
 *
 * Keeps insertion order (it does not encode rank). All members must be
 * compatible with each other, i.e. built over the same problem.
 * The engine is the only writer while a generation is replaced.
 */
class Population {
public:
    Population() = default;

    // Owns its individuals
    Population(const Population&) = delete;
    Population& operator=(const Population&) = delete;
    Population(Population&&) = default;
    Population& operator=(Population&&) = default;

    /**
     * Add an individual at the end of the population
     * @throws std::invalid_argument if individual is null
     * @throws core::IncompatibleGenome if it does not match the current members
     */
    void add_individual(std::unique_ptr<Individual> individual);

    /**
     * Get the individual with the highest fitness
     * Ties go to the individual inserted first.
     * @throws core::EmptyPopulation if there are no individuals
     */
    const Individual& get_fittest_individual() const;

    /**
     * Mean fitness over all individuals
     * @throws core::EmptyPopulation if there are no individuals
     */
    float get_average_fitness() const;

    std::vector<std::unique_ptr<Individual>>& get_individuals() { return individuals_; }
    const std::vector<std::unique_ptr<Individual>>& get_individuals() const { return individuals_; }

    std::size_t get_size() const { return individuals_.size(); }
    bool empty() const { return individuals_.empty(); }

private:
    std::vector<std::unique_ptr<Individual>> individuals_;
};

} // namespace ga
