#pragma once

#include <memory>
#include <random>

namespace ga {

/**
 * Individual - A candidate solution in a genetic algorithm
 *
 * Abstract capability set every genome type provides to the engine.
 * Fitness is higher-is-better and only comparable between individuals
 * built over the same problem.
 */
class Individual {
public:
    virtual ~Individual() = default;

    /**
     * Get the fitness of the individual (computed lazily, then cached)
     */
    virtual float get_fitness() const = 0;

    /**
     * Perform a mutation on the individual
     * @param rng Random source owned by the engine
     * @param mutation_rate Per-gene mutation probability
     */
    virtual void mutate(std::mt19937& rng, float mutation_rate) = 0;

    /**
     * Perform a crossover with another individual. Neither parent is modified.
     * @param parent_b Second parent
     * @return a new individual
     * @throws core::IncompatibleGenome if parent_b was built over another problem
     */
    virtual std::unique_ptr<Individual> crossover(const Individual& parent_b, std::mt19937& rng) const = 0;

    /**
     * Create a copy of this individual with the same genotype
     */
    virtual std::unique_ptr<Individual> copy() const = 0;

    /**
     * Check whether other is the same kind of genome over the same problem
     */
    virtual bool is_compatible(const Individual& other) const = 0;
};

// Orders individuals by fitness, fittest first
struct DescendingFitness {
    bool operator()(const Individual& a, const Individual& b) const {
        return a.get_fitness() > b.get_fitness();
    }
    bool operator()(const std::unique_ptr<Individual>& a, const std::unique_ptr<Individual>& b) const {
        return a->get_fitness() > b->get_fitness();
    }
};

} // namespace ga
