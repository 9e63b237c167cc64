#pragma once

#include <memory>
#include <random>
#include <vector>
#include "ga/genetic_algorithm.h"
#include "problem/problem_instance.h"
#include "segmentation/segmentation_individual.h"

namespace segmentation {

/**
 * SegmentationGeneticAlgorithm - Evolves image segmentations
 *
 * Generation policy:
 *   - elitism: the top elite_fraction of the population is copied unchanged
 *   - the rest is bred from tournament-selected parents, uniform crossover
 *     with probability crossover_rate (otherwise a copy of the first parent),
 *     then per-pixel mutation
 *   - offspring are evaluated before they replace the whole population
 *
 * Fitness evaluation of the offspring can be spread over several threads;
 * each thread works on its own individuals and only reads the shared
 * problem instance.
 */
class SegmentationGeneticAlgorithm : public ga::GeneticAlgorithm {
public:
    /**
     * Optimization parameters
     */
    struct Params {
        int population_size = 30;        // Number of individuals per generation
        float mutation_rate = 0.01f;     // Probability of mutating each pixel
        float crossover_rate = 0.7f;     // Probability of crossover vs cloning
        float elite_fraction = 0.1f;     // Fraction of top performers to preserve
        int tournament_size = 3;         // Contestants per parent selection
        int evaluation_threads = 1;      // Worker threads for fitness evaluation
        unsigned int seed = 0;           // Random seed (0 = nondeterministic)
        int verbosity = 2;               // One line per generation at >= 2, term details at >= 4
        FitnessWeights fitness_weights;
    };

    /**
     * Constructor
     * @param problem Shared problem instance
     * @param params Optimization parameters
     * @throws std::invalid_argument on a null problem or out-of-range parameters
     */
    SegmentationGeneticAlgorithm(std::shared_ptr<const problem::ProblemInstance> problem,
                                 const Params& params);

    const Params& get_params() const { return params_; }
    const problem::ProblemInstance& get_problem_instance() const { return *problem_; }

    /**
     * Get the fittest segmentation of the current population
     * @throws core::EmptyPopulation if the population is empty
     */
    const SegmentationIndividual& get_fittest_segmentation() const;

    /**
     * Evaluate the fitness of every individual, in parallel when configured
     * Rethrows the first failure after all workers finished.
     */
    void evaluate(const std::vector<std::unique_ptr<ga::Individual>>& individuals) const;

protected:
    ga::Population create_initial_population() override;
    std::vector<std::unique_ptr<ga::Individual>> create_offspring() override;
    void insert_offspring(std::vector<std::unique_ptr<ga::Individual>> offspring) override;
    void print_state() const override;

private:
    int tournament_selection(const std::vector<std::unique_ptr<ga::Individual>>& individuals);
    int get_elite_count() const;

    std::shared_ptr<const problem::ProblemInstance> problem_;
    Params params_;
    std::mt19937 rng_;
};

} // namespace segmentation
