#include "segmentation/segmentation_genetic_algorithm.h"
#include "core/errors.h"
#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <thread>

using namespace std;

namespace segmentation {

// ============================================================================
// Construction
// ============================================================================

SegmentationGeneticAlgorithm::SegmentationGeneticAlgorithm(
    shared_ptr<const problem::ProblemInstance> problem,
    const Params& params)
    : problem_(move(problem))
    , params_(params)
    , rng_(params.seed != 0 ? params.seed : random_device{}())
{
    if (!problem_) {
        throw invalid_argument("SegmentationGeneticAlgorithm: null problem instance");
    }
    if (params_.population_size < 1) {
        throw invalid_argument("SegmentationGeneticAlgorithm: population size must be positive");
    }
    if (!(params_.mutation_rate >= 0.0f && params_.mutation_rate <= 1.0f)) {
        throw invalid_argument("SegmentationGeneticAlgorithm: mutation rate must be in [0, 1]");
    }
    if (!(params_.crossover_rate >= 0.0f && params_.crossover_rate <= 1.0f)) {
        throw invalid_argument("SegmentationGeneticAlgorithm: crossover rate must be in [0, 1]");
    }
    if (!(params_.elite_fraction >= 0.0f && params_.elite_fraction <= 1.0f)) {
        throw invalid_argument("SegmentationGeneticAlgorithm: elite fraction must be in [0, 1]");
    }
    if (params_.tournament_size < 1) {
        throw invalid_argument("SegmentationGeneticAlgorithm: tournament size must be positive");
    }
    if (params_.evaluation_threads < 1) {
        throw invalid_argument("SegmentationGeneticAlgorithm: need at least one evaluation thread");
    }
}

// ============================================================================
// Generation Policy
// ============================================================================

ga::Population SegmentationGeneticAlgorithm::create_initial_population() {
    if (params_.verbosity >= 3) {
        cout << "Initializing population of " << params_.population_size << " over "
             << problem_->get_width() << "x" << problem_->get_height() << " pixels..." << endl;
    }

    ga::Population population;
    for (int i = 0; i < params_.population_size; ++i) {
        population.add_individual(
            SegmentationIndividual::create_random_individual(problem_, rng_, params_.fitness_weights));
    }
    evaluate(population.get_individuals());

    if (params_.verbosity >= 3) {
        cout << "Initial best fitness: " << population.get_fittest_individual().get_fitness() << endl;
    }
    return population;
}

vector<unique_ptr<ga::Individual>> SegmentationGeneticAlgorithm::create_offspring() {
    const auto& current = get_population().get_individuals();
    if (current.empty()) {
        throw core::EmptyPopulation("SegmentationGeneticAlgorithm: cannot breed an empty population");
    }

    // Rank by fitness, stable so ties keep insertion order
    vector<int> order(current.size());
    iota(order.begin(), order.end(), 0);
    stable_sort(order.begin(), order.end(), [&current](int a, int b) {
        return current[a]->get_fitness() > current[b]->get_fitness();
    });

    vector<unique_ptr<ga::Individual>> offspring;
    offspring.reserve(params_.population_size);

    // Elitism - preserve top performers
    int num_elite = min(get_elite_count(), static_cast<int>(current.size()));
    for (int i = 0; i < num_elite; ++i) {
        offspring.push_back(current[order[i]]->copy());
    }

    // Fill rest with offspring
    bernoulli_distribution crossover_dist(params_.crossover_rate);
    while (offspring.size() < static_cast<size_t>(params_.population_size)) {
        int parent1_idx = tournament_selection(current);
        int parent2_idx = tournament_selection(current);

        unique_ptr<ga::Individual> child;
        if (crossover_dist(rng_)) {
            child = current[parent1_idx]->crossover(*current[parent2_idx], rng_);
        } else {
            child = current[parent1_idx]->copy();
        }
        child->mutate(rng_, params_.mutation_rate);

        offspring.push_back(move(child));
    }

    // The next generation must not start with evaluation pending
    evaluate(offspring);
    return offspring;
}

void SegmentationGeneticAlgorithm::insert_offspring(vector<unique_ptr<ga::Individual>> offspring) {
    // Full replacement
    ga::Population next;
    for (auto& individual : offspring) {
        next.add_individual(move(individual));
    }
    get_population() = move(next);
}

void SegmentationGeneticAlgorithm::print_state() const {
    if (params_.verbosity < 2) {
        return;
    }

    const SegmentationIndividual& fittest = get_fittest_segmentation();
    const FitnessBreakdown& breakdown = fittest.get_fitness_breakdown();

    cout << "Gen " << setw(4) << get_generation()
         << " | Fit: " << fixed << setprecision(6) << breakdown.fitness
         << " | Avg: " << setprecision(6) << get_population().get_average_fitness()
         << " | Segments: " << breakdown.segment_count
         << endl;

    if (params_.verbosity >= 4) {
        cout << "  BEST: edge=" << setprecision(4) << breakdown.edge_value
             << " dev=" << breakdown.deviation
             << " conn=" << breakdown.connectivity
             << (breakdown.degenerate ? " (degenerate)" : "")
             << endl;
    }
}

int SegmentationGeneticAlgorithm::tournament_selection(const vector<unique_ptr<ga::Individual>>& individuals) {
    uniform_int_distribution<int> index_dist(0, static_cast<int>(individuals.size()) - 1);

    int best_idx = index_dist(rng_);
    float best_fitness = individuals[best_idx]->get_fitness();

    for (int i = 1; i < params_.tournament_size; ++i) {
        int idx = index_dist(rng_);
        if (individuals[idx]->get_fitness() > best_fitness) {
            best_fitness = individuals[idx]->get_fitness();
            best_idx = idx;
        }
    }

    return best_idx;
}

int SegmentationGeneticAlgorithm::get_elite_count() const {
    return static_cast<int>(params_.population_size * params_.elite_fraction);
}

// ============================================================================
// Evaluation
// ============================================================================

void SegmentationGeneticAlgorithm::evaluate(const vector<unique_ptr<ga::Individual>>& individuals) const {
    size_t num_threads = min(static_cast<size_t>(params_.evaluation_threads), individuals.size());
    if (num_threads <= 1) {
        for (const auto& individual : individuals) {
            individual->get_fitness();
        }
        return;
    }

    vector<exception_ptr> failures(num_threads);
    vector<thread> workers;
    workers.reserve(num_threads);

    for (size_t t = 0; t < num_threads; ++t) {
        workers.emplace_back([&individuals, &failures, num_threads, t]() {
            try {
                for (size_t i = t; i < individuals.size(); i += num_threads) {
                    individuals[i]->get_fitness();
                }
            } catch (...) {
                failures[t] = current_exception();  // Rethrown on the engine thread
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }

    for (const auto& failure : failures) {
        if (failure) {
            rethrow_exception(failure);
        }
    }
}

const SegmentationIndividual& SegmentationGeneticAlgorithm::get_fittest_segmentation() const {
    return static_cast<const SegmentationIndividual&>(get_population().get_fittest_individual());
}

} // namespace segmentation
