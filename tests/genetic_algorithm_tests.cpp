#include <catch2/catch.hpp>
#include <memory>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>
#include "core/errors.h"
#include "ga/genetic_algorithm.h"
#include "segmentation/segmentation_genetic_algorithm.h"
#include "test_images.h"

using problem::Direction;
using segmentation::SegmentationGeneticAlgorithm;
using segmentation::SegmentationIndividual;
using State = ga::GeneticAlgorithm::State;

namespace {

class ConstantIndividual : public ga::Individual {
public:
    float get_fitness() const override { return 1.0f; }
    void mutate(std::mt19937&, float) override {}
    std::unique_ptr<ga::Individual> crossover(const ga::Individual&, std::mt19937&) const override {
        return copy();
    }
    std::unique_ptr<ga::Individual> copy() const override {
        return std::make_unique<ConstantIndividual>();
    }
    bool is_compatible(const ga::Individual&) const override { return true; }
};

// Engine whose generation policy fails on a chosen generation
class FailingAlgorithm : public ga::GeneticAlgorithm {
public:
    explicit FailingAlgorithm(int failing_generation) : failing_generation_(failing_generation) {}

protected:
    ga::Population create_initial_population() override {
        if (failing_generation_ == 0) {
            throw std::runtime_error("initialization failed");
        }
        ga::Population population;
        population.add_individual(std::make_unique<ConstantIndividual>());
        return population;
    }

    std::vector<std::unique_ptr<ga::Individual>> create_offspring() override {
        if (get_generation() + 1 == failing_generation_) {
            throw std::runtime_error("breeding failed");
        }
        std::vector<std::unique_ptr<ga::Individual>> offspring;
        offspring.push_back(std::make_unique<ConstantIndividual>());
        return offspring;
    }

    void insert_offspring(std::vector<std::unique_ptr<ga::Individual>> offspring) override {
        ga::Population next;
        for (auto& individual : offspring) {
            next.add_individual(std::move(individual));
        }
        get_population() = std::move(next);
    }

    void print_state() const override {}

private:
    int failing_generation_;
};

SegmentationGeneticAlgorithm::Params quiet_params(unsigned int seed) {
    SegmentationGeneticAlgorithm::Params params;
    params.population_size = 20;
    params.mutation_rate = 0.2f;
    params.crossover_rate = 0.7f;
    params.elite_fraction = 0.1f;
    params.tournament_size = 3;
    params.seed = seed;
    params.verbosity = 0;
    return params;
}

} // namespace

TEST_CASE("Engine state machine", "[genetic_algorithm]") {
    auto p = test_images::make_problem(test_images::two_bands());
    SegmentationGeneticAlgorithm algorithm(p, quiet_params(7));

    REQUIRE(algorithm.get_state() == State::UNINITIALIZED);
    REQUIRE_THROWS_AS(algorithm.step(), std::logic_error);
    REQUIRE_THROWS_AS(algorithm.get_population(), std::logic_error);

    algorithm.initialize();
    REQUIRE(algorithm.get_state() == State::INITIALIZED);
    REQUIRE(algorithm.get_generation() == 0);
    REQUIRE(algorithm.get_population().get_size() == 20);
    REQUIRE_THROWS_AS(algorithm.initialize(), std::logic_error);

    algorithm.step();
    REQUIRE(algorithm.get_state() == State::EVOLVING);
    REQUIRE(algorithm.get_generation() == 1);
    REQUIRE(algorithm.get_population().get_size() == 20);

    algorithm.step();
    REQUIRE(algorithm.get_generation() == 2);

    algorithm.terminate();
    REQUIRE(algorithm.get_state() == State::TERMINATED);
    REQUIRE_THROWS_AS(algorithm.step(), std::logic_error);
    REQUIRE(algorithm.get_generation() == 2);
}

TEST_CASE("Engine state names", "[genetic_algorithm]") {
    REQUIRE(ga::to_string(State::UNINITIALIZED) == "UNINITIALIZED");
    REQUIRE(ga::to_string(State::INITIALIZED) == "INITIALIZED");
    REQUIRE(ga::to_string(State::EVOLVING) == "EVOLVING");
    REQUIRE(ga::to_string(State::TERMINATED) == "TERMINATED");
}

TEST_CASE("Failures terminate the run and propagate", "[genetic_algorithm]") {
    SECTION("during initialization") {
        FailingAlgorithm algorithm(0);
        REQUIRE_THROWS_AS(algorithm.initialize(), std::runtime_error);
        REQUIRE(algorithm.get_state() == State::TERMINATED);
    }

    SECTION("during a generation") {
        FailingAlgorithm algorithm(3);
        algorithm.initialize();
        algorithm.step();
        algorithm.step();
        REQUIRE(algorithm.get_generation() == 2);

        REQUIRE_THROWS_AS(algorithm.step(), std::runtime_error);
        REQUIRE(algorithm.get_state() == State::TERMINATED);
        REQUIRE(algorithm.get_generation() == 2);
        REQUIRE_THROWS_AS(algorithm.step(), std::logic_error);
    }
}

TEST_CASE("Engine rejects invalid parameters", "[genetic_algorithm]") {
    auto p = test_images::make_problem(test_images::two_bands());
    auto params = quiet_params(1);

    SECTION("null problem") {
        REQUIRE_THROWS_AS(SegmentationGeneticAlgorithm(nullptr, params), std::invalid_argument);
    }
    SECTION("population size") {
        params.population_size = 0;
        REQUIRE_THROWS_AS(SegmentationGeneticAlgorithm(p, params), std::invalid_argument);
    }
    SECTION("mutation rate") {
        params.mutation_rate = 1.5f;
        REQUIRE_THROWS_AS(SegmentationGeneticAlgorithm(p, params), std::invalid_argument);
    }
    SECTION("crossover rate") {
        params.crossover_rate = -0.5f;
        REQUIRE_THROWS_AS(SegmentationGeneticAlgorithm(p, params), std::invalid_argument);
    }
    SECTION("elite fraction") {
        params.elite_fraction = 2.0f;
        REQUIRE_THROWS_AS(SegmentationGeneticAlgorithm(p, params), std::invalid_argument);
    }
    SECTION("tournament size") {
        params.tournament_size = 0;
        REQUIRE_THROWS_AS(SegmentationGeneticAlgorithm(p, params), std::invalid_argument);
    }
    SECTION("evaluation threads") {
        params.evaluation_threads = 0;
        REQUIRE_THROWS_AS(SegmentationGeneticAlgorithm(p, params), std::invalid_argument);
    }
}

TEST_CASE("Elitism never loses the best individual", "[genetic_algorithm]") {
    auto p = test_images::make_problem(test_images::split_vertical(6, 4));
    SegmentationGeneticAlgorithm algorithm(p, quiet_params(21));
    algorithm.initialize();

    float best = algorithm.get_population().get_fittest_individual().get_fitness();
    for (int generation = 0; generation < 15; ++generation) {
        algorithm.step();
        float current = algorithm.get_population().get_fittest_individual().get_fitness();
        REQUIRE(current >= best);
        best = current;
    }
}

TEST_CASE("Evolution finds the two color bands of a 2x2 image", "[genetic_algorithm]") {
    auto p = test_images::make_problem(test_images::two_bands());

    // Top row and bottom row as two segments
    SegmentationIndividual hand_built(p, {Direction::RIGHT, Direction::LEFT, Direction::RIGHT, Direction::LEFT});
    float target = hand_built.get_fitness();

    SegmentationGeneticAlgorithm algorithm(p, quiet_params(12345));
    algorithm.initialize();
    for (int generation = 0; generation < 60; ++generation) {
        algorithm.step();
    }

    const SegmentationIndividual& best = algorithm.get_fittest_segmentation();
    REQUIRE(best.get_fitness() >= Approx(target).margin(1e-5));
    REQUIRE(best.get_segments().segment_count == 2);
    REQUIRE(best.get_segments().labels[0] == best.get_segments().labels[1]);
    REQUIRE(best.get_segments().labels[2] == best.get_segments().labels[3]);
    REQUIRE(best.get_segments().labels[0] != best.get_segments().labels[2]);
}

TEST_CASE("Parallel evaluation matches serial evaluation", "[genetic_algorithm]") {
    auto p = test_images::make_problem(test_images::split_vertical(8, 6));
    std::mt19937 rng(99);

    std::vector<std::unique_ptr<ga::Individual>> serial;
    std::vector<std::unique_ptr<ga::Individual>> parallel;
    for (int i = 0; i < 13; ++i) {
        auto individual = SegmentationIndividual::create_random_individual(p, rng);
        parallel.push_back(individual->copy());
        serial.push_back(std::move(individual));
    }

    auto params = quiet_params(1);
    params.evaluation_threads = 4;
    SegmentationGeneticAlgorithm parallel_algorithm(p, params);
    parallel_algorithm.evaluate(parallel);

    for (size_t i = 0; i < serial.size(); ++i) {
        REQUIRE(parallel[i]->get_fitness() == serial[i]->get_fitness());
    }
}

TEST_CASE("Multi-threaded runs keep population size", "[genetic_algorithm]") {
    auto p = test_images::make_problem(test_images::split_vertical(6, 4));
    auto params = quiet_params(77);
    params.evaluation_threads = 3;
    SegmentationGeneticAlgorithm algorithm(p, params);

    algorithm.initialize();
    for (int generation = 0; generation < 5; ++generation) {
        algorithm.step();
    }
    REQUIRE(algorithm.get_population().get_size() == 20);
    REQUIRE(algorithm.get_generation() == 5);
}
