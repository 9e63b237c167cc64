#include <catch2/catch.hpp>
#include <algorithm>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>
#include "core/errors.h"
#include "ga/population.h"

namespace {

// Individual with a fixed fitness, compatible with others of the same group
class FixedFitnessIndividual : public ga::Individual {
public:
    FixedFitnessIndividual(float fitness, int group = 0) : fitness_(fitness), group_(group) {}

    float get_fitness() const override { return fitness_; }
    void mutate(std::mt19937&, float) override {}
    std::unique_ptr<ga::Individual> crossover(const ga::Individual&, std::mt19937&) const override {
        return copy();
    }
    std::unique_ptr<ga::Individual> copy() const override {
        return std::make_unique<FixedFitnessIndividual>(*this);
    }
    bool is_compatible(const ga::Individual& other) const override {
        const auto* fixed = dynamic_cast<const FixedFitnessIndividual*>(&other);
        return fixed != nullptr && fixed->group_ == group_;
    }

private:
    float fitness_;
    int group_;
};

ga::Population make_population(const std::vector<float>& fitnesses) {
    ga::Population population;
    for (float f : fitnesses) {
        population.add_individual(std::make_unique<FixedFitnessIndividual>(f));
    }
    return population;
}

} // namespace

TEST_CASE("Population returns its fittest individual", "[population]") {
    ga::Population population = make_population({3.1f, 7.8f, 2.0f});

    REQUIRE(population.get_size() == 3);
    REQUIRE(population.get_fittest_individual().get_fitness() == Approx(7.8f));
    REQUIRE(&population.get_fittest_individual() == population.get_individuals()[1].get());
    REQUIRE(population.get_average_fitness() == Approx((3.1f + 7.8f + 2.0f) / 3.0f));
}

TEST_CASE("Population ties go to the first inserted individual", "[population]") {
    ga::Population population = make_population({1.0f, 5.0f, 5.0f});

    REQUIRE(&population.get_fittest_individual() == population.get_individuals()[1].get());
}

TEST_CASE("Population keeps insertion order", "[population]") {
    ga::Population population = make_population({0.5f, -1.0f, 2.5f});

    const auto& individuals = population.get_individuals();
    REQUIRE(individuals[0]->get_fitness() == Approx(0.5f));
    REQUIRE(individuals[1]->get_fitness() == Approx(-1.0f));
    REQUIRE(individuals[2]->get_fitness() == Approx(2.5f));
}

TEST_CASE("Empty population has no fittest individual", "[population]") {
    ga::Population population;

    REQUIRE(population.empty());
    REQUIRE_THROWS_AS(population.get_fittest_individual(), core::EmptyPopulation);
    REQUIRE_THROWS_AS(population.get_average_fitness(), core::EmptyPopulation);
    REQUIRE_THROWS_AS(population.get_fittest_individual(), std::logic_error);
}

TEST_CASE("Population rejects incompatible and null individuals", "[population]") {
    ga::Population population = make_population({1.0f});

    REQUIRE_THROWS_AS(population.add_individual(std::make_unique<FixedFitnessIndividual>(2.0f, 1)),
                      core::IncompatibleGenome);
    REQUIRE_THROWS_AS(population.add_individual(nullptr), std::invalid_argument);
    REQUIRE(population.get_size() == 1);
}

TEST_CASE("DescendingFitness sorts fittest first", "[population]") {
    ga::Population population = make_population({3.1f, 7.8f, 2.0f});
    auto& individuals = population.get_individuals();

    std::stable_sort(individuals.begin(), individuals.end(), ga::DescendingFitness());

    REQUIRE(individuals[0]->get_fitness() == Approx(7.8f));
    REQUIRE(individuals[1]->get_fitness() == Approx(3.1f));
    REQUIRE(individuals[2]->get_fitness() == Approx(2.0f));
}
