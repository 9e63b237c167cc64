#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "optimization/ga_controller.h"
#include "segmentation/segmentation_genetic_algorithm.h"
#include "test_images.h"

using optimization::GAController;
using segmentation::SegmentationGeneticAlgorithm;

namespace {

SegmentationGeneticAlgorithm::Params quiet_params(unsigned int seed) {
    SegmentationGeneticAlgorithm::Params params;
    params.population_size = 12;
    params.mutation_rate = 0.1f;
    params.seed = seed;
    params.verbosity = 0;
    return params;
}

GAController::LogSettings quiet_log() {
    GAController::LogSettings settings;
    settings.verbosity = 0;
    return settings;
}

} // namespace

TEST_CASE("Controller stops at the generation limit", "[controller]") {
    auto p = test_images::make_problem(test_images::split_vertical(4, 3));
    SegmentationGeneticAlgorithm algorithm(p, quiet_params(3));

    GAController::StoppingPolicy policy;
    policy.generation_limit = 5;
    GAController controller(algorithm, policy, quiet_log());

    GAController::RunSummary summary = controller.run();

    REQUIRE(summary.generations == 5);
    REQUIRE(summary.stop_reason == "generation limit reached");
    REQUIRE(summary.best_fitness == Approx(algorithm.get_population().get_fittest_individual().get_fitness()));
    REQUIRE(algorithm.get_state() == ga::GeneticAlgorithm::State::TERMINATED);
    REQUIRE_FALSE(controller.is_running());
    REQUIRE(controller.get_current_generation() == 5);
}

TEST_CASE("Controller with a zero generation limit only initializes", "[controller]") {
    auto p = test_images::make_problem(test_images::two_bands());
    SegmentationGeneticAlgorithm algorithm(p, quiet_params(4));

    GAController::StoppingPolicy policy;
    policy.generation_limit = 0;
    GAController controller(algorithm, policy, quiet_log());

    GAController::RunSummary summary = controller.run();
    REQUIRE(summary.generations == 0);
    REQUIRE(algorithm.get_population().get_size() == 12);
}

TEST_CASE("Controller rejects a negative generation limit", "[controller]") {
    auto p = test_images::make_problem(test_images::two_bands());
    SegmentationGeneticAlgorithm algorithm(p, quiet_params(4));

    GAController::StoppingPolicy policy;
    policy.generation_limit = -1;
    GAController controller(algorithm, policy, quiet_log());

    REQUIRE_THROWS_AS(controller.run(), std::invalid_argument);
    REQUIRE_FALSE(controller.is_running());
}

TEST_CASE("Controller stops when the best fitness stagnates", "[controller]") {
    // Every two-segment split of a flat image scores the same
    auto p = test_images::make_problem(test_images::solid(2, 2, cv::Vec3b(90, 90, 90)));
    SegmentationGeneticAlgorithm algorithm(p, quiet_params(5));

    GAController::StoppingPolicy policy;
    policy.generation_limit = 500;
    policy.stagnation_limit = 3;
    GAController controller(algorithm, policy, quiet_log());

    GAController::RunSummary summary = controller.run();
    REQUIRE(summary.stop_reason == "stagnation limit reached");
    REQUIRE(summary.generations >= 3);
    REQUIRE(summary.generations < 500);
}

TEST_CASE("Controller stops once the target fitness is reached", "[controller]") {
    auto p = test_images::make_problem(test_images::two_bands());
    SegmentationGeneticAlgorithm algorithm(p, quiet_params(6));

    GAController::StoppingPolicy policy;
    policy.generation_limit = 50;
    policy.target_fitness = -100.0f;
    GAController controller(algorithm, policy, quiet_log());

    GAController::RunSummary summary = controller.run();
    REQUIRE(summary.stop_reason == "target fitness reached");
    REQUIRE(summary.generations == 0);
}

TEST_CASE("Controller can be stopped from the progress callback", "[controller]") {
    auto p = test_images::make_problem(test_images::split_vertical(4, 4));
    SegmentationGeneticAlgorithm algorithm(p, quiet_params(8));

    GAController::StoppingPolicy policy;
    policy.generation_limit = 100;

    std::vector<int> generations;
    std::vector<float> best_fitnesses;
    GAController* controller_ptr = nullptr;

    GAController controller(algorithm, policy, quiet_log(), [&](int generation, float best_fitness) {
        generations.push_back(generation);
        best_fitnesses.push_back(best_fitness);
        if (generation == 4) {
            controller_ptr->stop();
        }
    });
    controller_ptr = &controller;

    GAController::RunSummary summary = controller.run();

    REQUIRE(summary.stop_reason == "stopped by user");
    REQUIRE(summary.generations == 4);
    REQUIRE(generations == std::vector<int>{1, 2, 3, 4});
    for (size_t i = 1; i < best_fitnesses.size(); ++i) {
        REQUIRE(best_fitnesses[i] >= best_fitnesses[i - 1]);
    }
}

TEST_CASE("Controller writes a CSV progress log", "[controller]") {
    auto p = test_images::make_problem(test_images::split_vertical(4, 3));
    SegmentationGeneticAlgorithm algorithm(p, quiet_params(10));

    std::filesystem::path log_path = std::filesystem::temp_directory_path() / "genetic_segmentation_progress.csv";

    GAController::StoppingPolicy policy;
    policy.generation_limit = 6;
    GAController::LogSettings log_settings = quiet_log();
    log_settings.log_file = log_path.string();
    log_settings.log_interval = 2;
    GAController controller(algorithm, policy, log_settings);
    controller.run();

    std::ifstream csv(log_path);
    REQUIRE(csv.is_open());

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(csv, line)) {
        lines.push_back(line);
    }
    csv.close();
    std::filesystem::remove(log_path);

    REQUIRE(lines.size() == 4);
    REQUIRE(lines[0] == "generation,best_fitness,avg_fitness");
    REQUIRE(lines[1].rfind("2,", 0) == 0);
    REQUIRE(lines[2].rfind("4,", 0) == 0);
    REQUIRE(lines[3].rfind("6,", 0) == 0);
}
