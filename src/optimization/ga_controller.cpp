#include "optimization/ga_controller.h"
#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace optimization {

GAController::GAController(ga::GeneticAlgorithm& algorithm,
                           const StoppingPolicy& policy,
                           const LogSettings& log_settings,
                           ProgressCallback progress_callback)
    : algorithm_(algorithm)
    , policy_(policy)
    , log_settings_(log_settings)
    , progress_callback_(std::move(progress_callback)) {
    if (log_settings_.log_interval < 1) {
        log_settings_.log_interval = 1;
    }
}

GAController::RunSummary GAController::run() {
    if (policy_.generation_limit < 0) {
        throw std::invalid_argument("GAController: generation limit must not be negative");
    }

    is_running_ = true;
    should_stop_ = false;
    stagnation_counter_ = 0;

    const bool verbose = log_settings_.verbosity >= 2;
    if (verbose) {
        std::cout << "=======================================" << std::endl;
        std::cout << "Genetic Segmentation" << std::endl;
        std::cout << "=======================================" << std::endl;
        std::cout << "Generations: " << policy_.generation_limit << std::endl;
        if (policy_.stagnation_limit > 0) {
            std::cout << "Stagnation limit: " << policy_.stagnation_limit << std::endl;
        }
        if (policy_.target_fitness) {
            std::cout << "Target fitness: " << *policy_.target_fitness << std::endl;
        }
        std::cout << "=======================================" << std::endl;
    }

    RunSummary summary;
    try {
        if (algorithm_.get_state() == ga::GeneticAlgorithm::State::UNINITIALIZED) {
            algorithm_.initialize();
        }

        float best_fitness = algorithm_.get_population().get_fittest_individual().get_fitness();
        best_fitness_ = best_fitness;
        current_generation_ = algorithm_.get_generation();

        std::ofstream log_file;
        if (!log_settings_.log_file.empty()) {
            log_file.open(log_settings_.log_file);
            if (!log_file) {
                if (log_settings_.verbosity >= 1) {
                    std::cerr << "GAController: Could not open log file " << log_settings_.log_file << std::endl;
                }
            } else {
                log_file << "generation,best_fitness,avg_fitness" << std::endl;
            }
        }

        int generations_run = 0;
        summary.stop_reason = check_stopping_criteria(generations_run);
        while (summary.stop_reason.empty()) {
            algorithm_.step();
            ++generations_run;
            current_generation_ = algorithm_.get_generation();

            float generation_best = algorithm_.get_population().get_fittest_individual().get_fitness();
            if (generation_best > best_fitness + 1e-6f) {
                best_fitness = generation_best;
                stagnation_counter_ = 0;
            } else {
                best_fitness = std::max(best_fitness, generation_best);
                ++stagnation_counter_;
            }
            best_fitness_ = best_fitness;

            if (log_file.is_open() && algorithm_.get_generation() % log_settings_.log_interval == 0) {
                log_generation(log_file, best_fitness);
            }

            if (progress_callback_) {
                progress_callback_(algorithm_.get_generation(), best_fitness);
            }

            summary.stop_reason = check_stopping_criteria(generations_run);
        }

        algorithm_.terminate();
        summary.generations = algorithm_.get_generation();
        summary.best_fitness = best_fitness;
    } catch (const std::exception&) {
        is_running_ = false;
        throw;
    }

    if (verbose) {
        std::cout << "=======================================" << std::endl;
        std::cout << "Optimization Complete: " << summary.stop_reason << std::endl;
        std::cout << "Generations: " << summary.generations << std::endl;
        std::cout << "Best fitness: " << std::fixed << std::setprecision(6) << summary.best_fitness << std::endl;
        std::cout << "=======================================" << std::endl;
    }

    is_running_ = false;
    return summary;
}

void GAController::stop() {
    should_stop_ = true;
}

std::string GAController::check_stopping_criteria(int generations_run) const {
    if (should_stop_) {
        return "stopped by user";
    }
    if (policy_.target_fitness && best_fitness_ >= *policy_.target_fitness) {
        return "target fitness reached";
    }
    if (policy_.stagnation_limit > 0 && stagnation_counter_ >= policy_.stagnation_limit) {
        return "stagnation limit reached";
    }
    if (generations_run >= policy_.generation_limit) {
        return "generation limit reached";
    }
    return "";
}

void GAController::log_generation(std::ofstream& log_file, float best_fitness) const {
    log_file << algorithm_.get_generation() << ","
             << best_fitness << ","
             << algorithm_.get_population().get_average_fitness() << std::endl;
}

} // namespace optimization
