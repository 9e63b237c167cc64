#ifndef GA_CONTROLLER_H
#define GA_CONTROLLER_H

#include <atomic>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include "ga/genetic_algorithm.h"

namespace optimization {

/**
 * @brief Genetic algorithm run controller
 *
 * Owns the stopping policy of a run (generation limit, stagnation, target
 * fitness), which the engine itself does not have. Steps the engine one
 * generation at a time, tracks the best fitness, writes a CSV progress log
 * and reports progress through an optional callback.
 *
 * stop() may be called from any thread; the run ends after the current
 * generation.
 */
class GAController {
public:
    struct StoppingPolicy {
        int generation_limit = 100;            // Generations to run
        int stagnation_limit = 0;              // Stop after N generations without improvement (0 = off)
        std::optional<float> target_fitness;   // Stop once the best fitness reaches this
    };

    struct LogSettings {
        LogSettings() {}
        int log_interval = 1;                  // Log every N generations
        std::string log_file;                  // CSV progress log (empty = none)
        int verbosity = 2;
    };

    struct RunSummary {
        int generations = 0;                   // Generations completed by the engine
        float best_fitness = 0.0f;
        std::string stop_reason;
    };

    /**
     * Progress callback, called after every generation
     */
    using ProgressCallback = std::function<void(int generation, float best_fitness)>;

    GAController(ga::GeneticAlgorithm& algorithm,
                 const StoppingPolicy& policy,
                 const LogSettings& log_settings = LogSettings(),
                 ProgressCallback progress_callback = nullptr);

    /**
     * @brief Run until the stopping policy or stop() ends it (blocking)
     *
     * Initializes the engine if needed and terminates it at the end.
     * Engine failures propagate to the caller.
     * @throws std::invalid_argument if the generation limit is negative
     */
    RunSummary run();

    /**
     * @brief Request the run to end after the current generation (thread-safe)
     */
    void stop();

    bool is_running() const { return is_running_; }
    int get_current_generation() const { return current_generation_; }
    float get_best_fitness() const { return best_fitness_; }

private:
    void log_generation(std::ofstream& log_file, float best_fitness) const;
    std::string check_stopping_criteria(int generations_run) const;

    ga::GeneticAlgorithm& algorithm_;
    StoppingPolicy policy_;
    LogSettings log_settings_;
    ProgressCallback progress_callback_;

    std::atomic<bool> is_running_{false};
    std::atomic<bool> should_stop_{false};
    std::atomic<int> current_generation_{0};
    std::atomic<float> best_fitness_{0.0f};
    int stagnation_counter_ = 0;
};

} // namespace optimization

#endif // GA_CONTROLLER_H
