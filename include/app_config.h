#pragma once

#include <istream>
#include <optional>
#include <string>
#include <opencv2/core.hpp>

/**
 * AppConfig - Application configuration management
 *
 * Manages all configurable parameters of the segmentation application:
 * - Input image and scaling
 * - Genetic algorithm parameters (population, rates, stopping policy)
 * - Fitness weights
 * - Output files (overlay image, CSV progress log)
 * - Debug verbosity
 *
 * Configuration is loaded from segmentation_config.ini in the working directory.
 * Lines starting with '#' or ';' are comments; sections are [Name]; values
 * are "key = value".
 *
 * NAMING CONVENTION:
 * - _rgb = RGB color (0-255, 0-255, 0-255)
 * - No suffix = unitless (ratios, counts, flags)
 */
class AppConfig {
public:
    // Input image settings
    struct ImageSettings {
        std::string input_path;          // Image to segment (may be given on the command line)
        float scaling = 1.0f;            // Resize factor applied before segmentation (1 = none)
    };

    // Genetic Algorithm settings
    struct GeneticAlgorithmSettings {
        int population_size = 30;        // Number of genomes per generation
        int generation_limit = 100;      // Number of generations to evolve
        float mutation_rate = 0.01f;     // Probability of mutating each pixel
        float crossover_rate = 0.7f;     // Probability of crossover vs cloning
        float elite_fraction = 0.1f;     // Fraction of top performers to preserve
        int tournament_size = 3;         // Contestants per parent selection
        int evaluation_threads = 1;      // Threads for fitness evaluation
        unsigned int seed = 0;           // Random seed (0 = nondeterministic)
        int stagnation_limit = 0;        // Stop if no improvement for N generations (0 = off)
        std::optional<float> target_fitness;  // Stop once reached (unset = off)
    };

    // Fitness weights
    struct FitnessSettings {
        float edge_value_weight = 1.0f;      // Reward for color difference across boundaries
        float deviation_weight = 1.0f;       // Penalty for color spread inside segments
        float connectivity_weight = 0.1f;    // Penalty for boundary length
        float degenerate_penalty = 1.0f;     // Penalty for one segment or one segment per pixel
    };

    // Output settings
    struct OutputSettings {
        std::string output_image;                                  // Boundary overlay (empty = none)
        cv::Scalar boundary_color_rgb = cv::Scalar(0, 255, 0);     // Green boundaries
        std::string log_file;                                      // CSV progress log (empty = none)
        int log_interval = 1;                                      // Log every N generations
    };

    // Debug output settings
    struct DebugSettings {
        int verbosity = 2;  // Debug verbosity level:
                            // 0 = Silent (no debug output)
                            // 1 = Errors only (critical failures)
                            // 2 = Warnings + Important info (run summary, one line per generation)
                            // 3 = Info (population initialization)
                            // 4 = Verbose (fitness terms of the best individual)
    };

    AppConfig();
    ~AppConfig();

    // Load configuration from file (returns true if successful)
    bool load(const std::string& filename = "segmentation_config.ini");

    // Load configuration from any stream (returns the number of rejected entries)
    int load_from_stream(std::istream& input);

    // Accessors
    ImageSettings& image_settings() { return image_settings_; }
    const ImageSettings& image_settings() const { return image_settings_; }

    GeneticAlgorithmSettings& ga_settings() { return ga_settings_; }
    const GeneticAlgorithmSettings& ga_settings() const { return ga_settings_; }

    FitnessSettings& fitness_settings() { return fitness_settings_; }
    const FitnessSettings& fitness_settings() const { return fitness_settings_; }

    OutputSettings& output_settings() { return output_settings_; }
    const OutputSettings& output_settings() const { return output_settings_; }

    DebugSettings& debug_settings() { return debug_settings_; }
    const DebugSettings& debug_settings() const { return debug_settings_; }

private:
    // Helper function to parse RGB color from "R, G, B" string
    cv::Scalar parse_rgb(const std::string& value);

    // Apply one key of a section, false if the key is unknown or the value invalid
    bool apply(const std::string& section, const std::string& key, const std::string& value);

    ImageSettings image_settings_;
    GeneticAlgorithmSettings ga_settings_;
    FitnessSettings fitness_settings_;
    OutputSettings output_settings_;
    DebugSettings debug_settings_;
};
