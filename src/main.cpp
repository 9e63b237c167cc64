#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <opencv2/imgcodecs.hpp>

#include "app_config.h"
#include "optimization/ga_controller.h"
#include "problem/problem_instance.h"
#include "segmentation/segment_renderer.h"
#include "segmentation/segmentation_genetic_algorithm.h"

namespace {

/**
 * Command line overrides of the configuration file
 */
struct CommandLine {
    std::string image_path;
    std::string config_path = "segmentation_config.ini";
    std::string output_path;
    int generations = -1;
    int population = -1;
    float scale = -1.0f;
    long long seed = -1;
    bool show_help = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <image> [options]\n"
              << "Options:\n"
              << "  --config FILE      Configuration file (default: segmentation_config.ini)\n"
              << "  --output FILE      Write the boundary overlay to FILE\n"
              << "  --generations N    Number of generations\n"
              << "  --population N     Population size\n"
              << "  --scale F          Image scaling before segmentation\n"
              << "  --seed N           Random seed (0 = nondeterministic)\n"
              << "  --help             Show this message" << std::endl;
}

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            cmd.show_help = true;
        } else if (arg == "--config") {
            cmd.config_path = next_value();
        } else if (arg == "--output") {
            cmd.output_path = next_value();
        } else if (arg == "--generations") {
            cmd.generations = std::stoi(next_value());
        } else if (arg == "--population") {
            cmd.population = std::stoi(next_value());
        } else if (arg == "--scale") {
            cmd.scale = std::stof(next_value());
        } else if (arg == "--seed") {
            cmd.seed = std::stoll(next_value());
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("unknown option " + arg);
        } else if (cmd.image_path.empty()) {
            cmd.image_path = arg;
        } else {
            throw std::invalid_argument("unexpected argument " + arg);
        }
    }
    return cmd;
}

} // namespace

/**
 * Main application
 */
int main(int argc, char* argv[]) {
    try {
        CommandLine cmd = parse_command_line(argc, argv);
        if (cmd.show_help) {
            print_usage(argv[0]);
            return 0;
        }

        // Load configuration
        AppConfig config;
        if (!config.load(cmd.config_path)) {
            std::cerr << "Warning: Could not load config file " << cmd.config_path
                      << ", using defaults" << std::endl;
        }

        // Command line overrides
        auto& image_cfg = config.image_settings();
        auto& ga_cfg = config.ga_settings();
        auto& fitness_cfg = config.fitness_settings();
        auto& output_cfg = config.output_settings();
        int verbosity = config.debug_settings().verbosity;

        if (!cmd.image_path.empty()) image_cfg.input_path = cmd.image_path;
        if (!cmd.output_path.empty()) output_cfg.output_image = cmd.output_path;
        if (cmd.generations >= 0) ga_cfg.generation_limit = cmd.generations;
        if (cmd.population >= 0) ga_cfg.population_size = cmd.population;
        if (cmd.scale >= 0.0f) image_cfg.scaling = cmd.scale;
        if (cmd.seed >= 0) ga_cfg.seed = static_cast<unsigned int>(cmd.seed);

        if (image_cfg.input_path.empty()) {
            print_usage(argv[0]);
            return 1;
        }

        // Load image
        cv::Mat image = cv::imread(image_cfg.input_path, cv::IMREAD_COLOR);
        if (image.empty()) {
            std::cerr << "ERROR: Could not read image " << image_cfg.input_path << std::endl;
            return 1;
        }

        auto instance = std::make_shared<const problem::ProblemInstance>(
            image_cfg.input_path, image, image_cfg.scaling);
        if (verbosity >= 2) {
            std::cout << "Image: " << instance->get_name() << " ("
                      << instance->get_original_width() << "x" << instance->get_original_height()
                      << "), working size " << instance->get_width() << "x" << instance->get_height()
                      << std::endl;
        }

        // Build the engine
        segmentation::SegmentationGeneticAlgorithm::Params params;
        params.population_size = ga_cfg.population_size;
        params.mutation_rate = ga_cfg.mutation_rate;
        params.crossover_rate = ga_cfg.crossover_rate;
        params.elite_fraction = ga_cfg.elite_fraction;
        params.tournament_size = ga_cfg.tournament_size;
        params.evaluation_threads = ga_cfg.evaluation_threads;
        params.seed = ga_cfg.seed;
        params.verbosity = verbosity;
        params.fitness_weights.edge_value = fitness_cfg.edge_value_weight;
        params.fitness_weights.deviation = fitness_cfg.deviation_weight;
        params.fitness_weights.connectivity = fitness_cfg.connectivity_weight;
        params.fitness_weights.degenerate_penalty = fitness_cfg.degenerate_penalty;

        segmentation::SegmentationGeneticAlgorithm algorithm(instance, params);

        optimization::GAController::StoppingPolicy policy;
        policy.generation_limit = ga_cfg.generation_limit;
        policy.stagnation_limit = ga_cfg.stagnation_limit;
        policy.target_fitness = ga_cfg.target_fitness;

        optimization::GAController::LogSettings log_settings;
        log_settings.log_file = output_cfg.log_file;
        log_settings.log_interval = output_cfg.log_interval;
        log_settings.verbosity = verbosity;

        optimization::GAController controller(algorithm, policy, log_settings);
        optimization::GAController::RunSummary summary = controller.run();

        const segmentation::SegmentationIndividual& best = algorithm.get_fittest_segmentation();
        std::cout << "Best fitness: " << std::fixed << std::setprecision(6) << best.get_fitness()
                  << " (" << best.get_segments().segment_count << " segments, "
                  << summary.generations << " generations)" << std::endl;

        // Boundary overlay
        if (!output_cfg.output_image.empty()) {
            const cv::Scalar& rgb = output_cfg.boundary_color_rgb;
            cv::Scalar bgr(rgb[2], rgb[1], rgb[0]);
            cv::Mat overlay = segmentation::render_boundary_overlay(best, bgr);
            if (!cv::imwrite(output_cfg.output_image, overlay)) {
                std::cerr << "ERROR: Could not write " << output_cfg.output_image << std::endl;
                return 1;
            }
            std::cout << "Segmentation written to " << output_cfg.output_image << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
