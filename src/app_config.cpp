#include "app_config.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

std::string trim(const std::string& s) {
    const char* whitespace = " \t\r\n";
    size_t start = s.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

bool parse_int(const std::string& value, int& out) {
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != value.size()) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parse_unsigned(const std::string& value, unsigned int& out) {
    if (value.empty() || value[0] == '-') {
        return false;
    }
    try {
        size_t pos = 0;
        unsigned long parsed = std::stoul(value, &pos);
        if (pos != value.size() || parsed > 0xFFFFFFFFul) {
            return false;
        }
        out = static_cast<unsigned int>(parsed);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parse_float(const std::string& value, float& out) {
    try {
        size_t pos = 0;
        float parsed = std::stof(value, &pos);
        if (pos != value.size()) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

AppConfig::AppConfig() = default;
AppConfig::~AppConfig() = default;

bool AppConfig::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    int rejected = load_from_stream(file);
    if (rejected > 0) {
        std::cerr << "AppConfig: " << rejected << " entries in " << filename
                  << " were ignored" << std::endl;
    }
    std::cout << "Configuration loaded from " << filename << std::endl;
    return true;
}

int AppConfig::load_from_stream(std::istream& input) {
    std::string line;
    std::string section;
    int line_number = 0;
    int rejected = 0;

    while (std::getline(input, line)) {
        ++line_number;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line.front() == '[') {
            if (line.back() != ']') {
                std::cerr << "AppConfig: Malformed section header on line " << line_number
                          << ": " << line << std::endl;
                ++rejected;
                continue;
            }
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "AppConfig: Expected key = value on line " << line_number
                      << ": " << line << std::endl;
            ++rejected;
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (!apply(section, key, value)) {
            std::cerr << "AppConfig: Ignoring [" << section << "] " << key << " = '" << value
                      << "' on line " << line_number << ", keeping default" << std::endl;
            ++rejected;
        }
    }

    return rejected;
}

bool AppConfig::apply(const std::string& section, const std::string& key, const std::string& value) {
    if (section == "Image") {
        if (key == "input_path") { image_settings_.input_path = value; return true; }
        if (key == "scaling") return parse_float(value, image_settings_.scaling);
    }
    else if (section == "GeneticAlgorithm") {
        auto& ga = ga_settings_;
        if (key == "population_size") return parse_int(value, ga.population_size);
        if (key == "generation_limit") return parse_int(value, ga.generation_limit);
        if (key == "mutation_rate") return parse_float(value, ga.mutation_rate);
        if (key == "crossover_rate") return parse_float(value, ga.crossover_rate);
        if (key == "elite_fraction") return parse_float(value, ga.elite_fraction);
        if (key == "tournament_size") return parse_int(value, ga.tournament_size);
        if (key == "evaluation_threads") return parse_int(value, ga.evaluation_threads);
        if (key == "seed") return parse_unsigned(value, ga.seed);
        if (key == "stagnation_limit") return parse_int(value, ga.stagnation_limit);
        if (key == "target_fitness") {
            if (value.empty()) {
                ga.target_fitness.reset();
                return true;
            }
            float target = 0.0f;
            if (!parse_float(value, target)) {
                return false;
            }
            ga.target_fitness = target;
            return true;
        }
    }
    else if (section == "Fitness") {
        auto& fit = fitness_settings_;
        if (key == "edge_value_weight") return parse_float(value, fit.edge_value_weight);
        if (key == "deviation_weight") return parse_float(value, fit.deviation_weight);
        if (key == "connectivity_weight") return parse_float(value, fit.connectivity_weight);
        if (key == "degenerate_penalty") return parse_float(value, fit.degenerate_penalty);
    }
    else if (section == "Output") {
        auto& out = output_settings_;
        if (key == "output_image") { out.output_image = value; return true; }
        if (key == "log_file") { out.log_file = value; return true; }
        if (key == "log_interval") return parse_int(value, out.log_interval);
        if (key == "boundary_color_rgb") {
            try {
                out.boundary_color_rgb = parse_rgb(value);
                return true;
            } catch (const std::invalid_argument& e) {
                std::cerr << "AppConfig: " << e.what() << std::endl;
                return false;
            }
        }
    }
    else if (section == "Debug") {
        if (key == "verbosity") return parse_int(value, debug_settings_.verbosity);
    }

    // Unknown section or key
    return false;
}

cv::Scalar AppConfig::parse_rgb(const std::string& value) {
    std::stringstream ss(value);
    std::string item;
    int rgb[3];
    int count = 0;

    while (std::getline(ss, item, ',')) {
        if (count == 3) {
            throw std::invalid_argument("expected three color components in '" + value + "'");
        }
        int component = 0;
        if (!parse_int(trim(item), component) || component < 0 || component > 255) {
            throw std::invalid_argument("color component '" + trim(item) + "' outside 0-255");
        }
        rgb[count++] = component;
    }
    if (count != 3) {
        throw std::invalid_argument("expected three color components in '" + value + "'");
    }

    return cv::Scalar(rgb[0], rgb[1], rgb[2]);
}
