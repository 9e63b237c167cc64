#include "segmentation/segmentation_individual.h"
#include "core/errors.h"
#include "problem/color_distance.h"
#include <algorithm>
#include <stdexcept>
#include <string>

using namespace std;
using problem::Direction;

namespace segmentation {

// ============================================================================
// Construction
// ============================================================================

SegmentationIndividual::SegmentationIndividual(ProblemInstancePtr problem,
                                               vector<Direction> directions,
                                               const FitnessWeights& weights)
    : problem_(move(problem))
    , directions_(move(directions))
    , weights_(weights)
{
    if (!problem_) {
        throw invalid_argument("SegmentationIndividual: null problem instance");
    }
    if (static_cast<int>(directions_.size()) != problem_->get_pixel_count()) {
        throw core::IncompatibleGenome("SegmentationIndividual: genome has " +
                                       std::to_string(directions_.size()) + " genes, image has " +
                                       std::to_string(problem_->get_pixel_count()) + " pixels");
    }
    for (int i = 0; i < static_cast<int>(directions_.size()); ++i) {
        validate_direction(i, directions_[i]);
    }
}

unique_ptr<SegmentationIndividual> SegmentationIndividual::create_random_individual(
    ProblemInstancePtr problem,
    mt19937& rng,
    const FitnessWeights& weights)
{
    if (!problem) {
        throw invalid_argument("SegmentationIndividual: null problem instance");
    }

    int n = problem->get_pixel_count();
    vector<Direction> directions(n, Direction::NONE);
    for (int i = 0; i < n; ++i) {
        vector<Direction> choices = problem->get_valid_directions(i);
        if (choices.empty()) {
            continue;  // Single-pixel image: nowhere to point
        }
        uniform_int_distribution<size_t> pick(0, choices.size() - 1);
        directions[i] = choices[pick(rng)];
    }

    return make_unique<SegmentationIndividual>(move(problem), move(directions), weights);
}

void SegmentationIndividual::validate_direction(int pixel, Direction direction) const {
    if (direction == Direction::NONE) {
        problem_->pixel_index_to_pos(pixel);  // Range check only
        return;
    }
    try {
        problem_->get_neighbor(pixel, direction);
    } catch (const core::OutOfRange&) {
        if (pixel < 0 || pixel >= problem_->get_pixel_count()) {
            throw;
        }
        throw core::NoSuchEdge("SegmentationIndividual: pixel " + std::to_string(pixel) +
                               " points " + problem::to_string(direction) + " off the grid");
    }
}

void SegmentationIndividual::set_direction(int pixel, Direction direction) {
    validate_direction(pixel, direction);
    if (directions_[pixel] != direction) {
        directions_[pixel] = direction;
        invalidate_cache();
    }
}

void SegmentationIndividual::invalidate_cache() {
    segments_.reset();
    fitness_.reset();
}

// ============================================================================
// Genetic Operators
// ============================================================================

void SegmentationIndividual::mutate(mt19937& rng, float mutation_rate) {
    if (!(mutation_rate >= 0.0f && mutation_rate <= 1.0f)) {
        throw invalid_argument("SegmentationIndividual: mutation rate must be in [0, 1]");
    }

    bernoulli_distribution mutate_dist(mutation_rate);
    bool changed = false;

    for (int i = 0; i < static_cast<int>(directions_.size()); ++i) {
        if (!mutate_dist(rng)) {
            continue;
        }

        // Any other in-bounds direction
        vector<Direction> choices = problem_->get_valid_directions(i);
        choices.erase(remove(choices.begin(), choices.end(), directions_[i]), choices.end());
        if (choices.empty()) {
            continue;
        }

        uniform_int_distribution<size_t> pick(0, choices.size() - 1);
        directions_[i] = choices[pick(rng)];
        changed = true;
    }

    if (changed) {
        invalidate_cache();
    }
}

unique_ptr<ga::Individual> SegmentationIndividual::crossover(const ga::Individual& parent_b, mt19937& rng) const {
    if (!is_compatible(parent_b)) {
        throw core::IncompatibleGenome("SegmentationIndividual: crossover partner was built over a different problem instance");
    }
    const auto& other = static_cast<const SegmentationIndividual&>(parent_b);

    // Uniform crossover - pick each gene from either parent
    bernoulli_distribution coin_flip(0.5);
    vector<Direction> child(directions_.size());
    for (size_t i = 0; i < directions_.size(); ++i) {
        child[i] = coin_flip(rng) ? directions_[i] : other.directions_[i];
    }

    return make_unique<SegmentationIndividual>(problem_, move(child), weights_);
}

unique_ptr<ga::Individual> SegmentationIndividual::copy() const {
    return make_unique<SegmentationIndividual>(*this);
}

bool SegmentationIndividual::is_compatible(const ga::Individual& other) const {
    const auto* segmentation_other = dynamic_cast<const SegmentationIndividual*>(&other);
    return segmentation_other != nullptr && segmentation_other->problem_ == problem_;
}

// ============================================================================
// Decoding and Fitness
// ============================================================================

const SegmentMap& SegmentationIndividual::get_segments() const {
    if (!segments_) {
        segments_ = decode();
    }
    return *segments_;
}

const FitnessBreakdown& SegmentationIndividual::get_fitness_breakdown() const {
    if (!fitness_) {
        fitness_ = evaluate(get_segments());
    }
    return *fitness_;
}

float SegmentationIndividual::get_fitness() const {
    return get_fitness_breakdown().fitness;
}

SegmentMap SegmentationIndividual::decode() const {
    enum : unsigned char { UNVISITED = 0, ON_PATH = 1, DONE = 2 };

    const int n = static_cast<int>(directions_.size());
    SegmentMap result;
    result.labels.assign(n, -1);

    vector<unsigned char> state(n, UNVISITED);
    vector<int> path;
    path.reserve(64);

    for (int start = 0; start < n; ++start) {
        if (state[start] == DONE) {
            continue;
        }

        // Walk the links until a root, a cycle, or an already labelled pixel
        path.clear();
        int current = start;
        int label = -1;
        while (true) {
            if (state[current] == DONE) {
                label = result.labels[current];
                break;
            }
            if (state[current] == ON_PATH) {
                label = result.segment_count++;  // Cycle closes a new segment
                break;
            }

            state[current] = ON_PATH;
            path.push_back(current);

            int next = problem_->get_neighbor(current, directions_[current]);
            if (next < 0) {
                label = result.segment_count++;  // Root
                break;
            }
            current = next;
        }

        for (int pixel : path) {
            result.labels[pixel] = label;
            state[pixel] = DONE;
        }
    }

    return result;
}

FitnessBreakdown SegmentationIndividual::evaluate(const SegmentMap& segments) const {
    const problem::ProblemInstance& instance = *problem_;
    const graph::PixelGraph& graph = instance.get_euclidean_distance_graph();
    const int n = instance.get_pixel_count();

    FitnessBreakdown result;
    result.segment_count = segments.segment_count;

    // Deviation: mean distance of each pixel to its segment centroid (HSB)
    vector<cv::Vec3f> centroids(segments.segment_count, cv::Vec3f(0.0f, 0.0f, 0.0f));
    vector<int> sizes(segments.segment_count, 0);
    for (int i = 0; i < n; ++i) {
        int label = segments.labels[i];
        centroids[label] += instance.get_hsb(i);
        ++sizes[label];
    }
    for (int s = 0; s < segments.segment_count; ++s) {
        centroids[s] *= 1.0f / static_cast<float>(sizes[s]);
    }

    double deviation_sum = 0.0;
    for (int i = 0; i < n; ++i) {
        deviation_sum += problem::euclidean_distance(instance.get_hsb(i), centroids[segments.labels[i]]);
    }
    result.deviation = n > 0 ? static_cast<float>(deviation_sum / n) : 0.0f;

    // Edge value and connectivity over the pixel graph, each edge once
    size_t edge_count = 0;
    size_t boundary_count = 0;
    double boundary_weight = 0.0;
    for (int i = 0; i < n; ++i) {
        for (const auto& neighbor : graph.neighbors(i)) {
            int j = neighbor.first;
            if (j <= i) {
                continue;
            }
            ++edge_count;
            if (segments.labels[i] != segments.labels[j]) {
                ++boundary_count;
                boundary_weight += neighbor.second;
            }
        }
    }
    if (edge_count > 0) {
        result.edge_value = static_cast<float>(boundary_weight / edge_count);
        result.connectivity = static_cast<float>(boundary_count) / static_cast<float>(edge_count);
    }

    result.degenerate = segments.segment_count <= 1 || segments.segment_count >= n;

    result.fitness = weights_.edge_value * result.edge_value
                   - weights_.deviation * result.deviation
                   - weights_.connectivity * result.connectivity
                   - (result.degenerate ? weights_.degenerate_penalty : 0.0f);

    return result;
}

} // namespace segmentation
