#pragma once

#include <memory>
#include <optional>
#include <random>
#include <vector>
#include "ga/individual.h"
#include "problem/direction.h"
#include "problem/problem_instance.h"

namespace segmentation {

/**
 * Weights of the fitness terms
 *
 *   fitness = edge_value * E - deviation * D - connectivity * C - (degenerate ? degenerate_penalty : 0)
 */
struct FitnessWeights {
    float edge_value = 1.0f;          // Reward for color difference across segment boundaries
    float deviation = 1.0f;           // Penalty for color spread inside segments
    float connectivity = 0.1f;        // Penalty for boundary length
    float degenerate_penalty = 1.0f;  // Penalty for one segment, or one segment per pixel
};

/**
 * Decoded partition: segment label of every pixel
 * Labels run from 0 to segment_count - 1 in order of discovery.
 */
struct SegmentMap {
    std::vector<int> labels;
    int segment_count = 0;
};

/**
 * Fitness terms of one individual
 */
struct FitnessBreakdown {
    float edge_value = 0.0f;     // Boundary edge weight sum / graph edge count
    float deviation = 0.0f;      // Mean HSB distance to the segment centroid
    float connectivity = 0.0f;   // Boundary edges / graph edge count
    bool degenerate = false;
    int segment_count = 0;
    float fitness = 0.0f;
};

/**
 * SegmentationIndividual - Genome encoding an image segmentation
 *
 * Every pixel stores a Direction pointing at one of its 4-connected
 * neighbours (or NONE). Following the links from any pixel ends at a root
 * or closes a cycle; all pixels draining into the same terminal form one
 * segment.
 *
 * The segment map and fitness are computed on first use and cached until
 * the direction array changes. Caches are per instance, so different
 * individuals can be evaluated from different threads.
 */
class SegmentationIndividual : public ga::Individual {
public:
    using Direction = problem::Direction;
    using ProblemInstancePtr = std::shared_ptr<const problem::ProblemInstance>;

    /**
     * Create an individual from an explicit direction array
     * @throws std::invalid_argument if problem is null
     * @throws core::IncompatibleGenome if directions.size() != pixel count
     * @throws core::NoSuchEdge if a direction does not follow a graph edge
     */
    SegmentationIndividual(ProblemInstancePtr problem,
                           std::vector<Direction> directions,
                           const FitnessWeights& weights = FitnessWeights());

    /**
     * Create an individual whose pixels each point at a random in-bounds neighbour
     */
    static std::unique_ptr<SegmentationIndividual> create_random_individual(
        ProblemInstancePtr problem,
        std::mt19937& rng,
        const FitnessWeights& weights = FitnessWeights());

    float get_fitness() const override;
    void mutate(std::mt19937& rng, float mutation_rate) override;
    std::unique_ptr<ga::Individual> crossover(const ga::Individual& parent_b, std::mt19937& rng) const override;
    std::unique_ptr<ga::Individual> copy() const override;
    bool is_compatible(const ga::Individual& other) const override;

    /**
     * Decode the direction array into segments (cached)
     */
    const SegmentMap& get_segments() const;

    /**
     * Get the individual fitness terms (cached)
     */
    const FitnessBreakdown& get_fitness_breakdown() const;

    const std::vector<Direction>& get_directions() const { return directions_; }

    /**
     * Replace the direction of one pixel
     * @throws core::OutOfRange for a bad pixel index
     * @throws core::NoSuchEdge if the direction leads off the grid
     */
    void set_direction(int pixel, Direction direction);

    const FitnessWeights& get_fitness_weights() const { return weights_; }
    const problem::ProblemInstance& get_problem_instance() const { return *problem_; }
    const ProblemInstancePtr& shared_problem_instance() const { return problem_; }

private:
    void validate_direction(int pixel, Direction direction) const;
    void invalidate_cache();
    SegmentMap decode() const;
    FitnessBreakdown evaluate(const SegmentMap& segments) const;

    ProblemInstancePtr problem_;
    std::vector<Direction> directions_;
    FitnessWeights weights_;

    mutable std::optional<SegmentMap> segments_;
    mutable std::optional<FitnessBreakdown> fitness_;
};

} // namespace segmentation
