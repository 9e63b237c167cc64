#ifndef GA_GENETIC_ALGORITHM_H
#define GA_GENETIC_ALGORITHM_H

#include <memory>
#include <string>
#include <vector>
#include "ga/individual.h"
#include "ga/population.h"

namespace ga {

/**
 * @brief Generic genetic algorithm engine
 *
 * Drives the population lifecycle through a small state machine:
 *
 *   UNINITIALIZED --initialize()--> INITIALIZED --step()--> EVOLVING --step()--> ...
 *                                                    any --terminate()/failure--> TERMINATED
 *
 * One step() is one generation: create_offspring(), insert_offspring(),
 * print_state(). Problem-specific policies are supplied by the subclass.
 * Stopping is decided by the caller; the engine can be stepped any number
 * of times.
 */
class GeneticAlgorithm {
public:
    enum class State {
        UNINITIALIZED,
        INITIALIZED,
        EVOLVING,
        TERMINATED
    };

    GeneticAlgorithm() = default;
    virtual ~GeneticAlgorithm() = default;

    GeneticAlgorithm(const GeneticAlgorithm&) = delete;
    GeneticAlgorithm& operator=(const GeneticAlgorithm&) = delete;

    /**
     * @brief Build the initial population
     * @throws std::logic_error unless the engine is UNINITIALIZED
     */
    void initialize();

    /**
     * @brief Run one generation
     *
     * Any exception thrown by the policies terminates the run and is
     * propagated to the caller.
     * @throws std::logic_error unless the engine is INITIALIZED or EVOLVING
     */
    void step();

    /**
     * @brief Mark the run as finished
     */
    void terminate() { state_ = State::TERMINATED; }

    State get_state() const { return state_; }

    /**
     * @brief Number of completed generations
     */
    int get_generation() const { return generation_; }

    /**
     * @throws std::logic_error before initialize()
     */
    Population& get_population();
    const Population& get_population() const;

protected:
    /**
     * @brief Create the first generation
     */
    virtual Population create_initial_population() = 0;

    /**
     * @brief Derive candidate offspring from the current population
     */
    virtual std::vector<std::unique_ptr<Individual>> create_offspring() = 0;

    /**
     * @brief Merge offspring into the current population (replacement policy)
     */
    virtual void insert_offspring(std::vector<std::unique_ptr<Individual>> offspring) = 0;

    /**
     * @brief Report progress after a generation
     */
    virtual void print_state() const = 0;

private:
    State state_ = State::UNINITIALIZED;
    int generation_ = 0;
    std::unique_ptr<Population> population_;
};

std::string to_string(GeneticAlgorithm::State state);

} // namespace ga

#endif // GA_GENETIC_ALGORITHM_H
