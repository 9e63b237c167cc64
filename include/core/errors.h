#pragma once

#include <stdexcept>
#include <string>

namespace core {

/**
 * Failures raised by the segmentation core
 *
 * None of these are transient: each one signals a broken invariant
 * (mismatched problem instances, corrupted direction arrays, bad indices)
 * and is propagated to the caller without retry.
 */

// Pixel or node index outside [0, node_count)
class InvalidIndex : public std::out_of_range {
public:
    explicit InvalidIndex(const std::string& what) : std::out_of_range(what) {}
};

// Pixel position outside the image grid
class OutOfRange : public std::out_of_range {
public:
    explicit OutOfRange(const std::string& what) : std::out_of_range(what) {}
};

// Graph query for a pair of nodes that are not connected
class NoSuchEdge : public std::invalid_argument {
public:
    explicit NoSuchEdge(const std::string& what) : std::invalid_argument(what) {}
};

// Genomes built over different problem instances were mixed
class IncompatibleGenome : public std::invalid_argument {
public:
    explicit IncompatibleGenome(const std::string& what) : std::invalid_argument(what) {}
};

// Query that needs at least one individual ran on an empty population
class EmptyPopulation : public std::logic_error {
public:
    explicit EmptyPopulation(const std::string& what) : std::logic_error(what) {}
};

} // namespace core
