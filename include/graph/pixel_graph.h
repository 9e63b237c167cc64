#pragma once

#include <boost/graph/adjacency_list.hpp>
#include <cstddef>
#include <utility>
#include <vector>

namespace graph {

/**
 * Undirected weighted graph over the pixels of an image
 *
 * Nodes are flattened pixel indices (y * width + x). Edges connect
 * 4-adjacent pixels and carry a non-negative color distance. The edge set
 * is filled once while the problem instance is built and is read-only
 * afterwards, so concurrent readers are safe.
 */
class PixelGraph {
public:
    // Bundled edge property is the weight
    using Graph = boost::adjacency_list<boost::vecS, boost::vecS, boost::undirectedS,
                                        boost::no_property, float>;
    using Vertex = Graph::vertex_descriptor;
    using Edge = Graph::edge_descriptor;

    /**
     * Create a graph with a fixed number of nodes and no edges
     * @param node_count Number of nodes (pixels)
     */
    explicit PixelGraph(int node_count);

    /**
     * Register an undirected edge, overwriting the weight if it exists
     * @param i First node index
     * @param j Second node index
     * @param weight Non-negative edge weight
     * @throws core::InvalidIndex if i or j is outside [0, node_count)
     */
    void add_connection(int i, int j, float weight);

    /**
     * Get all nodes connected to i with their edge weights
     * Order is the order in which the edges were first added.
     */
    std::vector<std::pair<int, float>> neighbors(int i) const;

    /**
     * Get the weight of the edge between i and j
     * @throws core::NoSuchEdge if i and j are not connected
     */
    float weight(int i, int j) const;

    bool has_connection(int i, int j) const;

    int get_node_count() const { return node_count_; }
    std::size_t get_edge_count() const { return boost::num_edges(graph_); }

private:
    void check_index(int i) const;

    int node_count_;
    Graph graph_;
};

} // namespace graph
