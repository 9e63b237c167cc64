#include "graph/pixel_graph.h"
#include "core/errors.h"
#include <stdexcept>
#include <string>

namespace graph {

PixelGraph::PixelGraph(int node_count)
    : node_count_(node_count), graph_(node_count > 0 ? node_count : 0) {
    if (node_count < 0) {
        throw std::invalid_argument("PixelGraph: negative node count");
    }
}

void PixelGraph::check_index(int i) const {
    if (i < 0 || i >= node_count_) {
        throw core::InvalidIndex("PixelGraph: node " + std::to_string(i) +
                                 " outside [0, " + std::to_string(node_count_) + ")");
    }
}

void PixelGraph::add_connection(int i, int j, float weight) {
    check_index(i);
    check_index(j);
    if (weight < 0.0f) {
        throw std::invalid_argument("PixelGraph: negative weight between " +
                                    std::to_string(i) + " and " + std::to_string(j));
    }

    auto existing = boost::edge(static_cast<Vertex>(i), static_cast<Vertex>(j), graph_);
    if (existing.second) {
        graph_[existing.first] = weight;  // Last write wins
        return;
    }
    boost::add_edge(static_cast<Vertex>(i), static_cast<Vertex>(j), weight, graph_);
}

std::vector<std::pair<int, float>> PixelGraph::neighbors(int i) const {
    check_index(i);

    std::vector<std::pair<int, float>> result;
    result.reserve(boost::out_degree(static_cast<Vertex>(i), graph_));

    auto range = boost::out_edges(static_cast<Vertex>(i), graph_);
    for (auto it = range.first; it != range.second; ++it) {
        result.emplace_back(static_cast<int>(boost::target(*it, graph_)), graph_[*it]);
    }
    return result;
}

float PixelGraph::weight(int i, int j) const {
    check_index(i);
    check_index(j);

    auto found = boost::edge(static_cast<Vertex>(i), static_cast<Vertex>(j), graph_);
    if (!found.second) {
        throw core::NoSuchEdge("PixelGraph: no edge between " + std::to_string(i) +
                               " and " + std::to_string(j));
    }
    return graph_[found.first];
}

bool PixelGraph::has_connection(int i, int j) const {
    if (i < 0 || i >= node_count_ || j < 0 || j >= node_count_) {
        return false;
    }
    return boost::edge(static_cast<Vertex>(i), static_cast<Vertex>(j), graph_).second;
}

} // namespace graph
