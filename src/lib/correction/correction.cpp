#include <cmath>

#include "correction/correction.hpp"

Correction::InconsistentModelError::InconsistentModelError(
    uint64_t node_id, const std::string &node_name, double rate_sum)
    : std::runtime_error("the conversion rates of glycoform '" + node_name +
                         "' (node " + std::to_string(node_id) +
                         ") add up to " + std::to_string(rate_sum) +
                         ", must be lower than 1"),
      node_id(node_id),
      node_name(node_name),
      rate_sum(rate_sum) {}

void Correction::validate_model(const Glycation::Graph &graph) {
    for (const auto &node : graph.nodes) {
        double rate_sum = 0.0;
        for (const auto &edge_id : graph.out_edges[node.id]) {
            rate_sum += graph.edges[edge_id].rate.nominal;
        }
        if (!(rate_sum < 1.0)) {
            throw InconsistentModelError(node.id, node.name, rate_sum);
        }
    }
}

Correction::Result Correction::correct_abundances(
    const Glycation::Graph &graph) {
    return correct_abundances(graph, Glycation::topological_order(graph));
}

Correction::Result Correction::correct_abundances(
    const Glycation::Graph &graph, const std::vector<uint64_t> &order) {
    if (!Glycation::is_topological_order(graph, order)) {
        throw std::invalid_argument(
            "the node order is not a topological order of the graph");
    }
    validate_model(graph);

    Result result = {};
    result.corrected.resize(graph.nodes.size(), {0.0, 0.0});
    result.normalized = false;
    for (const auto &id : order) {
        Uncertainty::Value in_abundance = {0.0, 0.0};
        for (const auto &edge_id : graph.in_edges[id]) {
            const auto &edge = graph.edges[edge_id];
            in_abundance = Uncertainty::add(
                in_abundance,
                Uncertainty::mul(result.corrected[edge.source], edge.rate));
        }
        Uncertainty::Value out_rate = {0.0, 0.0};
        for (const auto &edge_id : graph.out_edges[id]) {
            out_rate = Uncertainty::add(out_rate, graph.edges[edge_id].rate);
        }
        result.corrected[id] = Uncertainty::div(
            Uncertainty::sub(graph.nodes[id].observed, in_abundance),
            Uncertainty::sub({1.0, 0.0}, out_rate));
    }
    return result;
}

Correction::Result Correction::normalize(const Result &result) {
    double total = 0.0;
    for (const auto &value : result.corrected) {
        total += value.nominal;
    }
    if (total == 0.0 || !std::isfinite(total)) {
        throw std::invalid_argument(
            "can't normalize abundances that add up to " +
            std::to_string(total));
    }
    Result normalized = {};
    normalized.normalized = true;
    for (const auto &value : result.corrected) {
        normalized.corrected.push_back(Uncertainty::scale(value, 100.0 / total));
    }
    return normalized;
}
