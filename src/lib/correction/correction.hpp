#ifndef CORRECTION_CORRECTION_HPP
#define CORRECTION_CORRECTION_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "glycation/glycation_graph.hpp"
#include "utils/uncertainty.hpp"

namespace Correction {

// Raised when the outgoing conversion rates of a glycoform add up to one or
// more, which would leave nothing of it before glycation.
class InconsistentModelError : public std::runtime_error {
   public:
    InconsistentModelError(uint64_t node_id, const std::string &node_name,
                           double rate_sum);

    uint64_t node_id;
    std::string node_name;
    double rate_sum;
};

// Corrected abundances, indexed by node id.
struct Result {
    std::vector<Uncertainty::Value> corrected;
    // True if the corrected abundances were rescaled to add up to 100.
    bool normalized;
};

// Checks that the outgoing rates of every node add up to less than one.
// Throws InconsistentModelError for the first node that doesn't.
void validate_model(const Glycation::Graph &graph);

// Calculates the abundance of every glycoform before glycation. The nodes are
// visited in topological order, so that the abundances of all predecessors are
// already corrected:
//
//     in_abundance = sum(corrected(p) * rate(p -> n)) for all predecessors p
//     out_rate     = sum(rate(n -> s)) for all successors s
//     corrected(n) = (observed(n) - in_abundance) / (1 - out_rate)
//
// Negative abundances are kept. The model is validated before any abundance is
// corrected.
Result correct_abundances(const Glycation::Graph &graph);

// Same as above with an explicit visiting order. Throws std::invalid_argument
// if the order is not topological.
Result correct_abundances(const Glycation::Graph &graph,
                          const std::vector<uint64_t> &order);

// Scales all corrected abundances and their uncertainties so that they add up
// to 100. Throws std::invalid_argument if the sum is zero or not finite.
Result normalize(const Result &result);

}  // namespace Correction

#endif /* CORRECTION_CORRECTION_HPP */
