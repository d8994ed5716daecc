// componentkit-format

#include <string>

#include <componentkit/components/GraphValidation.hpp>

namespace ComponentKit {
namespace ConnectedComponentsDetails {

void assureValidGraph(const GraphView &G) {
    switch (G.getType()) {
    case GraphType::UNDIRECTED:
    case GraphType::DIRECTED:
    case GraphType::MIXED:
        break;
    default:
        throw InvalidGraphError("Error, the graph reports an unknown type.");
    }

    const index bound = G.upperNodeIdBound();
    if (bound == none)
        throw InvalidGraphError("Error, the graph reports an invalid upper node id bound.");

    count existing = 0;
    G.forNodes([&](node) { ++existing; });

    if (existing != G.numberOfNodes())
        throw InvalidGraphError("Error, the graph holds " + std::to_string(existing)
                                + " nodes but reports " + std::to_string(G.numberOfNodes())
                                + ".");
}

void throwInvalidNeighbor(node u, node v) {
    throw InvalidGraphError("Error, node " + std::to_string(v) + " reported as a neighbor of "
                            + std::to_string(u) + " is not in the graph.");
}

} // namespace ConnectedComponentsDetails
} // namespace ComponentKit
