// componentkit-format

#ifndef COMPONENTKIT_COMPONENTS_GRAPH_VALIDATION_HPP_
#define COMPONENTKIT_COMPONENTS_GRAPH_VALIDATION_HPP_

#include <componentkit/Globals.hpp>
#include <componentkit/components/ComponentsErrors.hpp>
#include <componentkit/graph/GraphView.hpp>

namespace ComponentKit {
namespace ConnectedComponentsDetails {

/**
 * Checks that @a G has a known type and that it enumerates exactly numberOfNodes() nodes.
 * Throws InvalidGraphError otherwise.
 */
void assureValidGraph(const GraphView &G);

/**
 * Throws InvalidGraphError if @a v, reported as a neighbor of @a u, is not a node of @a G.
 */
void throwInvalidNeighbor(node u, node v);

inline void assureNeighbor(const GraphView &G, index bound, node u, node v) {
    if (v >= bound || !G.hasNode(v))
        throwInvalidNeighbor(u, v);
}

} // namespace ConnectedComponentsDetails
} // namespace ComponentKit

#endif // COMPONENTKIT_COMPONENTS_GRAPH_VALIDATION_HPP_
