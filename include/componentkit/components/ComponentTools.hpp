// componentkit-format

#ifndef COMPONENTKIT_COMPONENTS_COMPONENT_TOOLS_HPP_
#define COMPONENTKIT_COMPONENTS_COMPONENT_TOOLS_HPP_

#include <utility>
#include <vector>

#include <tlx/unused.hpp>

#include <componentkit/Globals.hpp>
#include <componentkit/auxiliary/Log.hpp>
#include <componentkit/components/ComponentsErrors.hpp>
#include <componentkit/components/GraphValidation.hpp>
#include <componentkit/components/StrongComponentWalker.hpp>
#include <componentkit/components/WeakComponentWalker.hpp>
#include <componentkit/graph/Graph.hpp>
#include <componentkit/graph/GraphView.hpp>

namespace ComponentKit {

/**
 * @ingroup components
 * Weakly and strongly connected components of graphs.
 *
 * All functions validate their input graph first and throw InvalidGraphError if it does not
 * honor the GraphView contract. Working state is allocated per call; the graph must not be
 * modified while a function is running on it.
 */
namespace ComponentTools {

/**
 * Calls @a handle once for each weakly connected component of @a G, passing the nodes of the
 * component as an rvalue std::vector<node>. Components are discovered from the nodes in
 * ascending id order; nodes inside a component are in depth-first visiting order. Edge
 * directions are ignored.
 */
template <typename L>
void forEachWeakComponent(const GraphView &G, L handle) {
    ConnectedComponentsDetails::assureValidGraph(G);
    if (G.isEmpty())
        return;

    ConnectedComponentsDetails::WeakComponentWalker walker(G);
    count numComponents = 0;

    G.forNodes([&](const node u) {
        if (walker.isVisited(u))
            return;

        std::vector<node> component;
        walker.walkFrom(u, [&](const node v) { component.push_back(v); });
        ++numComponents;
        handle(std::move(component));
    });

    DEBUG("Found ", numComponents, " weakly connected components");
    tlx::unused(numComponents);
}

/**
 * Like forEachWeakComponent(), but calls @a handle with the number of nodes of each component
 * instead of its nodes.
 */
template <typename L>
void forEachWeakComponentSize(const GraphView &G, L handle) {
    ConnectedComponentsDetails::assureValidGraph(G);
    if (G.isEmpty())
        return;

    ConnectedComponentsDetails::WeakComponentWalker walker(G);

    G.forNodes([&](const node u) {
        if (walker.isVisited(u))
            return;
        handle(walker.walkFrom(u, [](node) {}));
    });
}

/**
 * @return The weakly connected components of @a G, in the order of forEachWeakComponent().
 */
std::vector<std::vector<node>> weakComponents(const GraphView &G);

/**
 * Returns the weakly connected component of @a G with the most nodes. Among components of
 * maximum size, the first one discovered wins. Stops as soon as the nodes left to visit are
 * too few to form a larger component. Returns an empty vector for an empty graph.
 */
std::vector<node> largestWeakComponent(const GraphView &G);

/**
 * Constructs a new graph of the same type as @a G that contains the nodes of the largest
 * weakly connected component and all edges among them, with their attributes.
 *
 * @param G The input graph.
 * @param compactGraph If true, the node ids of the output graph will be compacted
 * (i.e. re-numbered from 0 to n-1). If false, the node ids will not be changed.
 */
Graph largestWeakComponentAsSubgraph(const Graph &G, bool compactGraph = false);

/**
 * Removes every node of @a G (and its edges) that is not in the largest weakly connected
 * component.
 */
void cropToLargestWeakComponent(Graph &G);

/**
 * Calls @a handle once for each strongly connected component of @a G, passing the nodes of the
 * component as an rvalue std::vector<node>. Components are reported in reverse topological
 * order of the condensation of @a G. Undirected edges of mixed graphs can be traversed in both
 * directions.
 *
 * Throws WrongDirectionalityError if @a G is a non-empty undirected graph.
 */
template <typename L>
void forEachStrongComponent(const GraphView &G, L handle) {
    ConnectedComponentsDetails::assureValidGraph(G);
    if (G.isEmpty())
        return;

    if (G.getType() == GraphType::UNDIRECTED)
        throw WrongDirectionalityError("Error, strongly connected components of an "
                                       + toString(G.getType())
                                       + " graph cannot be computed, use the weakly connected "
                                         "components instead.");

    if (G.numberOfEdges() == 0) {
        G.forNodes([&](const node u) { handle(std::vector<node>{u}); });
        return;
    }

    ConnectedComponentsDetails::StrongComponentWalker walker(G);
    const count numComponents = walker.run(handle);
    DEBUG("Found ", numComponents, " strongly connected components");
    tlx::unused(numComponents);
}

/**
 * @return The strongly connected components of @a G, in the order of forEachStrongComponent().
 */
std::vector<std::vector<node>> stronglyConnectedComponents(const GraphView &G);

} // namespace ComponentTools
} // namespace ComponentKit

#endif // COMPONENTKIT_COMPONENTS_COMPONENT_TOOLS_HPP_
