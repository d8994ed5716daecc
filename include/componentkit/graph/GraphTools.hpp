// componentkit-format

#ifndef COMPONENTKIT_GRAPH_GRAPH_TOOLS_HPP_
#define COMPONENTKIT_GRAPH_GRAPH_TOOLS_HPP_

#include <vector>

#include <componentkit/graph/Graph.hpp>

namespace ComponentKit {
namespace GraphTools {

/**
 * Returns a graph without nodes and edges, of the same type and weightedness as @a G.
 */
Graph emptyCopy(const Graph &G);

/**
 * Returns an induced subgraph of the input graph (including potential self-loops). Node and
 * edge attributes, edge weights and edge directions are copied from @a G.
 *
 * @param G The input graph.
 * @param nodes Nodes in the induced subgraph. Duplicates are ignored.
 * @param compact If true, the nodes of the subgraph are renumbered from 0 to |nodes|-1
 * following their ascending id order in @a G, and the copied edges get new ids in ascending
 * order of their ids in @a G. Otherwise nodes and edges keep their ids.
 * @return The induced subgraph.
 */
Graph subgraphFromNodes(const Graph &G, const std::vector<node> &nodes, bool compact = false);

} // namespace GraphTools
} // namespace ComponentKit

#endif // COMPONENTKIT_GRAPH_GRAPH_TOOLS_HPP_
