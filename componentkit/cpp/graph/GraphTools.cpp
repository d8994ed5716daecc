// componentkit-format

#include <stdexcept>
#include <string>

#include <componentkit/graph/GraphTools.hpp>

namespace ComponentKit {
namespace GraphTools {

Graph emptyCopy(const Graph &G) {
    return Graph(0, G.isWeighted(), G.getType());
}

Graph subgraphFromNodes(const Graph &G, const std::vector<node> &nodes, bool compact) {
    const index bound = G.upperNodeIdBound();
    std::vector<bool> include(bound, false);
    for (const node u : nodes) {
        if (!G.hasNode(u))
            throw std::runtime_error("Error, node " + std::to_string(u)
                                     + " is not in the graph.");
        include[u] = true;
    }

    Graph S = emptyCopy(G);
    std::vector<node> nodeIdMap(bound, none);

    if (compact) {
        G.forNodes([&](const node u) {
            if (include[u])
                nodeIdMap[u] = S.addNode();
        });
    } else {
        // Keep the original ids: create the full id range, then drop what is not included.
        S.addNodes(bound);
        for (node u = 0; u < bound; ++u) {
            if (include[u])
                nodeIdMap[u] = u;
            else
                S.removeNode(u);
        }
    }

    G.forNodes([&](const node u) {
        if (include[u])
            S.setNodeAttributes(nodeIdMap[u], G.getNodeAttributes(u));
    });

    G.forEdges([&](const node u, const node v, const edgeid e) {
        if (!include[u] || !include[v])
            return;
        edgeid copy;
        if (!compact)
            copy = S.addEdgeWithId(e, u, v, G.weight(e), G.isUndirectedEdge(e));
        else if (G.isUndirectedEdge(e))
            copy = S.addUndirectedEdge(nodeIdMap[u], nodeIdMap[v], G.weight(e));
        else
            copy = S.addDirectedEdge(nodeIdMap[u], nodeIdMap[v], G.weight(e));
        S.setEdgeAttributes(copy, G.getEdgeAttributes(e));
    });

    return S;
}

} // namespace GraphTools
} // namespace ComponentKit
