// componentkit-format

#include <componentkit/components/ComponentTools.hpp>
#include <componentkit/graph/GraphTools.hpp>

namespace ComponentKit {
namespace ComponentTools {

std::vector<std::vector<node>> weakComponents(const GraphView &G) {
    std::vector<std::vector<node>> components;
    forEachWeakComponent(
        G, [&](std::vector<node> component) { components.push_back(std::move(component)); });
    return components;
}

std::vector<node> largestWeakComponent(const GraphView &G) {
    ConnectedComponentsDetails::assureValidGraph(G);

    std::vector<node> largest;
    if (G.isEmpty())
        return largest;

    const count n = G.numberOfNodes();
    const index bound = G.upperNodeIdBound();
    ConnectedComponentsDetails::WeakComponentWalker walker(G);
    std::vector<node> component;

    for (node u = 0; u < bound; ++u) {
        if (!G.hasNode(u) || walker.isVisited(u))
            continue;

        component.clear();
        walker.walkFrom(u, [&](const node v) { component.push_back(v); });

        // Strictly larger: the first component of maximum size is kept
        if (component.size() > largest.size())
            largest.swap(component);

        // Even if all remaining nodes formed a single component, it would be smaller
        const count remaining = n - walker.numberOfVisitedNodes();
        if (largest.size() > remaining) {
            DEBUG("Largest component found after visiting ", walker.numberOfVisitedNodes(),
                  " of ", n, " nodes");
            break;
        }
    }

    return largest;
}

Graph largestWeakComponentAsSubgraph(const Graph &G, bool compactGraph) {
    return GraphTools::subgraphFromNodes(G, largestWeakComponent(G), compactGraph);
}

void cropToLargestWeakComponent(Graph &G) {
    const std::vector<node> largest = largestWeakComponent(G);

    std::vector<bool> keep(G.upperNodeIdBound(), false);
    for (const node u : largest)
        keep[u] = true;

    std::vector<node> toRemove;
    G.forNodes([&](const node u) {
        if (!keep[u])
            toRemove.push_back(u);
    });

    INFO("Removing ", toRemove.size(), " nodes outside of the largest weakly connected component");
    for (const node u : toRemove)
        G.removeNode(u);
}

std::vector<std::vector<node>> stronglyConnectedComponents(const GraphView &G) {
    std::vector<std::vector<node>> components;
    forEachStrongComponent(
        G, [&](std::vector<node> component) { components.push_back(std::move(component)); });
    return components;
}

} // namespace ComponentTools
} // namespace ComponentKit
