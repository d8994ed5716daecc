// componentkit-format

#ifndef COMPONENTKIT_COMPONENTS_WEAK_COMPONENT_WALKER_HPP_
#define COMPONENTKIT_COMPONENTS_WEAK_COMPONENT_WALKER_HPP_

#include <vector>

#include <componentkit/Globals.hpp>
#include <componentkit/components/GraphValidation.hpp>
#include <componentkit/graph/GraphView.hpp>

namespace ComponentKit {
namespace ConnectedComponentsDetails {

/**
 * Iterative depth-first search over the edges of a graph, ignoring their direction. The walker
 * keeps the visited state across calls to walkFrom(), so that consecutive walks discover
 * disjoint components.
 */
class WeakComponentWalker {
public:
    explicit WeakComponentWalker(const GraphView &G)
        : G(&G), bound(G.upperNodeIdBound()), visited(bound, false) {}

    bool isVisited(node u) const { return visited[u]; }

    count numberOfVisitedNodes() const noexcept { return visitedNodes; }

    /**
     * Visits the component of @a root and calls @a handle for each of its nodes, in visiting
     * order. Nodes visited by earlier walks are not reported again.
     *
     * @return The number of nodes reported.
     */
    template <typename L>
    count walkFrom(node root, L handle) {
        count size = 0;
        stack.push_back(root);

        do {
            const node u = stack.back();
            stack.pop_back();
            if (visited[u])
                continue;

            visited[u] = true;
            ++visitedNodes;
            ++size;
            handle(u);

            G->forUndirectedNeighborsOf(u, [&](const node v) {
                assureNeighbor(*G, bound, u, v);
                if (!visited[v])
                    stack.push_back(v);
            });
        } while (!stack.empty());

        return size;
    }

private:
    const GraphView *G;
    const index bound;
    std::vector<bool> visited;
    std::vector<node> stack;
    count visitedNodes = 0;
};

} // namespace ConnectedComponentsDetails
} // namespace ComponentKit

#endif // COMPONENTKIT_COMPONENTS_WEAK_COMPONENT_WALKER_HPP_
