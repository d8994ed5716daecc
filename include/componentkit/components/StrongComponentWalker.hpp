// componentkit-format

#ifndef COMPONENTKIT_COMPONENTS_STRONG_COMPONENT_WALKER_HPP_
#define COMPONENTKIT_COMPONENTS_STRONG_COMPONENT_WALKER_HPP_

#include <utility>
#include <vector>

#include <componentkit/Globals.hpp>
#include <componentkit/components/GraphValidation.hpp>
#include <componentkit/graph/GraphView.hpp>

namespace ComponentKit {
namespace ConnectedComponentsDetails {

/**
 * Path-based strongly connected components (Pearce/Gabow style). Nodes get a preorder index
 * on discovery. The path stack holds the nodes on the current search path that may still root
 * a component, the scope stack holds all discovered nodes that are not yet assigned. A
 * reference to an unassigned node collapses the path stack down to that node's preorder index.
 *
 * The depth-first search uses an explicit stack of (node, next neighbor position) frames and
 * visits the outbound neighbors in the same order as the recursive formulation.
 */
class StrongComponentWalker {
public:
    explicit StrongComponentWalker(const GraphView &G)
        : G(&G), bound(G.upperNodeIdBound()), preorder(bound, none), assigned(bound, false) {}

    /**
     * Calls @a handle for each strongly connected component, in reverse topological order of
     * the condensation. The nodes of a component are reported in the order they leave the
     * scope stack, i.e. the root of the component comes last.
     *
     * @return The number of components.
     */
    template <typename L>
    count run(L handle) {
        count numComponents = 0;

        for (node root = 0; root < bound; ++root) {
            if (!G->hasNode(root) || preorder[root] != none)
                continue;

            discover(root);

            while (!callStack.empty()) {
                Frame &frame = callStack.back();
                const node u = frame.u;

                if (frame.next < G->degreeOut(u)) {
                    const node v = G->getIthNeighbor(u, frame.next++);
                    assureNeighbor(*G, bound, u, v);

                    if (preorder[v] == none) {
                        discover(v); // invalidates frame
                    } else if (!assigned[v]) {
                        while (preorder[pathStack.back()] > preorder[v])
                            pathStack.pop_back();
                    }
                    continue;
                }

                callStack.pop_back();
                if (pathStack.back() != u)
                    continue;

                // u is the root of a finished component
                std::vector<node> component;
                node w;
                do {
                    w = scopeStack.back();
                    scopeStack.pop_back();
                    assigned[w] = true;
                    component.push_back(w);
                } while (w != u);
                pathStack.pop_back();

                ++numComponents;
                handle(std::move(component));
            }
        }

        return numComponents;
    }

private:
    struct Frame {
        node u;
        index next;
    };

    const GraphView *G;
    const index bound;
    index nextPreorder = 0;
    std::vector<index> preorder;
    std::vector<bool> assigned;
    std::vector<node> pathStack;
    std::vector<node> scopeStack;
    std::vector<Frame> callStack;

    void discover(node u) {
        preorder[u] = nextPreorder++;
        pathStack.push_back(u);
        scopeStack.push_back(u);
        callStack.push_back(Frame{u, 0});
    }
};

} // namespace ConnectedComponentsDetails
} // namespace ComponentKit

#endif // COMPONENTKIT_COMPONENTS_STRONG_COMPONENT_WALKER_HPP_
