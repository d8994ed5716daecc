// componentkit-format

#include <componentkit/components/ComponentTools.hpp>
#include <componentkit/components/ConnectedComponents.hpp>

namespace ComponentKit {

WeaklyConnectedComponents::WeaklyConnectedComponents(const GraphView &G)
    : ConnectedComponentsGeneral(G, false) {}

std::string WeaklyConnectedComponents::toString() const {
    return "WeaklyConnectedComponents";
}

Graph WeaklyConnectedComponents::extractLargestWeaklyConnectedComponent(const Graph &G,
                                                                        bool compactGraph) {
    return ComponentTools::largestWeakComponentAsSubgraph(G, compactGraph);
}

} // namespace ComponentKit
