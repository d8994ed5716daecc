// componentkit-format

#include <componentkit/components/ConnectedComponents.hpp>

namespace ComponentKit {

StronglyConnectedComponents::StronglyConnectedComponents(const GraphView &G)
    : ConnectedComponentsGeneral(G, true) {}

std::string StronglyConnectedComponents::toString() const {
    return "StronglyConnectedComponents";
}

} // namespace ComponentKit
