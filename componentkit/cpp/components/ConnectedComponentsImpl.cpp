// componentkit-format

#include <stdexcept>
#include <string>
#include <utility>

#include <componentkit/auxiliary/Log.hpp>
#include <componentkit/components/ComponentTools.hpp>
#include <componentkit/components/ConnectedComponentsImpl.hpp>

namespace ComponentKit {
namespace ConnectedComponentsDetails {

ConnectedComponentsImpl::ConnectedComponentsImpl(const GraphView &G, bool strongCC)
    : G(&G), strongCC(strongCC) {
    hasRun = false;
}

void ConnectedComponentsImpl::assureFinished() const {
    if (!hasRun)
        throw std::runtime_error("Error, call run() method first.");
}

count ConnectedComponentsImpl::numberOfComponents() const {
    assureFinished();
    return components.size();
}

count ConnectedComponentsImpl::componentOfNode(node u) const {
    assureFinished();
    if (u >= component.size() || component[u] == none)
        throw std::runtime_error("Error, node " + std::to_string(u) + " is not in the graph.");
    return component[u];
}

void ConnectedComponentsImpl::run() {
    hasRun = false;
    components.clear();
    component.assign(G->upperNodeIdBound(), none);

    const auto addComponent = [&](std::vector<node> nodes) {
        const index c = components.size();
        for (const node u : nodes)
            component[u] = c;
        components.push_back(std::move(nodes));
    };

    if (strongCC)
        ComponentTools::forEachStrongComponent(*G, addComponent);
    else
        ComponentTools::forEachWeakComponent(*G, addComponent);

    DEBUG("Partitioned ", G->numberOfNodes(), " nodes into ", components.size(),
          strongCC ? " strongly" : " weakly", " connected components");
    hasRun = true;
}

std::vector<std::vector<node>> ConnectedComponentsImpl::getComponents() const {
    assureFinished();
    return components;
}

std::map<index, count> ConnectedComponentsImpl::getComponentSizes() const {
    assureFinished();

    std::map<index, count> sizes;
    for (index c = 0; c < components.size(); ++c)
        sizes[c] = components[c].size();
    return sizes;
}

} // namespace ConnectedComponentsDetails
} // namespace ComponentKit
