// componentkit-format

#include <componentkit/components/ConnectedComponents.hpp>

namespace ComponentKit {

void ConnectedComponentsGeneral::run() {
    hasRun = false;
    impl->run();
    hasRun = true;
}

count ConnectedComponentsGeneral::numberOfComponents() const {
    assureFinished();
    return impl->numberOfComponents();
}

count ConnectedComponentsGeneral::componentOfNode(node u) const {
    assureFinished();
    return impl->componentOfNode(u);
}

std::vector<std::vector<node>> ConnectedComponentsGeneral::getComponents() const {
    assureFinished();
    return impl->getComponents();
}

std::map<index, count> ConnectedComponentsGeneral::getComponentSizes() const {
    assureFinished();
    return impl->getComponentSizes();
}

} // namespace ComponentKit
