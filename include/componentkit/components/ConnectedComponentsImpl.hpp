// componentkit-format
#ifndef COMPONENTKIT_COMPONENTS_CONNECTED_COMPONENTS_IMPL_HPP_
#define COMPONENTKIT_COMPONENTS_CONNECTED_COMPONENTS_IMPL_HPP_

#include <map>
#include <vector>

#include <componentkit/Globals.hpp>
#include <componentkit/graph/GraphView.hpp>

namespace ComponentKit {
namespace ConnectedComponentsDetails {

class ConnectedComponentsImpl {
public:
    ConnectedComponentsImpl(const GraphView &G, bool strongCC = false);

    void run();
    count componentOfNode(node u) const;
    count numberOfComponents() const;
    std::map<index, count> getComponentSizes() const;
    std::vector<std::vector<node>> getComponents() const;

protected:
    const GraphView *G;
    const bool strongCC;
    bool hasRun;
    std::vector<index> component;
    std::vector<std::vector<node>> components;
    void assureFinished() const;
};

} // namespace ConnectedComponentsDetails
} // namespace ComponentKit

#endif // COMPONENTKIT_COMPONENTS_CONNECTED_COMPONENTS_IMPL_HPP_
