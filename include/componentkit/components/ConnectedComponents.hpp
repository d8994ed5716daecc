// componentkit-format

#ifndef COMPONENTKIT_COMPONENTS_CONNECTED_COMPONENTS_HPP_
#define COMPONENTKIT_COMPONENTS_CONNECTED_COMPONENTS_HPP_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <componentkit/base/Algorithm.hpp>
#include <componentkit/components/ConnectedComponentsImpl.hpp>
#include <componentkit/graph/Graph.hpp>
#include <componentkit/graph/GraphView.hpp>

namespace ComponentKit {

/**
 * @ingroup components
 * Determines the (weakly or strongly) connected components of a graph.
 */
class ConnectedComponentsGeneral : public Algorithm {
public:
    void run() override;

    /**
     * Get the number of connected components.
     *
     * @return The number of connected components.
     */
    count numberOfComponents() const;

    /**
     * Get the the component in which node @a u is situated.
     *
     * @param[in]	u	The node whose component is asked for.
     */
    count componentOfNode(node u) const;

    /**
     * Return the map from component to size.
     */
    std::map<index, count> getComponentSizes() const;

    /**
     * @return Vector of components, each stored as vector of nodes in discovery order.
     */
    std::vector<std::vector<node>> getComponents() const;

protected:
    ConnectedComponentsGeneral(const GraphView &G, bool strongCC)
        : impl(new ConnectedComponentsDetails::ConnectedComponentsImpl{G, strongCC}) {}

    std::unique_ptr<ConnectedComponentsDetails::ConnectedComponentsImpl> impl;
};

/**
 * @ingroup components
 * Weakly connected components of undirected, directed and mixed graphs: edge directions are
 * ignored.
 */
class WeaklyConnectedComponents final : public ConnectedComponentsGeneral {
public:
    WeaklyConnectedComponents(const GraphView &G);

    std::string toString() const override;

    /**
     * Constructs a new graph that contains only the nodes inside the largest
     * weakly connected component.
     * @param G            The input graph.
     * @param compactGraph If true, the node ids of the output graph will be compacted
     * (i.e. re-numbered from 0 to n-1). If false, the node ids will not be changed.
     */
    static Graph extractLargestWeaklyConnectedComponent(const Graph &G, bool compactGraph = false);
};

/**
 * @ingroup components
 * Strongly connected components of directed and mixed graphs. run() throws
 * WrongDirectionalityError on non-empty undirected graphs.
 */
class StronglyConnectedComponents final : public ConnectedComponentsGeneral {
public:
    StronglyConnectedComponents(const GraphView &G);

    std::string toString() const override;
};

} // namespace ComponentKit

#endif // COMPONENTKIT_COMPONENTS_CONNECTED_COMPONENTS_HPP_
