// componentkit-format

#ifndef COMPONENTKIT_GRAPH_GRAPH_VIEW_HPP_
#define COMPONENTKIT_GRAPH_GRAPH_VIEW_HPP_

#include <string>

#include <componentkit/Globals.hpp>

namespace ComponentKit {

enum class GraphType : uint8_t { UNDIRECTED, DIRECTED, MIXED };

std::string toString(GraphType type);

/**
 * @ingroup graph
 * Read-only access to a graph, as required by the component algorithms.
 *
 * Nodes are identified by ids in [0, upperNodeIdBound()); ids of deleted nodes stay unused.
 * The natural enumeration order of the nodes is ascending id.
 */
class GraphView {
public:
    virtual ~GraphView() = default;

    virtual count numberOfNodes() const = 0;

    virtual count numberOfEdges() const = 0;

    /**
     * @return Upper bound (exclusive) of the node ids that are or have been in use.
     */
    virtual index upperNodeIdBound() const = 0;

    virtual bool hasNode(node u) const = 0;

    virtual GraphType getType() const = 0;

    /**
     * Number of outbound neighbors of @a u. Each directed edge (u, v) and each undirected edge
     * {u, v} contributes v once. An undirected self-loop contributes u once.
     */
    virtual count degreeOut(node u) const = 0;

    /**
     * Returns the @a i-th outbound neighbor of @a u, with 0 <= i < degreeOut(u).
     */
    virtual node getIthNeighbor(node u, index i) const = 0;

    /**
     * Number of directed edges pointing to @a u. Undirected edges are only reported through the
     * outbound side, thus this is 0 for every node of an undirected graph.
     */
    virtual count degreeIn(node u) const = 0;

    /**
     * Returns the source of the @a i-th directed edge pointing to @a u, with 0 <= i < degreeIn(u).
     */
    virtual node getIthInNeighbor(node u, index i) const = 0;

    bool isEmpty() const { return numberOfNodes() == 0; }

    /**
     * @return True unless all edges of the graph are undirected.
     */
    bool isDirected() const { return getType() != GraphType::UNDIRECTED; }

    /**
     * Iterate over all nodes of the graph in ascending id order and call @a handle (lambda
     * closure).
     */
    template <typename L>
    void forNodes(L handle) const {
        const index bound = upperNodeIdBound();
        for (node u = 0; u < bound; ++u)
            if (hasNode(u))
                handle(u);
    }

    /**
     * Iterate over the outbound neighbors of @a u.
     */
    template <typename L>
    void forNeighborsOf(node u, L handle) const {
        const count deg = degreeOut(u);
        for (index i = 0; i < deg; ++i)
            handle(getIthNeighbor(u, i));
    }

    /**
     * Iterate over the sources of the directed edges pointing to @a u.
     */
    template <typename L>
    void forInNeighborsOf(node u, L handle) const {
        const count deg = degreeIn(u);
        for (index i = 0; i < deg; ++i)
            handle(getIthInNeighbor(u, i));
    }

    /**
     * Iterate over all nodes connected to @a u by an edge of any direction: first the outbound
     * neighbors, then the inbound ones. Nodes may be reported more than once.
     */
    template <typename L>
    void forUndirectedNeighborsOf(node u, L handle) const {
        forNeighborsOf(u, handle);
        forInNeighborsOf(u, handle);
    }
};

} // namespace ComponentKit

#endif // COMPONENTKIT_GRAPH_GRAPH_VIEW_HPP_
