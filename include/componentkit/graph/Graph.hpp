// componentkit-format

#ifndef COMPONENTKIT_GRAPH_GRAPH_HPP_
#define COMPONENTKIT_GRAPH_GRAPH_HPP_

#include <map>
#include <string>
#include <vector>

#include <componentkit/Globals.hpp>
#include <componentkit/graph/GraphView.hpp>

namespace ComponentKit {

/**
 * @ingroup graph
 * An adjacency-list graph with stable node ids, edge ids and string attributes on nodes and
 * edges. Depending on its type, a graph holds undirected edges, directed edges, or both (mixed).
 */
class Graph final : public GraphView {
public:
    using Attributes = std::map<std::string, std::string>;

    /**
     * Create a graph of @a n nodes. The graph has assignable edge weights if @a weighted is set
     * to <code>true</code>. If @a weighted is set to <code>false</code> each edge has edge
     * weight 1.0 and any other weight assignment will be ignored.
     *
     * @param n Number of nodes.
     * @param weighted If set to <code>true</code>, the graph has edge weights.
     * @param directed If set to <code>true</code>, the graph will be directed.
     */
    Graph(count n = 0, bool weighted = false, bool directed = false);

    Graph(count n, bool weighted, GraphType type);

    count numberOfNodes() const override { return n; }

    count numberOfEdges() const override { return m; }

    index upperNodeIdBound() const override { return exists.size(); }

    bool hasNode(node u) const override { return u < exists.size() && exists[u]; }

    GraphType getType() const override { return type; }

    count degreeOut(node u) const override;

    node getIthNeighbor(node u, index i) const override;

    count degreeIn(node u) const override;

    node getIthInNeighbor(node u, index i) const override;

    bool isWeighted() const noexcept { return weighted; }

    /**
     * Add a new node to the graph and return it.
     */
    node addNode();

    /**
     * Add @a numberOfNewNodes new nodes.
     * @return The id of the last node added.
     */
    node addNodes(count numberOfNewNodes);

    /**
     * Remove node @a u and all edges incident to it. The id of @a u is not reused.
     */
    void removeNode(node u);

    /**
     * Insert an edge between the nodes @a u and @a v. The edge is undirected in undirected
     * graphs and directed (from @a u to @a v) in directed and mixed graphs.
     *
     * @return The id of the new edge.
     */
    edgeid addEdge(node u, node v, edgeweight ew = defaultEdgeWeight);

    /**
     * Insert a directed edge from @a u to @a v. Only allowed in directed and mixed graphs.
     */
    edgeid addDirectedEdge(node u, node v, edgeweight ew = defaultEdgeWeight);

    /**
     * Insert an undirected edge {u, v}. Only allowed in undirected and mixed graphs.
     */
    edgeid addUndirectedEdge(node u, node v, edgeweight ew = defaultEdgeWeight);

    /**
     * Insert an edge under the id @a e, which must not belong to an existing edge. Ids below
     * @a e that were never handed out stay unused. Undirected edges are rejected in directed
     * graphs and directed ones in undirected graphs.
     *
     * @return @a e.
     */
    edgeid addEdgeWithId(edgeid e, node u, node v, edgeweight ew, bool undirected);

    /**
     * Checks if @a v is an outbound neighbor of @a u.
     */
    bool hasEdge(node u, node v) const;

    index upperEdgeIdBound() const { return edges.size(); }

    bool hasEdgeId(edgeid e) const { return e < edges.size() && edges[e].alive; }

    node edgeSource(edgeid e) const { return edgeAt(e).u; }

    node edgeTarget(edgeid e) const { return edgeAt(e).v; }

    bool isUndirectedEdge(edgeid e) const { return edgeAt(e).undirected; }

    edgeweight weight(edgeid e) const { return edgeAt(e).weight; }

    void setNodeAttribute(node u, const std::string &key, const std::string &value);

    /**
     * Returns the value stored under @a key for node @a u.
     * Throws std::out_of_range if there is none.
     */
    const std::string &getNodeAttribute(node u, const std::string &key) const;

    const Attributes &getNodeAttributes(node u) const;

    void setNodeAttributes(node u, Attributes attributes);

    void setEdgeAttribute(edgeid e, const std::string &key, const std::string &value);

    const std::string &getEdgeAttribute(edgeid e, const std::string &key) const;

    const Attributes &getEdgeAttributes(edgeid e) const;

    void setEdgeAttributes(edgeid e, Attributes attributes);

    /**
     * Iterate over all edges of the graph in ascending edge id order and call @a handle with
     * the edge's source, target and id.
     */
    template <typename L>
    void forEdges(L handle) const {
        for (edgeid e = 0; e < edges.size(); ++e)
            if (edges[e].alive)
                handle(edges[e].u, edges[e].v, e);
    }

private:
    struct Edge {
        node u;
        node v;
        edgeweight weight;
        bool undirected;
        bool alive;
        Attributes attributes;
    };

    GraphType type;
    bool weighted;
    count n; // current number of nodes
    count m; // current number of edges

    std::vector<bool> exists;
    std::vector<Attributes> nodeAttributes;

    // outbound neighbors and ids of the edges they are reached by
    std::vector<std::vector<node>> outEdges;
    std::vector<std::vector<edgeid>> outEdgeIds;
    // sources of the directed edges pointing to a node
    std::vector<std::vector<node>> inEdges;
    std::vector<std::vector<edgeid>> inEdgeIds;

    std::vector<Edge> edges;

    void assureNode(node u) const;
    const Edge &edgeAt(edgeid e) const;
    Edge &edgeAt(edgeid e);
    edgeid insertEdge(node u, node v, edgeweight ew, bool undirected, edgeid e = none);
    void detachEdge(edgeid e);
};

} // namespace ComponentKit

#endif // COMPONENTKIT_GRAPH_GRAPH_HPP_
