// componentkit-format

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <componentkit/graph/Graph.hpp>

namespace ComponentKit {

namespace {

void eraseEdgeId(std::vector<node> &neighbors, std::vector<edgeid> &ids, edgeid e) {
    const auto it = std::find(ids.begin(), ids.end(), e);
    if (it == ids.end())
        return;
    const auto pos = it - ids.begin();
    ids.erase(it);
    neighbors.erase(neighbors.begin() + pos);
}

} // namespace

Graph::Graph(count n, bool weighted, bool directed)
    : Graph(n, weighted, directed ? GraphType::DIRECTED : GraphType::UNDIRECTED) {}

Graph::Graph(count n, bool weighted, GraphType type)
    : type(type), weighted(weighted), n(n), m(0), exists(n, true), nodeAttributes(n),
      outEdges(n), outEdgeIds(n), inEdges(n), inEdgeIds(n) {}

void Graph::assureNode(node u) const {
    if (!hasNode(u))
        throw std::runtime_error("Error, node " + std::to_string(u) + " is not in the graph.");
}

const Graph::Edge &Graph::edgeAt(edgeid e) const {
    if (!hasEdgeId(e))
        throw std::runtime_error("Error, edge " + std::to_string(e) + " is not in the graph.");
    return edges[e];
}

Graph::Edge &Graph::edgeAt(edgeid e) {
    return const_cast<Edge &>(static_cast<const Graph &>(*this).edgeAt(e));
}

count Graph::degreeOut(node u) const {
    assureNode(u);
    return outEdges[u].size();
}

node Graph::getIthNeighbor(node u, index i) const {
    assureNode(u);
    return i < outEdges[u].size() ? outEdges[u][i] : none;
}

count Graph::degreeIn(node u) const {
    assureNode(u);
    return inEdges[u].size();
}

node Graph::getIthInNeighbor(node u, index i) const {
    assureNode(u);
    return i < inEdges[u].size() ? inEdges[u][i] : none;
}

node Graph::addNode() {
    exists.push_back(true);
    nodeAttributes.emplace_back();
    outEdges.emplace_back();
    outEdgeIds.emplace_back();
    inEdges.emplace_back();
    inEdgeIds.emplace_back();
    ++n;
    return exists.size() - 1;
}

node Graph::addNodes(count numberOfNewNodes) {
    if (numberOfNewNodes == 0)
        return exists.empty() ? none : exists.size() - 1;

    const count newBound = exists.size() + numberOfNewNodes;
    exists.resize(newBound, true);
    nodeAttributes.resize(newBound);
    outEdges.resize(newBound);
    outEdgeIds.resize(newBound);
    inEdges.resize(newBound);
    inEdgeIds.resize(newBound);
    n += numberOfNewNodes;
    return newBound - 1;
}

void Graph::removeNode(node u) {
    assureNode(u);

    // detachEdge modifies the adjacency of u, iterate over copies
    const std::vector<edgeid> outgoing = outEdgeIds[u];
    for (const edgeid e : outgoing)
        if (edges[e].alive)
            detachEdge(e);
    const std::vector<edgeid> incoming = inEdgeIds[u];
    for (const edgeid e : incoming)
        if (edges[e].alive)
            detachEdge(e);

    exists[u] = false;
    nodeAttributes[u].clear();
    --n;
}

edgeid Graph::addEdge(node u, node v, edgeweight ew) {
    return insertEdge(u, v, ew, type == GraphType::UNDIRECTED);
}

edgeid Graph::addDirectedEdge(node u, node v, edgeweight ew) {
    if (type == GraphType::UNDIRECTED)
        throw std::runtime_error("Error, directed edges cannot be added to an undirected graph.");
    return insertEdge(u, v, ew, false);
}

edgeid Graph::addUndirectedEdge(node u, node v, edgeweight ew) {
    if (type == GraphType::DIRECTED)
        throw std::runtime_error("Error, undirected edges cannot be added to a directed graph.");
    return insertEdge(u, v, ew, true);
}

edgeid Graph::addEdgeWithId(edgeid e, node u, node v, edgeweight ew, bool undirected) {
    if (e == none || hasEdgeId(e))
        throw std::runtime_error("Error, edge id " + std::to_string(e) + " is not available.");
    if (undirected ? type == GraphType::DIRECTED : type == GraphType::UNDIRECTED)
        throw std::runtime_error("Error, the edge direction does not match a " + toString(type)
                                 + " graph.");
    return insertEdge(u, v, ew, undirected, e);
}

edgeid Graph::insertEdge(node u, node v, edgeweight ew, bool undirected, edgeid e) {
    assureNode(u);
    assureNode(v);

    if (e == none)
        e = edges.size();
    // unused slots below e stay dead
    if (e >= edges.size())
        edges.resize(e + 1, Edge{none, none, defaultEdgeWeight, false, false, {}});
    edges[e] = Edge{u, v, weighted ? ew : defaultEdgeWeight, undirected, true, {}};

    outEdges[u].push_back(v);
    outEdgeIds[u].push_back(e);
    if (undirected) {
        if (u != v) {
            outEdges[v].push_back(u);
            outEdgeIds[v].push_back(e);
        }
    } else {
        inEdges[v].push_back(u);
        inEdgeIds[v].push_back(e);
    }

    ++m;
    return e;
}

void Graph::detachEdge(edgeid e) {
    Edge &edge = edges[e];
    eraseEdgeId(outEdges[edge.u], outEdgeIds[edge.u], e);
    if (edge.undirected)
        eraseEdgeId(outEdges[edge.v], outEdgeIds[edge.v], e);
    else
        eraseEdgeId(inEdges[edge.v], inEdgeIds[edge.v], e);

    edge.alive = false;
    edge.attributes.clear();
    --m;
}

bool Graph::hasEdge(node u, node v) const {
    if (!hasNode(u) || !hasNode(v))
        return false;
    return std::find(outEdges[u].begin(), outEdges[u].end(), v) != outEdges[u].end();
}

void Graph::setNodeAttribute(node u, const std::string &key, const std::string &value) {
    assureNode(u);
    nodeAttributes[u][key] = value;
}

const std::string &Graph::getNodeAttribute(node u, const std::string &key) const {
    assureNode(u);
    return nodeAttributes[u].at(key);
}

const Graph::Attributes &Graph::getNodeAttributes(node u) const {
    assureNode(u);
    return nodeAttributes[u];
}

void Graph::setNodeAttributes(node u, Attributes attributes) {
    assureNode(u);
    nodeAttributes[u] = std::move(attributes);
}

void Graph::setEdgeAttribute(edgeid e, const std::string &key, const std::string &value) {
    edgeAt(e).attributes[key] = value;
}

const std::string &Graph::getEdgeAttribute(edgeid e, const std::string &key) const {
    return edgeAt(e).attributes.at(key);
}

const Graph::Attributes &Graph::getEdgeAttributes(edgeid e) const {
    return edgeAt(e).attributes;
}

void Graph::setEdgeAttributes(edgeid e, Attributes attributes) {
    edgeAt(e).attributes = std::move(attributes);
}

} // namespace ComponentKit
