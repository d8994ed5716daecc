// componentkit-format

#include <componentkit/graph/GraphView.hpp>

namespace ComponentKit {

std::string toString(GraphType type) {
    switch (type) {
    case GraphType::UNDIRECTED:
        return "undirected";
    case GraphType::DIRECTED:
        return "directed";
    case GraphType::MIXED:
        return "mixed";
    }
    return "unknown";
}

} // namespace ComponentKit
