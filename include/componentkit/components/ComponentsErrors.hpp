// componentkit-format

#ifndef COMPONENTKIT_COMPONENTS_COMPONENTS_ERRORS_HPP_
#define COMPONENTKIT_COMPONENTS_COMPONENTS_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace ComponentKit {

/**
 * @ingroup components
 * Thrown when a graph does not honor the GraphView contract, e.g. its node count disagrees with
 * the nodes it enumerates or it reports a neighbor that is not one of its nodes.
 */
class InvalidGraphError : public std::invalid_argument {
public:
    explicit InvalidGraphError(const std::string &what) : std::invalid_argument(what) {}
};

/**
 * @ingroup components
 * Thrown when strongly connected components are requested for an undirected graph.
 */
class WrongDirectionalityError : public std::logic_error {
public:
    explicit WrongDirectionalityError(const std::string &what) : std::logic_error(what) {}
};

} // namespace ComponentKit

#endif // COMPONENTKIT_COMPONENTS_COMPONENTS_ERRORS_HPP_
