// componentkit-format

#include <componentkit/base/Algorithm.hpp>

namespace ComponentKit {

std::string Algorithm::toString() const {
    return "Algorithm";
}

} // namespace ComponentKit
