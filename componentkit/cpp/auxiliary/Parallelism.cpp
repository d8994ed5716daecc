// componentkit-format

#include <stdexcept>

#include <omp.h>

#include <componentkit/auxiliary/Parallelism.hpp>

namespace ComponentKit {
namespace Aux {

void setNumberOfThreads(int nThreads) {
    if (nThreads < 1)
        throw std::runtime_error("Error, the number of threads must be positive.");
    omp_set_num_threads(nThreads);
}

int getMaxNumberOfThreads() {
    return omp_get_max_threads();
}

} // namespace Aux
} // namespace ComponentKit
