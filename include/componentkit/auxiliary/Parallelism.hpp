// componentkit-format

#ifndef COMPONENTKIT_AUXILIARY_PARALLELISM_HPP_
#define COMPONENTKIT_AUXILIARY_PARALLELISM_HPP_

namespace ComponentKit {
namespace Aux {

/**
 * Set the number of threads available to ComponentKit.
 * @param nThreads The number of threads.
 */
void setNumberOfThreads(int nThreads);

/**
 * @return The maximum number of threads available to ComponentKit.
 */
int getMaxNumberOfThreads();

} // namespace Aux
} // namespace ComponentKit

#endif // COMPONENTKIT_AUXILIARY_PARALLELISM_HPP_
