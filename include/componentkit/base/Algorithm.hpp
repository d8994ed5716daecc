// componentkit-format

#ifndef COMPONENTKIT_BASE_ALGORITHM_HPP_
#define COMPONENTKIT_BASE_ALGORITHM_HPP_

#include <stdexcept>
#include <string>

namespace ComponentKit {

/**
 * @ingroup base
 * Abstract base class for algorithms that compute their result in run().
 */
class Algorithm {
protected:
    /**
     * A boolean variable indicating whether an algorithm has finished its computation or not.
     */
    bool hasRun = false;

public:
    virtual ~Algorithm() = default;

    /**
     * The generic run method. Implementations set @ref hasRun once the result is available.
     */
    virtual void run() = 0;

    /**
     * Indicates whether an algorithm has completed computation or not.
     * @return The value of @ref hasRun.
     */
    bool hasFinished() const noexcept { return hasRun; }

    /**
     * Assure that the algorithm has been run, throws a std::runtime_error otherwise.
     */
    void assureFinished() const {
        if (!hasRun)
            throw std::runtime_error("Error, run must be called first");
    }

    /**
     * Returns a string with the algorithm's name and its parameters, if there are any.
     * @return The string representation of the algorithm.
     */
    virtual std::string toString() const;
};

} // namespace ComponentKit

#endif // COMPONENTKIT_BASE_ALGORITHM_HPP_
