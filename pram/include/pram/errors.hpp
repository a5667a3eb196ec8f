#ifndef PRAM_ERRORS_HPP
#define PRAM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pram {

/**
 * Direct attribute or relation write on a group that a population has
 * registered, without the explicit force flag.
 */
class GroupFrozenError : public std::logic_error {
public:
    explicit GroupFrozenError(const std::string& what) : std::logic_error(what) {}
};

/**
 * Population assembled in the wrong order: a group registered before any
 * rule exists, or a rule added once groups are present.
 */
class SimulationConstructionError : public std::logic_error {
public:
    explicit SimulationConstructionError(const std::string& what) : std::logic_error(what) {}
};

} // namespace pram

#endif // PRAM_ERRORS_HPP
