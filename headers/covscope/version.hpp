//
// Created by gregorian-rayne on 02/09/26.
//

#ifndef COVSCOPE_VERSION_HPP
#define COVSCOPE_VERSION_HPP

/**
 * @file version.hpp
 * @brief covscope version information.
 */

namespace covscope {

    /**
     * Major version number.
     * Incremented for breaking API changes.
     */
    constexpr int VERSION_MAJOR = 0;

    /**
     * Minor version number.
     * Incremented for new features with backward compatibility.
     */
    constexpr int VERSION_MINOR = 3;

    /**
     * Patch version number.
     * Incremented for bug fixes.
     */
    constexpr int VERSION_PATCH = 1;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "0.3.1";

    /**
     * Project name.
     */
    constexpr auto PROJECT_NAME = "Coverage Scope Aggregator";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "covscope";

}  // namespace covscope

#endif //COVSCOPE_VERSION_HPP
