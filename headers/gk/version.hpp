//
// Created by gregorian-rayne on 10/1/26.
//

#ifndef GATEKEEPER_VERSION_HPP
#define GATEKEEPER_VERSION_HPP

/**
 * @file version.hpp
 * @brief Gatekeeper version information.
 */

namespace gk {

    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 3;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "0.3.0";

    constexpr auto PROJECT_NAME = "Gatekeeper";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "gatekeeper";

}  // namespace gk

#endif //GATEKEEPER_VERSION_HPP
