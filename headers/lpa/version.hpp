//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef LPA_VERSION_HPP
#define LPA_VERSION_HPP

/**
 * @file version.hpp
 * @brief Laravel Pattern Analyzer version information.
 */

namespace lpa {

    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 2;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "1.2.0";

    constexpr auto PROJECT_NAME = "Laravel Pattern Analyzer";

    /**
     * Short project name for CLI usage and file names.
     */
    constexpr auto PROJECT_SHORT_NAME = "lpa";

}  // namespace lpa

#endif //LPA_VERSION_HPP
