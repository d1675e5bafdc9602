/**
 * @file tag_demo.cpp
 * @brief Prints identifiers embedded at build time by `tagreg gen`
 *
 * CMake runs tagreg before compiling this file (see TAGREG_BUILD_EXAMPLES),
 * producing demo_tags.hpp from the store in the build directory. Rebuilding
 * leaves every identifier unchanged; deleting the store mints new ones.
 */

#include "demo_types.hpp"
#include "demo_tags.hpp"

#include <iostream>

int main() {
    constexpr tagreg::Uuid test = tagreg::typeTagOf<demo::Test>();
    constexpr tagreg::Uuid geoPoint = tagreg::typeTagOf<geo::Point>();
    constexpr tagreg::Uuid uiPoint = tagreg::typeTagOf<ui::Point>();

    static_assert(!test.isNil(), "generated tags are never nil");

    std::cout << "Tag for \"test1\": " << demo_tags::test1.toString() << "\n";
    std::cout << "Tag for \"test2\": " << demo_tags::test2.toString() << "\n";
    std::cout << "Tag for type demo::Test: " << test.toString() << "\n";
    std::cout << "Tag for type geo::Point: " << geoPoint.toString() << "\n";
    std::cout << "Tag for type ui::Point:  " << uiPoint.toString()
              << (geoPoint == uiPoint ? "  (same as geo::Point: legacy keys)" : "") << "\n";
    return 0;
}
