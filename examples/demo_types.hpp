#pragma once

// Types tagged by the demo's generated header

namespace demo {
struct Test {};
}  // namespace demo

namespace geo {
struct Point {
    double x = 0.0;
    double y = 0.0;
};
}  // namespace geo

namespace ui {
struct Point {
    int x = 0;
    int y = 0;
};
}  // namespace ui
