// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cmath>

namespace primordia::math
{

    struct Vec2
    {
        double x{0.0};
        double y{0.0};

        Vec2() = default;
        Vec2(double xx, double yy) : x(xx), y(yy) {}
    };

    inline Vec2 operator+(const Vec2 &a, const Vec2 &b) { return {a.x + b.x, a.y + b.y}; }
    inline Vec2 operator-(const Vec2 &a, const Vec2 &b) { return {a.x - b.x, a.y - b.y}; }
    inline Vec2 operator*(const Vec2 &a, double s) { return {a.x * s, a.y * s}; }

    inline double length(const Vec2 &v) { return std::sqrt(v.x * v.x + v.y * v.y); }
    inline double distance(const Vec2 &a, const Vec2 &b) { return length(a - b); }

} // namespace primordia::math
