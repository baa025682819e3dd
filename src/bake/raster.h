#pragma once

#include "math.h"

struct Fragment
{
    size_t x;
    size_t y;
    double w0;
    double w1;
    double w2;
};

// Scan converts triangles given in pixel coordinates. A pixel is covered when
// its center (x + 0.5, y + 0.5) lies inside or on an edge; both windings draw.
struct TriangleRasterizer
{
    template<typename FragmentFn>
    static auto draw(const Vec2& v0, const Vec2& v1, const Vec2& v2,
                     const size_t width, const size_t height,
                     FragmentFn&& on_fragment) -> size_t
    {
        if (width == 0 || height == 0)
        {
            return 0;
        }

        const double area = edge(v0, v1, v2);
        if (area == 0.0 || !std::isfinite(area)) return 0;

        const double min_x = std::min({v0.x, v1.x, v2.x});
        const double max_x = std::max({v0.x, v1.x, v2.x});
        const double min_y = std::min({v0.y, v1.y, v2.y});
        const double max_y = std::max({v0.y, v1.y, v2.y});

        const double last_x = static_cast<double>(width) - 1.0;
        const double last_y = static_cast<double>(height) - 1.0;
        if (max_x < 0.0 || max_y < 0.0 || min_x > last_x + 1.0 || min_y > last_y + 1.0)
        {
            return 0;
        }

        const int x0 = static_cast<int>(std::clamp(std::floor(min_x - 0.5), 0.0, last_x));
        const int x1 = static_cast<int>(std::clamp(std::ceil(max_x - 0.5), 0.0, last_x));
        const int y0 = static_cast<int>(std::clamp(std::floor(min_y - 0.5), 0.0, last_y));
        const int y1 = static_cast<int>(std::clamp(std::ceil(max_y - 0.5), 0.0, last_y));

        const bool area_positive = area > 0.0;
        const double inv_area = 1.0 / area;

        const double w0_a = v2.y - v1.y;
        const double w0_b = v1.x - v2.x;
        const double w0_c = v1.y * v2.x - v1.x * v2.y;

        const double w1_a = v0.y - v2.y;
        const double w1_b = v2.x - v0.x;
        const double w1_c = v2.y * v0.x - v2.x * v0.y;

        const double w2_a = v1.y - v0.y;
        const double w2_b = v0.x - v1.x;
        const double w2_c = v0.y * v1.x - v0.x * v1.y;

        const double start_x = static_cast<double>(x0) + 0.5;
        const double start_y = static_cast<double>(y0) + 0.5;

        double w0_row = w0_a * start_x + w0_b * start_y + w0_c;
        double w1_row = w1_a * start_x + w1_b * start_y + w1_c;
        double w2_row = w2_a * start_x + w2_b * start_y + w2_c;

        size_t covered = 0;
        for (int y = y0; y <= y1; ++y, w0_row += w0_b, w1_row += w1_b, w2_row += w2_b)
        {
            double w0 = w0_row;
            double w1 = w1_row;
            double w2 = w2_row;

            for (int x = x0; x <= x1; ++x, w0 += w0_a, w1 += w1_a, w2 += w2_a)
            {
                const bool inside = area_positive
                                        ? (w0 >= 0.0 && w1 >= 0.0 && w2 >= 0.0)
                                        : (w0 <= 0.0 && w1 <= 0.0 && w2 <= 0.0);
                if (!inside) continue;

                ++covered;
                on_fragment(Fragment{
                    .x = static_cast<size_t>(x),
                    .y = static_cast<size_t>(y),
                    .w0 = w0 * inv_area,
                    .w1 = w1 * inv_area,
                    .w2 = w2 * inv_area
                });
            }
        }
        return covered;
    }

    [[nodiscard]]
    static constexpr auto edge(const Vec2& a, const Vec2& b, const Vec2& c) -> double
    {
        return (c.x - a.x) * (b.y - a.y) - (c.y - a.y) * (b.x - a.x);
    }
};
