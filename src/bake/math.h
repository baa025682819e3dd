#pragma once

#include "../prelude.hpp"

struct Vec2
{
    double x, y;

    [[nodiscard]]
    static constexpr auto zero() -> Vec2
    {
        return {0.0, 0.0};
    }

    [[nodiscard]]
    constexpr auto operator+(const Vec2& rhs) const -> Vec2
    {
        return {x + rhs.x, y + rhs.y};
    }

    [[nodiscard]]
    constexpr auto operator*(double scalar) const -> Vec2
    {
        return {x * scalar, y * scalar};
    }
};

struct Vec3
{
    double x, y, z;

    [[nodiscard]]
    static constexpr auto zero() -> Vec3
    {
        return {0.0, 0.0, 0.0};
    }

    [[nodiscard]]
    constexpr auto operator+(const Vec3& rhs) const -> Vec3
    {
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }

    [[nodiscard]]
    constexpr auto operator-(const Vec3& rhs) const -> Vec3
    {
        return {x - rhs.x, y - rhs.y, z - rhs.z};
    }

    [[nodiscard]]
    constexpr auto operator-() const -> Vec3
    {
        return {-x, -y, -z};
    }

    [[nodiscard]]
    constexpr auto operator*(double scalar) const -> Vec3
    {
        return {x * scalar, y * scalar, z * scalar};
    }

    [[nodiscard]]
    constexpr auto dot(const Vec3& rhs) const -> double
    {
        return x * rhs.x + y * rhs.y + z * rhs.z;
    }

    [[nodiscard]]
    constexpr auto cross(const Vec3& rhs) const -> Vec3
    {
        return {
            y * rhs.z - z * rhs.y,
            z * rhs.x - x * rhs.z,
            x * rhs.y - y * rhs.x
        };
    }

    [[nodiscard]]
    auto length() const -> double
    {
        return std::sqrt(x * x + y * y + z * z);
    }

    [[nodiscard]]
    auto normalize() const -> Vec3
    {
        const double len = length();
        if (len == 0.0)
        {
            return {0.0, 0.0, 0.0};
        }
        return Vec3{x / len, y / len, z / len};
    }

    [[nodiscard]]
    static constexpr auto lerp(const Vec3& a, const Vec3& b, const double t) -> Vec3
    {
        return {
            a.x + (b.x - a.x) * t,
            a.y + (b.y - a.y) * t,
            a.z + (b.z - a.z) * t
        };
    }

    // Bilinear patch through a (0,0), b (1,0), c (0,1), d (1,1).
    [[nodiscard]]
    static constexpr auto bilerp(const Vec3& a, const Vec3& b, const Vec3& c, const Vec3& d,
                                 const double u, const double v) -> Vec3
    {
        return lerp(lerp(a, b, u), lerp(c, d, u), v);
    }
};

struct Vec4
{
    double x, y, z, w;
};

struct Mat4
{
    std::array<std::array<double, 4>, 4> m{};

    [[nodiscard]]
    static constexpr auto identity() -> Mat4
    {
        Mat4 out{};
        out.m[0][0] = 1.0;
        out.m[1][1] = 1.0;
        out.m[2][2] = 1.0;
        out.m[3][3] = 1.0;
        return out;
    }

    [[nodiscard]]
    constexpr auto operator*(const Mat4& rhs) const -> Mat4
    {
        Mat4 out{};
        for (int i = 0; i < 4; ++i)
        {
            for (int j = 0; j < 4; ++j)
            {
                double sum = 0.0;
                for (int k = 0; k < 4; ++k)
                {
                    sum += m[i][k] * rhs.m[k][j];
                }
                out.m[i][j] = sum;
            }
        }
        return out;
    }

    [[nodiscard]]
    constexpr auto transform(const Vec3& p) const -> Vec4
    {
        return {
            m[0][0] * p.x + m[0][1] * p.y + m[0][2] * p.z + m[0][3],
            m[1][0] * p.x + m[1][1] * p.y + m[1][2] * p.z + m[1][3],
            m[2][0] * p.x + m[2][1] * p.y + m[2][2] * p.z + m[2][3],
            m[3][0] * p.x + m[3][1] * p.y + m[3][2] * p.z + m[3][3]
        };
    }

    // Transform and divide by w. Only meaningful when w is non-zero.
    [[nodiscard]]
    constexpr auto transform_point(const Vec3& p) const -> Vec3
    {
        const Vec4 clip = transform(p);
        const double inv_w = 1.0 / clip.w;
        return {clip.x * inv_w, clip.y * inv_w, clip.z * inv_w};
    }

    // glOrtho.
    [[nodiscard]]
    static constexpr auto ortho(const double left, const double right,
                                const double bottom, const double top,
                                const double near, const double far) -> Mat4
    {
        Mat4 out = identity();
        out.m[0][0] = 2.0 / (right - left);
        out.m[1][1] = 2.0 / (top - bottom);
        out.m[2][2] = -2.0 / (far - near);
        out.m[0][3] = -(right + left) / (right - left);
        out.m[1][3] = -(top + bottom) / (top - bottom);
        out.m[2][3] = -(far + near) / (far - near);
        return out;
    }

    // gluLookAt: the camera looks down its local -Z axis.
    [[nodiscard]]
    static auto look_at(const Vec3& eye, const Vec3& target, const Vec3& up) -> Mat4
    {
        const Vec3 f = (target - eye).normalize();
        const Vec3 s = f.cross(up).normalize();
        const Vec3 u = s.cross(f);

        Mat4 out = identity();
        out.m[0][0] = s.x;
        out.m[0][1] = s.y;
        out.m[0][2] = s.z;
        out.m[1][0] = u.x;
        out.m[1][1] = u.y;
        out.m[1][2] = u.z;
        out.m[2][0] = -f.x;
        out.m[2][1] = -f.y;
        out.m[2][2] = -f.z;
        out.m[0][3] = -s.dot(eye);
        out.m[1][3] = -u.dot(eye);
        out.m[2][3] = f.dot(eye);
        return out;
    }

    // gluPerspective, vertical field of view in radians.
    [[nodiscard]]
    static auto perspective(const double fov_y, const double aspect,
                            const double near, const double far) -> Mat4
    {
        const double f = 1.0 / std::tan(fov_y * 0.5);
        Mat4 out{};
        out.m[0][0] = f / aspect;
        out.m[1][1] = f;
        out.m[2][2] = (far + near) / (near - far);
        out.m[2][3] = 2.0 * far * near / (near - far);
        out.m[3][2] = -1.0;
        return out;
    }
};
