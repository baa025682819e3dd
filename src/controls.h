#pragma once

#include "bake/math.h"
#include "input.h"

struct OrbitIntent
{
    Vec2 rotate;
    double zoom;

    static OrbitIntent from_action(InputAction action, double step);
};
