#include "controls.h"

OrbitIntent OrbitIntent::from_action(const InputAction action, const double step)
{
    switch (action)
    {
        case InputAction::OrbitLeft:
            return {{-step, 0.0}, 1.0};
        case InputAction::OrbitRight:
            return {{step, 0.0}, 1.0};
        case InputAction::OrbitUp:
            return {{0.0, step}, 1.0};
        case InputAction::OrbitDown:
            return {{0.0, -step}, 1.0};
        case InputAction::ZoomIn:
            return {{0.0, 0.0}, 1.0 / (1.0 + step)};
        case InputAction::ZoomOut:
            return {{0.0, 0.0}, 1.0 + step};
        case InputAction::None:
        case InputAction::Quit:
        case InputAction::TogglePause:
        case InputAction::ToggleView:
            break;
    }
    return {{0.0, 0.0}, 1.0};
}
