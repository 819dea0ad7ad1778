// src/Utils/MathUtils.h

#pragma once

#include <cmath>

namespace MathUtils {

    // Clamp value to [min, max]
    template<typename T>
    inline T Clamp(T value, T minVal, T maxVal) {
        return (value < minVal) ? minVal : ((value > maxVal) ? maxVal : value);
    }

    constexpr float PiF = 3.14159265f;

    // Wrap angle to [−π, +π]
    inline float WrapRadians(float theta) {
        theta = std::fmod(theta + PiF, 2.0f * PiF);
        if (theta < 0) theta += 2.0f * PiF;
        return theta - PiF;
    }

    // Blend between two headings along the shorter arc
    inline float LerpAngle(float from, float to, float t) {
        float delta = WrapRadians(to - from);
        return WrapRadians(from + delta * t);
    }
}
