#pragma once
// This file is part of bproj under MIT License

namespace constants {

    // all members of this namespace must be constant

    double constexpr pi = 3.14159265358979323846; // pi
    double constexpr sqrt2 = 1.4142135623730950488; // sqrt(2)
    double constexpr sqrtpi = 1.77245385090551602729816748334115; // sqrt(pi)

} // namespace constants
