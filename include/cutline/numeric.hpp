#pragma once

#include <cmath>

namespace cutline
{

inline bool is_finite(double v)
{
    return std::isfinite(v);
}

// Tolerant equality for values that crossed a float boundary (store mirrors,
// accumulated playhead time). Non-finite values are never equal.
inline bool nearly_equal(double a, double b, double epsilon)
{
    if (!std::isfinite(a) || !std::isfinite(b))
        return false;
    return std::fabs(a - b) <= epsilon;
}

}   // namespace cutline
