#ifndef IDPICK_MATHS_HPP_INCLUDED
#define IDPICK_MATHS_HPP_INCLUDED

#include <cmath>
#include <limits>

namespace idpick {
    // Largest power of two <= value. Values below 1 give 1, the smallest usable texture edge;
    // values past the int range (infinity included) give the largest int power of two.
    inline int floor_pot(double value) {
        if (!(value >= 2.0)) {
            return 1;
        }
        int pot = 1;
        while (pot <= std::numeric_limits<int>::max() / 2 && static_cast<double>(pot) * 2.0 <= value) {
            pot *= 2;
        }
        return pot;
    }
}

#endif
