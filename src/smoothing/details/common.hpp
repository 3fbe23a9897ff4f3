#ifndef ONEIRO_SMOOTHING_DETAILS_COMMON_HPP
#define ONEIRO_SMOOTHING_DETAILS_COMMON_HPP

#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

namespace Oneiro::Smoothing::Details {
    // Standard-deviation multipliers of the three cascade scales.
    inline constexpr std::array<double, 3> kCascadeCoefficients{0.5, 1.0, 2.0};

    inline void check_sigma(double sigma, const char* operation) {
        if (!(sigma > 0.0) || !std::isfinite(sigma)) {
            throw std::invalid_argument(std::string(operation) + " requires a positive, finite sigma (received "
                                        + std::to_string(sigma) + ").");
        }
    }
}

#endif // ONEIRO_SMOOTHING_DETAILS_COMMON_HPP
