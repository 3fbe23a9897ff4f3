#ifndef ONEIRO_SMOOTHING_HPP
#define ONEIRO_SMOOTHING_HPP
#include <cctype>
#include <stdexcept>
#include <string>
#include <variant>

#include "details/blur.hpp"
#include "details/cascade.hpp"
#include "details/common.hpp"

namespace Oneiro::Smoothing {

    using CascadeOptions = Details::CascadeOptions;
    struct CascadeDescriptor {
        CascadeOptions options{};
    };

    using CPUBlurOptions = Details::CPUBlurOptions;
    struct CPUBlurDescriptor {
        CPUBlurOptions options{};
    };

    using CascadeGaussianSmoothing = Details::CascadeGaussianSmoothing;
    using CascadeGaussianSmoothingImpl = Details::CascadeGaussianSmoothingImpl;

    // Both paths are numerically close but not identical (boundary handling and
    // kernel truncation differ); they are kept as interchangeable strategies.
    using Descriptor = std::variant<CascadeDescriptor, CPUBlurDescriptor>;

    enum class Strategy {
        Cascade,
        CPU
    };

    [[nodiscard]] inline Strategy strategy_of(const Descriptor& descriptor) {
        return std::holds_alternative<CascadeDescriptor>(descriptor) ? Strategy::Cascade : Strategy::CPU;
    }

    [[nodiscard]] inline std::string strategy_to_string(Strategy strategy) {
        switch (strategy) {
            case Strategy::Cascade: return "cascade";
            case Strategy::CPU: return "cpu";
        }
        return "cascade";
    }

    [[nodiscard]] inline Strategy strategy_from_string(const std::string& value) {
        std::string lowered;
        lowered.reserve(value.size());
        for (const unsigned char character : value) {
            lowered.push_back(static_cast<char>(std::tolower(character)));
        }
        if (lowered == "cascade") {
            return Strategy::Cascade;
        }
        if (lowered == "cpu" || lowered == "cpu_blur") {
            return Strategy::CPU;
        }
        throw std::invalid_argument("Unknown smoothing strategy: '" + value + "' (expected 'cascade' or 'cpu').");
    }
}

#endif // ONEIRO_SMOOTHING_HPP
