#ifndef ONEIRO_IMAGE_TYPES_HPP
#define ONEIRO_IMAGE_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace Oneiro::Image::Type {
    enum class ResizeMode {
        ShorterSide, // shorter edge -> target size, aspect ratio kept
        Square       // both edges -> target size
    };

    struct LoadOptions {
        ResizeMode resize = ResizeMode::ShorterSide;
        std::optional<std::uint64_t> seed{}; // noise source only; empty = OpenCV's global generator
    };

    inline std::string resize_mode_to_string(ResizeMode mode) {
        switch (mode) {
            case ResizeMode::ShorterSide: return "shorter_side";
            case ResizeMode::Square: return "square";
        }
        return "shorter_side";
    }
}

#endif // ONEIRO_IMAGE_TYPES_HPP
