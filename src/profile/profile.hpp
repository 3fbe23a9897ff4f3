#ifndef ONEIRO_PROFILE_PROFILE_HPP
#define ONEIRO_PROFILE_PROFILE_HPP

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "../common/error.hpp"

namespace Oneiro::Profile {
    inline constexpr std::size_t kChannels = 3;

    // Per-channel (RGB) statistics a feature-extraction network expects, and the
    // edge length source images are resized to before optimisation.
    struct NormalizationProfile {
        std::array<float, kChannels> mean{};
        std::array<float, kChannels> stdv{};
        std::int64_t target_size{0};

        // Normalized-space images of the pixel values 0 and 1 for a channel.
        [[nodiscard]] std::pair<float, float> bounds(std::size_t channel) const {
            const auto m = mean.at(channel);
            const auto s = stdv.at(channel);
            return {-m / s, (1.0f - m) / s};
        }
    };

    inline void validate(const NormalizationProfile& profile, const std::string& identifier) {
        for (std::size_t c = 0; c < kChannels; ++c) {
            if (!std::isfinite(profile.mean[c])) {
                throw Error::InvalidProfile("Profile '" + identifier + "' has a non-finite mean for channel " + std::to_string(c));
            }
            if (!(profile.stdv[c] > 0.0f) || !std::isfinite(profile.stdv[c])) {
                throw Error::InvalidProfile("Profile '" + identifier + "' requires strictly positive standard deviations (channel "
                                            + std::to_string(c) + ")");
            }
        }
        if (profile.target_size <= 0) {
            throw Error::InvalidProfile("Profile '" + identifier + "' requires a positive target size");
        }
    }

    namespace Details {
        // ImageNet statistics used by torchvision's VGG19 weights.
        [[nodiscard]] inline NormalizationProfile vgg19() {
            return NormalizationProfile{
                .mean = {0.485f, 0.456f, 0.406f},
                .stdv = {0.229f, 0.224f, 0.225f},
                .target_size = 600,
            };
        }
    }
}

#endif // ONEIRO_PROFILE_PROFILE_HPP
