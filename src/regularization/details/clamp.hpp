#ifndef ONEIRO_REGULARIZATION_DETAILS_CLAMP_HPP
#define ONEIRO_REGULARIZATION_DETAILS_CLAMP_HPP

#include <array>
#include <cstddef>
#include <utility>

#include <torch/torch.h>

#include "../../common/error.hpp"
#include "../../profile/profile.hpp"
#include "common.hpp"

namespace Oneiro::Regularization::Details {

    using ChannelBounds = std::array<std::pair<float, float>, Profile::kChannels>;

    [[nodiscard]] inline ChannelBounds bounds(const Profile::NormalizationProfile& profile)
    {
        ChannelBounds result{};
        for (std::size_t c = 0; c < Profile::kChannels; ++c) {
            result[c] = profile.bounds(c);
        }
        return result;
    }

    // Overwrites values in place; autograd flags and leaf status are untouched.
    inline torch::Tensor& clip(torch::Tensor& tensor, const Profile::NormalizationProfile& profile)
    {
        detail::check_channels_first(tensor, "Clip");
        if (tensor.size(1) != static_cast<int64_t>(Profile::kChannels)) {
            throw Error::InvalidShape("Clip expects 3 channels; received " + detail::format_shape(tensor));
        }

        torch::NoGradGuard guard;
        const auto limits = bounds(profile);
        for (std::size_t c = 0; c < Profile::kChannels; ++c) {
            const auto [lo, hi] = limits[c];
            tensor.select(1, static_cast<int64_t>(c)).clamp_(lo, hi);
        }
        return tensor;
    }

}

#endif // ONEIRO_REGULARIZATION_DETAILS_CLAMP_HPP
