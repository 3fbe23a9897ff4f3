#ifndef ONEIRO_REGULARIZATION_HPP
#define ONEIRO_REGULARIZATION_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstdint>

#include <torch/torch.h>

#include "../profile/profile.hpp"
#include "details/clamp.hpp"
#include "details/jitter.hpp"

namespace Oneiro::Regularization {

    using ShiftOffset = Details::ShiftOffset;
    using ChannelBounds = Details::ChannelBounds;

    [[nodiscard]] inline ChannelBounds Bounds(const Profile::NormalizationProfile& profile) {
        return Details::bounds(profile);
    }

    inline torch::Tensor& Clip(torch::Tensor& tensor, const Profile::NormalizationProfile& profile) {
        return Details::clip(tensor, profile);
    }

    [[nodiscard]] inline torch::Tensor Shift(const torch::Tensor& tensor, ShiftOffset offset, bool undo = false) {
        return Details::shift(tensor, offset, undo);
    }

    [[nodiscard]] inline torch::Tensor Shift(const torch::Tensor& tensor,
                                             std::int64_t vertical,
                                             std::int64_t horizontal,
                                             bool undo = false) {
        return Details::shift(tensor, ShiftOffset{vertical, horizontal}, undo);
    }
}

#endif // ONEIRO_REGULARIZATION_HPP
