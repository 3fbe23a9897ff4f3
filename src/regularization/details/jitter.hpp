#ifndef ONEIRO_REGULARIZATION_DETAILS_JITTER_HPP
#define ONEIRO_REGULARIZATION_DETAILS_JITTER_HPP

#include <cstdint>

#include <torch/torch.h>

#include "../../common/error.hpp"

namespace Oneiro::Regularization::Details {

    struct ShiftOffset {
        std::int64_t vertical{0};
        std::int64_t horizontal{0};

        [[nodiscard]] ShiftOffset inverse() const { return {-vertical, -horizontal}; }
    };

    // Circular roll over the two trailing (H, W) axes of a (C, H, W) or
    // (N, C, H, W) tensor. The roll is a permutation: nothing is lost or
    // zero-filled and offsets beyond the extent wrap. It is taken outside the
    // autograd graph and the result comes back as a fresh leaf that requires
    // grad, so the ascent loop can differentiate through whatever follows.
    [[nodiscard]] inline torch::Tensor shift(const torch::Tensor& tensor, ShiftOffset offset, bool undo = false)
    {
        if (!tensor.defined() || tensor.dim() < 3) {
            throw Error::InvalidShape("Shift expects a (C, H, W) or (N, C, H, W) tensor.");
        }
        if (!tensor.is_floating_point()) {
            throw Error::InvalidShape("Shift expects a floating point tensor.");
        }
        if (undo) {
            offset = offset.inverse();
        }

        torch::Tensor rolled;
        {
            torch::NoGradGuard guard;
            rolled = torch::roll(tensor, {offset.vertical, offset.horizontal}, {-2, -1});
        }
        rolled.set_requires_grad(true);
        return rolled;
    }

}

#endif // ONEIRO_REGULARIZATION_DETAILS_JITTER_HPP
