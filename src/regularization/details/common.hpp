#ifndef ONEIRO_REGULARIZATION_DETAILS_COMMON_HPP
#define ONEIRO_REGULARIZATION_DETAILS_COMMON_HPP

#include <cstdint>
#include <sstream>
#include <string>

#include <torch/torch.h>

#include "../../common/error.hpp"

namespace Oneiro::Regularization::Details::detail {

    [[nodiscard]] inline std::string format_shape(const torch::Tensor& tensor)
    {
        std::ostringstream stream;
        stream << '(';
        for (std::int64_t i = 0; i < tensor.dim(); ++i) {
            if (i > 0) {
                stream << ", ";
            }
            stream << tensor.size(i);
        }
        stream << ')';
        return stream.str();
    }

    // (N, C, H, W) with a floating dtype.
    inline void check_channels_first(const torch::Tensor& tensor, const char* operation)
    {
        if (!tensor.defined()) {
            throw Error::InvalidShape(std::string(operation) + " expects a defined tensor.");
        }
        if (tensor.dim() != 4) {
            throw Error::InvalidShape(std::string(operation) + " expects a (N, C, H, W) tensor; received "
                                      + format_shape(tensor));
        }
        if (!tensor.is_floating_point()) {
            throw Error::InvalidShape(std::string(operation) + " expects a floating point tensor.");
        }
    }

}

#endif // ONEIRO_REGULARIZATION_DETAILS_COMMON_HPP
