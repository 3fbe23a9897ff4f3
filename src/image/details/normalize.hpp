#ifndef ONEIRO_IMAGE_DETAILS_NORMALIZE_HPP
#define ONEIRO_IMAGE_DETAILS_NORMALIZE_HPP

#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/error.hpp"
#include "../../profile/profile.hpp"

namespace Oneiro::Image::Details {
    inline std::string format_shape(const torch::Tensor& tensor) {
        std::ostringstream stream;
        stream << '(';
        for (int64_t i = 0; i < tensor.dim(); ++i) {
            if (i > 0) {
                stream << ", ";
            }
            stream << tensor.size(i);
        }
        stream << ')';
        return stream.str();
    }

    inline torch::Tensor to_float32(const torch::Tensor& tensor) {
        return tensor.scalar_type() == torch::kFloat32 ? tensor : tensor.to(torch::kFloat32);
    }

    // Profile statistics broadcastable against a (C, H, W) tensor.
    inline std::pair<torch::Tensor, torch::Tensor> channel_stats(const Profile::NormalizationProfile& profile,
                                                                 const torch::TensorOptions& options) {
        const auto host = torch::TensorOptions().dtype(torch::kFloat32);
        auto mean = torch::tensor(std::vector<float>(profile.mean.begin(), profile.mean.end()), host);
        auto stdv = torch::tensor(std::vector<float>(profile.stdv.begin(), profile.stdv.end()), host);
        const auto C = static_cast<int64_t>(Profile::kChannels);
        return {mean.view({C, 1, 1}).to(options), stdv.view({C, 1, 1}).to(options)};
    }

    inline void check_pixel_image(const torch::Tensor& pixels) {
        if (!pixels.defined()) {
            throw Error::InvalidShape("Pixel image tensor must be defined.");
        }
        if (pixels.dim() != 3 || pixels.size(2) != static_cast<int64_t>(Profile::kChannels)) {
            throw Error::InvalidShape("Pixel image must have shape (H, W, 3); received " + format_shape(pixels));
        }
    }

    inline void check_image_tensor(const torch::Tensor& tensor) {
        if (!tensor.defined()) {
            throw Error::InvalidShape("Image tensor must be defined.");
        }
        if (tensor.dim() != 4) {
            throw Error::InvalidShape("Image tensor must have shape (1, 3, H, W); received " + format_shape(tensor));
        }
        if (tensor.size(0) != 1) {
            throw Error::InvalidShape("Image tensor batch dimension must be exactly 1; received " + format_shape(tensor));
        }
        if (tensor.size(1) != static_cast<int64_t>(Profile::kChannels)) {
            throw Error::InvalidShape("Image tensor must carry 3 channels; received " + format_shape(tensor));
        }
    }
}

#endif // ONEIRO_IMAGE_DETAILS_NORMALIZE_HPP
