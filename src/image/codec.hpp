#ifndef ONEIRO_IMAGE_CODEC_HPP
#define ONEIRO_IMAGE_CODEC_HPP
/*
 * Conversions between the pixel domain and the normalized tensor domain.
 *   LoadSource  : file (or noise) -> RGB raster, resized per profile
 *   ToTensor    : raster          -> (H, W, 3) float in [0, 1]
 *   Normalize   : (H, W, 3)       -> (1, 3, H, W), (x - mean) / stdv
 *   Denormalize : (1, 3, H, W)    -> (H, W, 3), x * stdv + mean
 *   ToMat/Save  : (H, W, 3)       -> 8-bit BGR raster / encoded file
 */

#include <filesystem>
#include <optional>
#include <cstdint>
#include <string>

#include <torch/torch.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "../common/error.hpp"
#include "../profile/profile.hpp"
#include "details/load.hpp"
#include "details/normalize.hpp"
#include "types.hpp"

namespace Oneiro::Image {
    // Without a path the source is uniform noise of target_size x target_size
    // (dream-from-scratch). Returns CV_8UC3 in RGB order.
    [[nodiscard]] inline cv::Mat LoadSource(const std::optional<std::string>& path,
                                            const Profile::NormalizationProfile& profile,
                                            const Type::LoadOptions& options = {}) {
        if (!path.has_value()) {
            return Details::uniform_noise(profile.target_size, options.seed);
        }
        auto image = Details::decode_rgb(std::filesystem::path(*path));
        return Details::resize_to_profile(image, profile.target_size, options.resize);
    }

    [[nodiscard]] inline torch::Tensor ToTensor(const cv::Mat& image) {
        if (image.empty()) {
            throw Error::InvalidShape("Cannot convert an empty image to a tensor.");
        }
        if (image.type() != CV_8UC3 && image.type() != CV_32FC3) {
            throw Error::InvalidShape("Expected an 8-bit or float 3-channel image (received " + std::to_string(image.channels())
                                      + " channel(s), depth " + std::to_string(image.depth()) + ").");
        }

        cv::Mat image_float;
        const double scale = image.depth() == CV_8U ? (1.0 / 255.0) : 1.0;
        image.convertTo(image_float, CV_32F, scale);

        const auto options = torch::TensorOptions().dtype(torch::kFloat32);
        return torch::from_blob(image_float.data, {image_float.rows, image_float.cols, 3}, options).clone();
    }

    [[nodiscard]] inline torch::Tensor Normalize(const torch::Tensor& pixels, const Profile::NormalizationProfile& profile) {
        Details::check_pixel_image(pixels);
        auto chw = Details::to_float32(pixels).permute({2, 0, 1});
        const auto [mean, stdv] = Details::channel_stats(profile, chw.options());
        return ((chw - mean) / stdv).unsqueeze(0).contiguous();
    }

    [[nodiscard]] inline torch::Tensor Normalize(const cv::Mat& image, const Profile::NormalizationProfile& profile) {
        return Normalize(ToTensor(image), profile);
    }

    // Result is detached and host-resident, ready for display or encoding.
    [[nodiscard]] inline torch::Tensor Denormalize(const torch::Tensor& tensor, const Profile::NormalizationProfile& profile) {
        Details::check_image_tensor(tensor);
        auto chw = Details::to_float32(tensor.detach().to(torch::kCPU)).squeeze(0);
        const auto [mean, stdv] = Details::channel_stats(profile, chw.options());
        return (chw * stdv + mean).permute({1, 2, 0}).contiguous();
    }

    [[nodiscard]] inline cv::Mat ToMat(const torch::Tensor& pixels) {
        Details::check_pixel_image(pixels);
        auto bytes = Details::to_float32(pixels.detach().to(torch::kCPU))
                         .clamp(0.0, 1.0)
                         .mul(255.0)
                         .round()
                         .to(torch::kUInt8)
                         .contiguous();

        cv::Mat rgb(static_cast<int>(bytes.size(0)), static_cast<int>(bytes.size(1)), CV_8UC3, bytes.data_ptr<std::uint8_t>());
        cv::Mat bgr;
        cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);
        return bgr;
    }

    inline void Save(const cv::Mat& bgr, const std::filesystem::path& path) {
        bool written = false;
        try {
            written = cv::imwrite(path.string(), bgr);
        } catch (const cv::Exception& error) {
            throw Error::ImageEncodeError("Failed to encode image '" + path.string() + "': " + error.what());
        }
        if (!written) {
            throw Error::ImageEncodeError("Failed to write image: " + path.string());
        }
    }

    inline void Save(const torch::Tensor& pixels, const std::filesystem::path& path) {
        Save(ToMat(pixels), path);
    }
}

#endif // ONEIRO_IMAGE_CODEC_HPP
