#ifndef ONEIRO_SMOOTHING_DETAILS_BLUR_HPP
#define ONEIRO_SMOOTHING_DETAILS_BLUR_HPP

#include <cstdint>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "../../common/error.hpp"
#include "common.hpp"

namespace Oneiro::Smoothing::Details {

    struct CPUBlurOptions {
        double sigma{1.0};
        double truncate{4.0}; // kernel radius in standard deviations
    };

    // Odd kernel edge covering `truncate` standard deviations on each side.
    inline int blur_kernel_size(double sigma, double truncate) {
        const int radius = static_cast<int>(truncate * sigma + 0.5);
        return 2 * radius + 1;
    }

    // Host-side cascade blur on a dense array of any channel count; each
    // channel is filtered independently with mirrored borders (d c b a | a b c d).
    inline cv::Mat gaussian_blur(const cv::Mat& gradient, const CPUBlurOptions& options) {
        check_sigma(options.sigma, "CPU Gaussian blur");
        if (gradient.empty()) {
            throw Error::InvalidShape("CPU Gaussian blur expects a non-empty array.");
        }

        cv::Mat source;
        gradient.convertTo(source, CV_32F);

        cv::Mat total = cv::Mat::zeros(source.size(), source.type());
        cv::Mat blurred;
        for (const double coefficient : kCascadeCoefficients) {
            const double sigma = coefficient * options.sigma;
            const int ksize = blur_kernel_size(sigma, options.truncate);
            cv::GaussianBlur(source, blurred, cv::Size(ksize, ksize), sigma, sigma, cv::BORDER_REFLECT);
            total += blurred;
        }
        return total;
    }

    // Accepts (H, W), (C, H, W) or (N, C, H, W). Works on a detached host copy
    // and hands the result back on the source device and dtype.
    inline torch::Tensor gaussian_blur(const torch::Tensor& gradient, const CPUBlurOptions& options) {
        check_sigma(options.sigma, "CPU Gaussian blur");
        if (!gradient.defined() || gradient.dim() < 2 || gradient.dim() > 4) {
            throw Error::InvalidShape("CPU Gaussian blur expects a (H, W), (C, H, W) or (N, C, H, W) tensor.");
        }
        if (gradient.numel() == 0) {
            return gradient.detach().clone();
        }

        const auto height = gradient.size(-2);
        const auto width = gradient.size(-1);
        auto host = gradient.detach().to(torch::kCPU, torch::kFloat32).contiguous().view({-1, height, width});
        auto output = torch::empty_like(host);

        const auto plane_options = torch::TensorOptions().dtype(torch::kFloat32);
        for (int64_t plane = 0; plane < host.size(0); ++plane) {
            auto slice = host[plane];
            cv::Mat view(static_cast<int>(height), static_cast<int>(width), CV_32F, slice.data_ptr<float>());
            cv::Mat blurred = gaussian_blur(view, options);
            output[plane].copy_(torch::from_blob(blurred.ptr<float>(), {height, width}, plane_options));
        }

        return output.view(gradient.sizes()).to(gradient.device(), gradient.scalar_type());
    }
}

#endif // ONEIRO_SMOOTHING_DETAILS_BLUR_HPP
