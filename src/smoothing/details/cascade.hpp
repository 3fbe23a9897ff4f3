#ifndef ONEIRO_SMOOTHING_DETAILS_CASCADE_HPP
#define ONEIRO_SMOOTHING_DETAILS_CASCADE_HPP

#include <array>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <stdexcept>
#include <string>

#include <torch/nn/functional.h>
#include <torch/torch.h>

#include "../../common/error.hpp"
#include "common.hpp"

namespace Oneiro::Smoothing::Details {

    struct CascadeOptions {
        std::int64_t kernel_size{9};
        double sigma{1.0};
        std::int64_t channels{3};
    };

    // k x k isotropic Gaussian centred at (k - 1) / 2, normalised to unit sum.
    inline torch::Tensor gaussian_kernel(std::int64_t kernel_size, double sigma) {
        auto grid = torch::arange(kernel_size, torch::TensorOptions().dtype(torch::kFloat64));
        const double mean = static_cast<double>(kernel_size - 1) / 2.0;
        auto density = torch::exp(-((grid - mean) / sigma).pow(2) / 2.0) / (sigma * std::sqrt(2.0 * std::numbers::pi));
        auto kernel = density.unsqueeze(1) * density.unsqueeze(0);
        kernel = kernel / kernel.sum();
        return kernel.to(torch::kFloat32);
    }

    // Three-scale depthwise Gaussian smoothing: the input is reflect-padded by
    // kernel_size / 2, filtered at sigma * {0.5, 1, 2}, and the three results are
    // summed. Each channel is filtered on its own; the kernel bank is fixed at
    // construction.
    class CascadeGaussianSmoothingImpl : public torch::nn::Module {
    public:
        explicit CascadeGaussianSmoothingImpl(CascadeOptions options) : options_(options)
        {
            if (options_.kernel_size <= 0 || options_.kernel_size % 2 == 0) {
                throw std::invalid_argument("Cascade smoothing requires an odd, positive kernel size (received "
                                            + std::to_string(options_.kernel_size) + ").");
            }
            check_sigma(options_.sigma, "Cascade smoothing");
            if (options_.channels <= 0) {
                throw std::invalid_argument("Cascade smoothing requires a positive channel count.");
            }

            pad_ = options_.kernel_size / 2;

            std::array<torch::Tensor, 3> prepared{};
            for (std::size_t i = 0; i < kCascadeCoefficients.size(); ++i) {
                auto kernel = gaussian_kernel(options_.kernel_size, kCascadeCoefficients[i] * options_.sigma);
                prepared[i] = kernel.view({1, 1, options_.kernel_size, options_.kernel_size})
                                  .repeat({options_.channels, 1, 1, 1})
                                  .contiguous();
            }
            weight1_ = register_buffer("weight1", prepared[0]);
            weight2_ = register_buffer("weight2", prepared[1]);
            weight3_ = register_buffer("weight3", prepared[2]);
        }

        CascadeGaussianSmoothingImpl(std::int64_t kernel_size, double sigma, std::int64_t channels = 3)
            : CascadeGaussianSmoothingImpl(CascadeOptions{kernel_size, sigma, channels}) {}

        torch::Tensor forward(const torch::Tensor& input)
        {
            if (!input.defined() || input.dim() != 4) {
                throw Error::InvalidShape("Cascade smoothing expects a (N, C, H, W) tensor.");
            }
            if (input.size(1) != options_.channels) {
                throw Error::ShapeMismatch("Cascade smoothing kernel bank was built for " + std::to_string(options_.channels)
                                           + " channel(s) but the input has " + std::to_string(input.size(1)) + ".");
            }
            if (input.size(2) <= pad_ || input.size(3) <= pad_) {
                throw Error::InvalidShape("Cascade smoothing needs spatial dimensions larger than the reflect padding ("
                                          + std::to_string(pad_) + ").");
            }

            namespace F = torch::nn::functional;
            auto padded = F::pad(input, F::PadFuncOptions({pad_, pad_, pad_, pad_}).mode(torch::kReflect));
            const auto conv_options = F::Conv2dFuncOptions().groups(options_.channels);

            auto match = [&](const torch::Tensor& weight) {
                return weight.to(input.device(), input.scalar_type());
            };
            auto grad1 = F::conv2d(padded, match(weight1_), conv_options);
            auto grad2 = F::conv2d(padded, match(weight2_), conv_options);
            auto grad3 = F::conv2d(padded, match(weight3_), conv_options);
            return grad1 + grad2 + grad3;
        }

        // The three (k, k) spatial kernels, smallest sigma first.
        [[nodiscard]] std::array<torch::Tensor, 3> kernels() const
        {
            return {weight1_[0][0], weight2_[0][0], weight3_[0][0]};
        }

        [[nodiscard]] const CascadeOptions& options() const noexcept { return options_; }
        [[nodiscard]] std::int64_t padding() const noexcept { return pad_; }

    private:
        CascadeOptions options_{};
        std::int64_t pad_{0};
        torch::Tensor weight1_{};
        torch::Tensor weight2_{};
        torch::Tensor weight3_{};
    };

    TORCH_MODULE(CascadeGaussianSmoothing);
}

#endif // ONEIRO_SMOOTHING_DETAILS_CASCADE_HPP
