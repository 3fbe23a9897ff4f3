#ifndef ONEIRO_SMOOTHING_APPLY_HPP
#define ONEIRO_SMOOTHING_APPLY_HPP

#include <utility>
#include <variant>

#include <torch/torch.h>

#include <opencv2/core.hpp>

#include "../core.hpp"
#include "smoothing.hpp"

namespace Oneiro::Smoothing {

    [[nodiscard]] inline torch::Tensor apply(const CascadeDescriptor& descriptor, const torch::Tensor& gradient) {
        CascadeGaussianSmoothing module(descriptor.options);
        return module->forward(gradient);
    }

    [[nodiscard]] inline torch::Tensor apply(const CPUBlurDescriptor& descriptor, const torch::Tensor& gradient) {
        return Details::gaussian_blur(gradient, descriptor.options);
    }

    [[nodiscard]] inline torch::Tensor apply(const Descriptor& descriptor, const torch::Tensor& gradient) {
        return std::visit([&](const auto& alternative) { return apply(alternative, gradient); }, descriptor);
    }

    // Cascade blur of a detached host array, sigma * {0.5, 1, 2} summed.
    [[nodiscard]] inline cv::Mat GaussianBlur(const cv::Mat& gradient, double sigma) {
        return Details::gaussian_blur(gradient, CPUBlurOptions{.sigma = sigma});
    }

    [[nodiscard]] inline torch::Tensor GaussianBlur(const torch::Tensor& gradient, double sigma) {
        return Details::gaussian_blur(gradient, CPUBlurOptions{.sigma = sigma});
    }

    // Holds one strategy for the lifetime of a synthesis run. The cascade
    // kernel bank is built once and rebuilt only when the sigma changes.
    class Smoother {
    public:
        explicit Smoother(Descriptor descriptor) : descriptor_(std::move(descriptor))
        {
            rebuild();
        }

        [[nodiscard]] torch::Tensor operator()(const torch::Tensor& gradient)
        {
            return std::visit(Overloaded{
                [&](const CascadeDescriptor&) { return module_->forward(gradient); },
                [&](const CPUBlurDescriptor& blur) { return Details::gaussian_blur(gradient, blur.options); },
            }, descriptor_);
        }

        // Same as operator() with a per-call sigma (ascent loops often grow it
        // with the iteration index).
        [[nodiscard]] torch::Tensor operator()(const torch::Tensor& gradient, double sigma)
        {
            set_sigma(sigma);
            return (*this)(gradient);
        }

        void set_sigma(double sigma)
        {
            Details::check_sigma(sigma, "Smoother");
            const bool changed = std::visit([&](auto& alternative) {
                if (alternative.options.sigma == sigma) {
                    return false;
                }
                alternative.options.sigma = sigma;
                return true;
            }, descriptor_);
            if (changed) {
                rebuild();
            }
        }

        Smoother& to(const torch::Device& device)
        {
            device_ = device;
            if (module_) {
                module_->to(device);
            }
            return *this;
        }

        [[nodiscard]] const Descriptor& descriptor() const noexcept { return descriptor_; }
        [[nodiscard]] Strategy strategy() const noexcept { return strategy_of(descriptor_); }
        [[nodiscard]] const CascadeGaussianSmoothing& module() const noexcept { return module_; }

    private:
        void rebuild()
        {
            if (const auto* cascade = std::get_if<CascadeDescriptor>(&descriptor_)) {
                module_ = CascadeGaussianSmoothing(cascade->options);
                module_->to(device_);
            } else {
                Details::check_sigma(std::get<CPUBlurDescriptor>(descriptor_).options.sigma, "Smoother");
                module_ = CascadeGaussianSmoothing(nullptr);
            }
        }

        Descriptor descriptor_;
        CascadeGaussianSmoothing module_{nullptr};
        torch::Device device_{torch::kCPU};
    };
}

#endif // ONEIRO_SMOOTHING_APPLY_HPP
