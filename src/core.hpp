#ifndef ONEIRO_CORE_HPP
#define ONEIRO_CORE_HPP
/*
 * Core entry points shared by every module.
 * ---------------------------------------------------------------------------
 *  - Device selection for the tensors handled by the regularization
 *    primitives. Heavy numeric work (convolution, clamping, smoothing) runs on
 *    whichever device the caller placed its tensors and modules on; nothing in
 *    the library moves data behind the caller's back except the CPU blur path,
 *    which by definition works on host memory.
 *  - Console reporting of the chosen device, in the same colour scheme as the
 *    rest of the library's output.
 */

#include <stdexcept>
#include <string>

#include <torch/torch.h>
#include <torch/cuda.h>

#include "utils/terminal.hpp"

namespace Oneiro {
    template <class... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };

    template <class... Ts>
    Overloaded(Ts...) -> Overloaded<Ts...>;

    namespace Core {
        enum class DeviceRequest {
            Auto,
            CPU,
            CUDA
        };

        template <DeviceRequest Request>
        struct DevicePolicy {
            [[nodiscard]] static torch::Device select() {
                if constexpr (Request == DeviceRequest::CUDA) {
                    if (!torch::cuda::is_available()) {
                        throw std::runtime_error("CUDA device requested but is unavailable.");
                    }
                    return torch::Device(torch::kCUDA);
                } else if constexpr (Request == DeviceRequest::CPU) {
                    return torch::Device(torch::kCPU);
                } else {
                    return torch::cuda::is_available() ? torch::Device(torch::kCUDA) : torch::Device(torch::kCPU);
                }
            }
        };

        // Picks CUDA when present and reports the choice on stdout.
        [[nodiscard]] inline torch::Device SelectDevice(bool verbose = true) {
            auto device = DevicePolicy<DeviceRequest::Auto>::select();
            if (verbose) {
                if (device.is_cuda()) {
                    Utils::Terminal::Info("Using GPU.");
                } else {
                    Utils::Terminal::Warn("GPU isn't available, CPU is being used.");
                }
            }
            return device;
        }
    }
}

#endif // ONEIRO_CORE_HPP
