#ifndef ONEIRO_IMAGE_DETAILS_LOAD_HPP
#define ONEIRO_IMAGE_DETAILS_LOAD_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "../../common/error.hpp"
#include "../../profile/profile.hpp"
#include "../types.hpp"

namespace Oneiro::Image::Details {
    // (rows, cols) after resizing so that the shorter edge equals target_size.
    // The longer edge is truncated, not rounded.
    inline std::pair<int, int> shorter_side_size(int rows, int cols, std::int64_t target_size) {
        const auto target = static_cast<int>(target_size);
        if (rows <= cols) {
            const auto long_edge = static_cast<int>(static_cast<double>(target) * cols / rows);
            return {target, long_edge};
        }
        const auto long_edge = static_cast<int>(static_cast<double>(target) * rows / cols);
        return {long_edge, target};
    }

    inline cv::Mat resize_to_profile(const cv::Mat& image, std::int64_t target_size, Type::ResizeMode mode) {
        int rows = static_cast<int>(target_size);
        int cols = static_cast<int>(target_size);
        if (mode == Type::ResizeMode::ShorterSide) {
            std::tie(rows, cols) = shorter_side_size(image.rows, image.cols, target_size);
        }
        if (rows == image.rows && cols == image.cols) {
            return image;
        }

        const bool shrinking = static_cast<std::int64_t>(rows) * cols < static_cast<std::int64_t>(image.rows) * image.cols;
        cv::Mat resized;
        cv::resize(image, resized, cv::Size(cols, rows), 0.0, 0.0, shrinking ? cv::INTER_AREA : cv::INTER_LINEAR);
        return resized;
    }

    inline cv::Mat uniform_noise(std::int64_t target_size, const std::optional<std::uint64_t>& seed) {
        const auto edge = static_cast<int>(target_size);
        cv::Mat noise(edge, edge, CV_8UC3);
        // Integer uniform fill is half-open, so samples land in [0, 255).
        if (seed.has_value()) {
            cv::RNG rng(*seed);
            rng.fill(noise, cv::RNG::UNIFORM, cv::Scalar::all(0), cv::Scalar::all(255));
        } else {
            cv::randu(noise, cv::Scalar::all(0), cv::Scalar::all(255));
        }
        return noise;
    }

    inline cv::Mat decode_rgb(const std::filesystem::path& file_path) {
        std::error_code error;
        if (!std::filesystem::is_regular_file(file_path, error) || error) {
            throw Error::InvalidPath(file_path.string());
        }

        cv::Mat image = cv::imread(file_path.string(), cv::IMREAD_COLOR);
        if (image.empty()) {
            throw Error::ImageDecodeError("Failed to decode image: " + file_path.string());
        }

        cv::Mat rgb;
        cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);
        return rgb;
    }
}

#endif // ONEIRO_IMAGE_DETAILS_LOAD_HPP
