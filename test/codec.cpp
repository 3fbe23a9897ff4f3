#include <cmath>
#include <fstream>
#include <optional>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "../include/Oneiro.h"
#include "support.hpp"

namespace {
    cv::Mat gradient_image(int rows, int cols) {
        cv::Mat image(rows, cols, CV_8UC3);
        for (int r = 0; r < rows; ++r) {
            for (int c = 0; c < cols; ++c) {
                image.at<cv::Vec3b>(r, c) = cv::Vec3b(static_cast<uchar>(r % 256), static_cast<uchar>(c % 256), static_cast<uchar>((r + c) % 256));
            }
        }
        return image;
    }
}

int main() {
    Oneiro::Test::Suite suite("codec");
    const auto& profile = Oneiro::Profile::Resolve("vgg19");
    Oneiro::Test::TemporaryDirectory scratch("oneiro_codec");

    // Noise source for dream-from-scratch mode.
    {
        const auto noise = Oneiro::Image::LoadSource(std::nullopt, profile);
        suite.expect(noise.rows == 600 && noise.cols == 600 && noise.type() == CV_8UC3, "noise source is 600x600 RGB");

        const auto tensor = Oneiro::Image::Normalize(noise, profile);
        suite.expect(tensor.sizes().vec() == std::vector<int64_t>{1, 3, 600, 600}, "normalized noise has shape (1, 3, 600, 600)");
        for (int64_t c = 0; c < 3; ++c) {
            const auto [lo, hi] = profile.bounds(static_cast<std::size_t>(c));
            const auto channel = tensor[0][c];
            suite.expect(channel.min().item<float>() >= lo - 1e-5f, "noise channel " + std::to_string(c) + " above pixel 0");
            suite.expect(channel.max().item<float>() <= hi + 1e-5f, "noise channel " + std::to_string(c) + " below pixel 1");
        }
        const auto spread = tensor.max().item<float>() - tensor.min().item<float>();
        suite.expect(spread > 3.0f, "noise spans most of the normalized range");
    }

    {
        const Oneiro::Image::Type::LoadOptions seeded{.seed = 1234};
        const auto first = Oneiro::Image::LoadSource(std::nullopt, profile, seeded);
        const auto second = Oneiro::Image::LoadSource(std::nullopt, profile, seeded);
        suite.expect(cv::norm(first, second, cv::NORM_INF) == 0.0, "seeded noise is reproducible");
    }

    // Round trip in the pixel domain.
    {
        torch::manual_seed(0);
        const auto pixels = torch::rand({17, 23, 3});
        const auto tensor = Oneiro::Image::Normalize(pixels, profile);
        suite.expect(tensor.sizes().vec() == std::vector<int64_t>{1, 3, 17, 23}, "normalize adds the batch axis and moves channels first");
        suite.expect_close(Oneiro::Image::Denormalize(tensor, profile), pixels, 1e-5, "denormalize inverts normalize");

        const auto expected_red = (pixels.select(2, 0) - 0.485f) / 0.229f;
        suite.expect_close(tensor[0][0], expected_red, 1e-5, "red channel uses the red statistics");
    }

    {
        cv::Mat extremes(1, 2, CV_8UC3);
        extremes.at<cv::Vec3b>(0, 0) = cv::Vec3b(0, 0, 0);
        extremes.at<cv::Vec3b>(0, 1) = cv::Vec3b(255, 255, 255);
        const auto pixels = Oneiro::Image::ToTensor(extremes);
        suite.expect(pixels[0][0].max().item<float>() == 0.0f, "byte 0 maps to 0");
        suite.expect(std::abs(pixels[0][1].min().item<float>() - 1.0f) < 1e-6f, "byte 255 maps to 1");
    }

    // Decoding, colour order and resizing of real files.
    {
        const auto path = scratch.path() / "wide.png";
        cv::imwrite(path.string(), gradient_image(200, 300));
        const auto loaded = Oneiro::Image::LoadSource(path.string(), profile);
        suite.expect(loaded.rows == 600 && loaded.cols == 900, "shorter side is resized to the target size");

        const auto square = Oneiro::Image::LoadSource(path.string(), profile, {.resize = Oneiro::Image::Type::ResizeMode::Square});
        suite.expect(square.rows == 600 && square.cols == 600, "square mode resizes both sides");
    }

    {
        const auto path = scratch.path() / "tall.png";
        cv::imwrite(path.string(), gradient_image(1200, 800));
        const auto loaded = Oneiro::Image::LoadSource(path.string(), profile);
        suite.expect(loaded.rows == 900 && loaded.cols == 600, "large images are shrunk on the shorter side");
    }

    {
        const auto path = scratch.path() / "red.png";
        cv::Mat red(600, 600, CV_8UC3, cv::Scalar(0, 0, 255)); // BGR
        cv::imwrite(path.string(), red);
        const auto loaded = Oneiro::Image::LoadSource(path.string(), profile);
        const auto pixel = loaded.at<cv::Vec3b>(10, 10);
        suite.expect(pixel[0] == 255 && pixel[1] == 0 && pixel[2] == 0, "decoded image is in RGB order");
    }

    suite.expect_throws<Oneiro::Error::InvalidPath>([&] {
        static_cast<void>(Oneiro::Image::LoadSource((scratch.path() / "missing.jpg").string(), profile));
    }, "missing file is reported as an invalid path");
    suite.expect_throws<Oneiro::Error::InvalidPath>([&] {
        static_cast<void>(Oneiro::Image::LoadSource(scratch.path().string(), profile));
    }, "directory is reported as an invalid path");

    {
        const auto path = scratch.path() / "corrupt.png";
        std::ofstream(path) << "definitely not a png";
        suite.expect_throws<Oneiro::Error::ImageDecodeError>([&] {
            static_cast<void>(Oneiro::Image::LoadSource(path.string(), profile));
        }, "undecodable file is reported as a decode error");
    }

    // Shape validation.
    suite.expect_throws<Oneiro::Error::InvalidShape>([&] {
        static_cast<void>(Oneiro::Image::Denormalize(torch::zeros({2, 3, 8, 8}), profile));
    }, "batch of two cannot be denormalized");
    suite.expect_throws<Oneiro::Error::InvalidShape>([&] {
        static_cast<void>(Oneiro::Image::Denormalize(torch::zeros({1, 4, 8, 8}), profile));
    }, "four channels cannot be denormalized");
    suite.expect_throws<Oneiro::Error::InvalidShape>([&] {
        static_cast<void>(Oneiro::Image::Denormalize(torch::zeros({3, 8, 8}), profile));
    }, "missing batch axis cannot be denormalized");
    suite.expect_throws<Oneiro::Error::InvalidShape>([&] {
        static_cast<void>(Oneiro::Image::Normalize(torch::zeros({8, 8, 4}), profile));
    }, "four-channel pixels cannot be normalized");

    // Denormalize keeps autograd out of the pixel image.
    {
        auto tensor = Oneiro::Image::Normalize(torch::rand({5, 5, 3}), profile).requires_grad_(true);
        const auto pixels = Oneiro::Image::Denormalize(tensor * 1.0, profile);
        suite.expect(!pixels.requires_grad(), "denormalized image is detached");
        suite.expect(pixels.sizes().vec() == std::vector<int64_t>{5, 5, 3}, "denormalized image is channel-last");
    }

    // Encoding back to disk.
    {
        const auto source = gradient_image(64, 64);
        cv::Mat rgb;
        cv::cvtColor(source, rgb, cv::COLOR_BGR2RGB);
        const auto pixels = Oneiro::Image::Denormalize(Oneiro::Image::Normalize(rgb, profile), profile);
        const auto path = scratch.path() / "saved.png";
        Oneiro::Image::Save(pixels, path);
        const auto reread = cv::imread(path.string(), cv::IMREAD_COLOR);
        suite.expect(!reread.empty() && cv::norm(reread, source, cv::NORM_INF) <= 1.0, "saved image matches the source raster");
    }

    suite.expect_throws<Oneiro::Error::ImageEncodeError>([&] {
        Oneiro::Image::Save(torch::rand({4, 4, 3}), scratch.path() / "no_such_dir" / "out.png");
    }, "unwritable destination is reported");

    return suite.finish();
}
