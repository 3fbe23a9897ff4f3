#ifndef ONEIRO_TEST_SUPPORT_HPP
#define ONEIRO_TEST_SUPPORT_HPP

#include <exception>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <system_error>
#include <utility>

#include <torch/torch.h>

#include "../src/utils/terminal.hpp"

namespace Oneiro::Test {
    class Suite {
    public:
        explicit Suite(std::string name) : name_(std::move(name)) {}

        void expect(bool condition, const std::string& message) {
            ++checks_;
            if (!condition) {
                ++failures_;
                std::cerr << Utils::Terminal::ApplyColor(Utils::Terminal::Symbols::kCross, Utils::Terminal::Colors::kBrightRed)
                          << ' ' << name_ << ": " << message << '\n';
            }
        }

        void expect_close(const torch::Tensor& actual, const torch::Tensor& expected, double tolerance, const std::string& message) {
            if (!actual.sizes().equals(expected.sizes())) {
                expect(false, message + " (shape mismatch)");
                return;
            }
            const double error = (actual - expected).abs().max().item<double>();
            expect(error <= tolerance, message + " (max error " + std::to_string(error) + ")");
        }

        // Runs `body` and reports whether it threw `Exception`.
        template <class Exception, class Body>
        void expect_throws(Body&& body, const std::string& message) {
            bool thrown = false;
            try {
                body();
            } catch (const Exception&) {
                thrown = true;
            } catch (const std::exception& error) {
                expect(false, message + " (unexpected exception: " + error.what() + ")");
                return;
            }
            expect(thrown, message + " (nothing thrown)");
        }

        [[nodiscard]] int finish() const {
            if (failures_ > 0) {
                std::cerr << name_ << ": " << failures_ << " of " << checks_ << " checks failed." << '\n';
                return 1;
            }
            std::cout << Utils::Terminal::ApplyColor(Utils::Terminal::Symbols::kCheck, Utils::Terminal::Colors::kBrightGreen)
                      << ' ' << name_ << ": " << checks_ << " checks passed." << std::endl;
            return 0;
        }

    private:
        std::string name_;
        int checks_{0};
        int failures_{0};
    };

    // Fresh directory under the system temp dir, removed on destruction.
    class TemporaryDirectory {
    public:
        explicit TemporaryDirectory(const std::string& stem) {
            path_ = std::filesystem::temp_directory_path() / (stem + "_" + std::to_string(std::random_device{}()));
            std::filesystem::create_directories(path_);
        }
        ~TemporaryDirectory() {
            std::error_code error;
            std::filesystem::remove_all(path_, error);
        }
        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };
}

#endif // ONEIRO_TEST_SUPPORT_HPP
