#ifndef ONEIRO_COMMON_ERROR_HPP
#define ONEIRO_COMMON_ERROR_HPP

#include <stdexcept>
#include <string>

// Failures are deterministic input-validation errors: they are thrown at the
// point of detection and never retried. Non-finite tensor values (NaN/Inf) are
// not checked anywhere in the library, keeping them out is the caller's job.
namespace Oneiro::Error {

    struct UnknownProfile : std::out_of_range {
        explicit UnknownProfile(const std::string& identifier)
            : std::out_of_range("Unknown normalization profile: '" + identifier + "'"), identifier_(identifier) {}

        [[nodiscard]] const std::string& identifier() const noexcept { return identifier_; }

    private:
        std::string identifier_;
    };

    struct InvalidProfile : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    struct InvalidPath : std::runtime_error {
        explicit InvalidPath(const std::string& path)
            : std::runtime_error("Image path does not exist: " + path), path_(path) {}

        [[nodiscard]] const std::string& path() const noexcept { return path_; }

    private:
        std::string path_;
    };

    struct ImageDecodeError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct ImageEncodeError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct InvalidShape : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    struct ShapeMismatch : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    struct ConfigError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };
}

#endif // ONEIRO_COMMON_ERROR_HPP
