#ifndef ONEIRO_COMMON_CONFIG_HPP
#define ONEIRO_COMMON_CONFIG_HPP
/*
 * Run configuration read from a JSON file.
 * ---------------------------------------------------------------------------
 *  {
 *    "profile": "vgg19",
 *    "image": "input.jpg",                 // omitted -> noise source
 *    "resize": "shorter_side" | "square",
 *    "seed": 7,                            // noise source only
 *    "smoothing": { "strategy": "cascade" | "cpu", "kernel_size": 9, "sigma": 1.0 },
 *    "jitter": { "max_shift": 32 },
 *    "profiles": { "<id>": { "mean": [..3], "stdv": [..3], "target_size": n } }
 *  }
 * Every key is optional; missing keys keep the defaults below. The profile
 * registry is built from the same file and is read-only afterwards.
 */

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../image/types.hpp"
#include "../profile/registry.hpp"
#include "../smoothing/smoothing.hpp"
#include "../utils/terminal.hpp"
#include "error.hpp"
#include "save_load.hpp"

namespace Oneiro::Common::Config {
    struct SmoothingSettings {
        Smoothing::Strategy strategy{Smoothing::Strategy::Cascade};
        std::int64_t kernel_size{9};
        double sigma{1.0};
    };

    struct JitterSettings {
        std::int64_t max_shift{32};
    };

    struct Settings {
        std::string profile{"vgg19"};
        std::optional<std::string> image{};
        Image::Type::ResizeMode resize{Image::Type::ResizeMode::ShorterSide};
        std::optional<std::uint64_t> seed{};
        SmoothingSettings smoothing{};
        JitterSettings jitter{};

        [[nodiscard]] Smoothing::Descriptor descriptor(std::int64_t channels = 3) const
        {
            if (smoothing.strategy == Smoothing::Strategy::CPU) {
                return Smoothing::CPUBlurDescriptor{{.sigma = smoothing.sigma}};
            }
            return Smoothing::CascadeDescriptor{{.kernel_size = smoothing.kernel_size, .sigma = smoothing.sigma, .channels = channels}};
        }

        [[nodiscard]] Image::Type::LoadOptions load_options() const
        {
            return Image::Type::LoadOptions{.resize = resize, .seed = seed};
        }
    };

    struct Configuration {
        Settings settings{};
        Profile::Registry registry{};

        [[nodiscard]] const Profile::NormalizationProfile& profile() const
        {
            return registry.resolve(settings.profile);
        }
    };

    namespace Detail {
        inline Image::Type::ResizeMode resize_mode_from_string(const std::string& value)
        {
            const auto lowered = SaveLoad::Detail::to_lower(value);
            if (lowered == "shorter_side") {
                return Image::Type::ResizeMode::ShorterSide;
            }
            if (lowered == "square") {
                return Image::Type::ResizeMode::Square;
            }
            throw Error::ConfigError("Unknown resize mode: '" + value + "' (expected 'shorter_side' or 'square').");
        }

        inline void validate(const Settings& settings)
        {
            if (settings.smoothing.kernel_size <= 0 || settings.smoothing.kernel_size % 2 == 0) {
                throw Error::ConfigError("smoothing.kernel_size must be odd and positive (received "
                                         + std::to_string(settings.smoothing.kernel_size) + ").");
            }
            if (!(settings.smoothing.sigma > 0.0)) {
                throw Error::ConfigError("smoothing.sigma must be positive.");
            }
            if (settings.jitter.max_shift < 0) {
                throw Error::ConfigError("jitter.max_shift must not be negative.");
            }
        }
    }

    [[nodiscard]] inline Settings SettingsFromPropertyTree(const SaveLoad::PropertyTree& tree)
    {
        namespace SL = SaveLoad::Detail;
        Settings settings{};

        if (tree.get_child_optional("profile")) {
            settings.profile = SL::get_string(tree, "profile", "configuration");
        }
        if (tree.get_child_optional("image")) {
            settings.image = SL::get_string(tree, "image", "configuration");
        }
        if (tree.get_child_optional("resize")) {
            settings.resize = Detail::resize_mode_from_string(SL::get_string(tree, "resize", "configuration"));
        }
        if (tree.get_child_optional("seed")) {
            settings.seed = SL::get_numeric<std::uint64_t>(tree, "seed", "configuration");
        }

        if (const auto smoothing = tree.get_child_optional("smoothing")) {
            if (smoothing->get_child_optional("strategy")) {
                const auto name = SL::get_string(*smoothing, "strategy", "smoothing");
                try {
                    settings.smoothing.strategy = Smoothing::strategy_from_string(name);
                } catch (const std::invalid_argument& error) {
                    throw Error::ConfigError(error.what());
                }
            }
            settings.smoothing.kernel_size = SL::get_numeric_or<std::int64_t>(*smoothing, "kernel_size", settings.smoothing.kernel_size, "smoothing");
            settings.smoothing.sigma = SL::get_numeric_or<double>(*smoothing, "sigma", settings.smoothing.sigma, "smoothing");
        }

        if (const auto jitter = tree.get_child_optional("jitter")) {
            settings.jitter.max_shift = SL::get_numeric_or<std::int64_t>(*jitter, "max_shift", settings.jitter.max_shift, "jitter");
        }

        Detail::validate(settings);
        return settings;
    }

    // Throws Error::UnknownProfile when the selected profile is not registered.
    [[nodiscard]] inline Configuration FromPropertyTree(const SaveLoad::PropertyTree& tree)
    {
        Configuration configuration{SettingsFromPropertyTree(tree), Profile::Registry::FromPropertyTree(tree)};
        static_cast<void>(configuration.profile());
        return configuration;
    }

    [[nodiscard]] inline Configuration Load(const std::filesystem::path& path)
    {
        return FromPropertyTree(SaveLoad::read_json_file(path));
    }

    [[nodiscard]] inline SaveLoad::PropertyTree ToPropertyTree(const Configuration& configuration)
    {
        const auto& settings = configuration.settings;
        SaveLoad::PropertyTree tree;
        tree.put("profile", settings.profile);
        if (settings.image) {
            tree.put("image", *settings.image);
        }
        tree.put("resize", Image::Type::resize_mode_to_string(settings.resize));
        if (settings.seed) {
            tree.put("seed", *settings.seed);
        }
        tree.put("smoothing.strategy", Smoothing::strategy_to_string(settings.smoothing.strategy));
        tree.put("smoothing.kernel_size", settings.smoothing.kernel_size);
        tree.put("smoothing.sigma", settings.smoothing.sigma);
        tree.put("jitter.max_shift", settings.jitter.max_shift);

        SaveLoad::PropertyTree profiles;
        for (const auto& identifier : configuration.registry.identifiers()) {
            profiles.add_child(SaveLoad::PropertyTree::path_type(identifier, '\0'),
                               Profile::Registry::serialize(configuration.registry.resolve(identifier)));
        }
        tree.add_child("profiles", profiles);
        return tree;
    }

    inline void Save(const Configuration& configuration, const std::filesystem::path& path)
    {
        SaveLoad::write_json_file(path, ToPropertyTree(configuration));
    }

    inline void Summary(const Configuration& configuration, std::ostream& stream = std::cout)
    {
        using Utils::Terminal::ApplyColor;
        namespace Colors = Utils::Terminal::Colors;

        const auto& settings = configuration.settings;
        const auto& profile = configuration.profile();

        std::ostringstream body;
        body << std::fixed << std::setprecision(3);
        body << ApplyColor("profile", Colors::kBrightYellow) << "   : " << settings.profile
             << " (target " << profile.target_size << "px)\n";
        body << ApplyColor("source", Colors::kBrightYellow) << "    : " << settings.image.value_or("<noise>")
             << " [" << Image::Type::resize_mode_to_string(settings.resize) << "]\n";
        body << ApplyColor("smoothing", Colors::kBrightYellow) << " : " << Smoothing::strategy_to_string(settings.smoothing.strategy)
             << " k=" << settings.smoothing.kernel_size << " sigma=" << settings.smoothing.sigma << '\n';
        body << ApplyColor("jitter", Colors::kBrightYellow) << "    : max shift " << settings.jitter.max_shift << "px\n";

        stream << Utils::Terminal::TopBarRounded(40, Colors::kTurquoise) << '\n'
               << body.str()
               << Utils::Terminal::BottomBarRounded(40, Colors::kTurquoise) << '\n';
    }
}

#endif // ONEIRO_COMMON_CONFIG_HPP
