#ifndef ONEIRO_PROFILE_REGISTRY_HPP
#define ONEIRO_PROFILE_REGISTRY_HPP

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../common/error.hpp"
#include "../common/save_load.hpp"
#include "profile.hpp"

namespace Oneiro::Profile {
    // Closed table of immutable profiles keyed by model identifier. Entries are
    // fixed once the registry is constructed; every accessor is const, so a
    // built registry can be read from any thread.
    class Registry {
    public:
        using Table = std::map<std::string, NormalizationProfile, std::less<>>;

        Registry() : Registry(Baseline()) {}

        explicit Registry(Table entries) : entries_(std::move(entries))
        {
            for (const auto& [identifier, profile] : entries_) {
                validate(profile, identifier);
            }
        }

        [[nodiscard]] static Table Baseline()
        {
            return Table{{"vgg19", Details::vgg19()}};
        }

        [[nodiscard]] static const Registry& Default()
        {
            static const Registry registry{};
            return registry;
        }

        // Baseline entries plus the optional "profiles" node:
        //   "profiles": { "<id>": { "mean": [r,g,b], "stdv": [r,g,b], "target_size": n } }
        // A configured entry replaces a baseline entry of the same name.
        [[nodiscard]] static Registry FromPropertyTree(const Common::SaveLoad::PropertyTree& tree)
        {
            auto entries = Baseline();
            if (const auto profiles = tree.get_child_optional("profiles")) {
                for (const auto& [identifier, node] : *profiles) {
                    entries.insert_or_assign(identifier, deserialize(node, identifier));
                }
            }
            return Registry(std::move(entries));
        }

        [[nodiscard]] static Registry FromJson(const std::filesystem::path& path)
        {
            return FromPropertyTree(Common::SaveLoad::read_json_file(path));
        }

        [[nodiscard]] const NormalizationProfile& resolve(std::string_view identifier) const
        {
            const auto it = entries_.find(identifier);
            if (it == entries_.end()) {
                throw Error::UnknownProfile(std::string(identifier));
            }
            return it->second;
        }

        [[nodiscard]] bool contains(std::string_view identifier) const
        {
            return entries_.find(identifier) != entries_.end();
        }

        [[nodiscard]] std::vector<std::string> identifiers() const
        {
            std::vector<std::string> names;
            names.reserve(entries_.size());
            for (const auto& entry : entries_) {
                names.push_back(entry.first);
            }
            return names;
        }

        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

        [[nodiscard]] static Common::SaveLoad::PropertyTree serialize(const NormalizationProfile& profile)
        {
            namespace SL = Common::SaveLoad;
            SL::PropertyTree tree;
            tree.add_child("mean", SL::Detail::write_array(profile.mean));
            tree.add_child("stdv", SL::Detail::write_array(profile.stdv));
            tree.put("target_size", profile.target_size);
            return tree;
        }

        [[nodiscard]] static NormalizationProfile deserialize(const Common::SaveLoad::PropertyTree& tree,
                                                              const std::string& identifier)
        {
            namespace SL = Common::SaveLoad;
            const std::string context = "profile '" + identifier + "'";

            auto read_triplet = [&](const char* key) {
                const auto node = tree.get_child_optional(key);
                if (!node) {
                    throw Error::InvalidProfile("Missing '" + std::string(key) + "' in " + context);
                }
                const auto values = SL::Detail::read_array<float>(*node, context);
                if (values.size() != kChannels) {
                    throw Error::InvalidProfile("Field '" + std::string(key) + "' in " + context + " must hold exactly "
                                                + std::to_string(kChannels) + " values (received "
                                                + std::to_string(values.size()) + ")");
                }
                std::array<float, kChannels> triplet{};
                std::copy(values.begin(), values.end(), triplet.begin());
                return triplet;
            };

            NormalizationProfile profile{};
            profile.mean = read_triplet("mean");
            profile.stdv = read_triplet("stdv");
            profile.target_size = SL::Detail::get_numeric<std::int64_t>(tree, "target_size", context);
            validate(profile, identifier);
            return profile;
        }

    private:
        Table entries_{};
    };

    [[nodiscard]] inline const NormalizationProfile& Resolve(std::string_view identifier)
    {
        return Registry::Default().resolve(identifier);
    }
}

#endif // ONEIRO_PROFILE_REGISTRY_HPP
