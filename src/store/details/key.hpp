#ifndef SKULD_STORE_KEY_HPP
#define SKULD_STORE_KEY_HPP

#include <compare>
#include <stdexcept>
#include <string>

#include "../../encoding/encoding.hpp"
#include "../../plan/plan.hpp"

namespace Skuld::Store::Details {
    struct ArtifactKey {
        std::string benchmark{};
        std::string hardware_signature{};
        std::string schema_version{};

        auto operator<=>(const ArtifactKey&) const = default;

        // "<benchmark>/<hardware>/<schema>", relative to the store root.
        [[nodiscard]] std::string relative_path() const
        {
            return benchmark + "/" + hardware_signature + "/" + schema_version;
        }

        [[nodiscard]] std::string to_string() const
        {
            return "(" + benchmark + ", " + hardware_signature + ", " + schema_version + ")";
        }
    };

    inline void validate(const ArtifactKey& key)
    {
        const auto check = [&](const std::string& component, const char* name) {
            if (component.empty() || component == "." || component == ".."
                || component.find_first_of("/\\") != std::string::npos) {
                throw std::invalid_argument(std::string("Artifact key ") + name + " '" + component
                                            + "' must be a non-empty single path component.");
            }
        };
        check(key.benchmark, "benchmark");
        check(key.hardware_signature, "hardware signature");
        check(key.schema_version, "schema version");
    }

    // Key under which a predictor for `benchmark` on `mesh` is stored with the current feature schema.
    inline ArtifactKey make_key(Plan::Benchmark benchmark, const Plan::DeviceMesh& mesh, const Plan::HardwareProfile& hardware = {})
    {
        return ArtifactKey{
            .benchmark = Plan::to_string(benchmark),
            .hardware_signature = Plan::hardware_signature(mesh, hardware),
            .schema_version = Encoding::GraphEncoder::schema_version(),
        };
    }
}

#endif // SKULD_STORE_KEY_HPP
