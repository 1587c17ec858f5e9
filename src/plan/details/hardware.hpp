#ifndef SKULD_PLAN_HARDWARE_HPP
#define SKULD_PLAN_HARDWARE_HPP

#include <string>

#include "types.hpp"

namespace Skuld::Plan::Details {
    // Peak figures used for the structural (non-learned) node costs.
    struct HardwareProfile {
        std::string name{"a100"};
        double device_flops{312.0e12};
        double intra_host_bandwidth{300.0e9};  // bytes/s
        double inter_host_bandwidth{25.0e9};   // bytes/s
        bool prefer_reduce_scatter{true};      // gradient sync lowered as reduce-scatter then all-gather
    };

    // Identifies the cluster an artifact was trained on, e.g. "a100-2x2".
    inline std::string hardware_signature(const DeviceMesh& mesh, const HardwareProfile& profile)
    {
        return profile.name + "-" + std::to_string(mesh.hosts) + "x" + std::to_string(mesh.devices_per_host);
    }
}

#endif // SKULD_PLAN_HARDWARE_HPP
