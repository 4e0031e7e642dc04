#include "buildflow/pipeline/test_filter.hpp"

namespace buildflow
{

std::vector<TraitExclusion> default_trait_exclusions()
{
    return {
        {Capability::ContainerRuntime, "Category", "Docker"},
        {Capability::InteractiveTool, "Category", "Interactive"},
    };
}

std::string build_test_filter(const CapabilitySet& capabilities,
                              const std::vector<TraitExclusion>& exclusions)
{
    std::string filter;
    for (const auto& exclusion : exclusions)
    {
        if (capabilities.has(exclusion.capability))
        {
            continue;
        }
        if (!filter.empty())
        {
            filter += '&';
        }
        filter += exclusion.trait_name + "!=" + exclusion.trait_value;
    }
    return filter;
}

} // namespace buildflow
