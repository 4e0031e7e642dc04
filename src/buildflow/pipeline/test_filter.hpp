/**
 * @file test_filter.hpp
 * @brief Test filter expressions derived from detected capabilities.
 */
#pragma once
#include "buildflow/common/common.hpp"
#include "buildflow/process/capability_probe.hpp"

namespace buildflow
{

/**
 * @brief Tests carrying `trait_name=trait_value` need `capability`.
 */
struct TraitExclusion
{
    Capability capability;
    std::string trait_name;
    std::string trait_value;
};

/**
 * @brief The exclusions used by the standard pipeline:
 *        `Category=Docker` needs ContainerRuntime and
 *        `Category=Interactive` needs InteractiveTool.
 */
std::vector<TraitExclusion> default_trait_exclusions();

/**
 * @brief Build the filter expression excluding tests whose capability is
 *        absent.
 *
 * @details
 * Pure function. Each absent capability contributes `name!=value`; terms are
 * joined with `&` in exclusion order.
 *
 * @return The expression, or an empty string when every capability is present.
 */
std::string build_test_filter(const CapabilitySet& capabilities,
                              const std::vector<TraitExclusion>& exclusions);

} // namespace buildflow
