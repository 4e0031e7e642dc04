/**
 * @file capability_probe.hpp
 * @brief Environment capabilities detected by running probe commands.
 */
#pragma once
#include "buildflow/common/common.hpp"
#include "buildflow/process/process_invoker.hpp"

namespace buildflow
{

/**
 * @brief Environment properties that change what the pipeline can do.
 */
enum class Capability
{
    /// A container runtime is installed and its daemon answers.
    ContainerRuntime,

    /// A trusted developer certificate is available for interactive tests.
    InteractiveTool
};

const char* capability_name(Capability capability) noexcept;

/**
 * @brief Set of capabilities detected as present.
 */
class CapabilitySet
{
public:
    CapabilitySet() = default;
    CapabilitySet(std::initializer_list<Capability> present);

    void add(Capability capability);
    bool has(Capability capability) const noexcept;
    bool empty() const noexcept { return m_present.empty(); }
    size_t size() const noexcept { return m_present.size(); }

    /**
     * @brief Comma separated capability names, for logging.
     */
    std::string to_string() const;

private:
    std::set<Capability> m_present;
};

/**
 * @brief A probe command whose success means the capability is present.
 */
struct CapabilityProbe
{
    Capability capability;
    ProcessRequest request;
};

/**
 * @brief Run one probe.
 * @details The command's output is discarded and its exit code is logged at
 *          debug level only.
 * @return True if the probe exited with code 0. A non-zero exit, a launch
 *         failure or any exception thrown while probing yields false.
 */
bool probe_capability(ProcessInvoker& invoker, const CapabilityProbe& probe);

/**
 * @brief Run every probe and collect the capabilities found present.
 */
CapabilitySet detect_capabilities(ProcessInvoker& invoker,
                                  const std::vector<CapabilityProbe>& probes);

/**
 * @brief The probes used by the standard pipeline.
 * @param dotnet_tool Path or name of the dotnet CLI.
 */
std::vector<CapabilityProbe> default_capability_probes(const std::string& dotnet_tool);

} // namespace buildflow
