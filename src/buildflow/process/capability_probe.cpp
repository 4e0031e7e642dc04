#include "buildflow/process/capability_probe.hpp"

#include <spdlog/spdlog.h>

namespace buildflow
{

const char* capability_name(Capability capability) noexcept
{
    switch (capability)
    {
        case Capability::ContainerRuntime:
            return "ContainerRuntime";
        case Capability::InteractiveTool:
            return "InteractiveTool";
    }
    return "Unknown";
}

CapabilitySet::CapabilitySet(std::initializer_list<Capability> present)
    : m_present(present)
{}

void CapabilitySet::add(Capability capability)
{
    m_present.insert(capability);
}

bool CapabilitySet::has(Capability capability) const noexcept
{
    return m_present.count(capability) != 0;
}

std::string CapabilitySet::to_string() const
{
    std::string text;
    for (Capability capability : m_present)
    {
        if (!text.empty())
        {
            text += ", ";
        }
        text += capability_name(capability);
    }
    return text.empty() ? "none" : text;
}

bool probe_capability(ProcessInvoker& invoker, const CapabilityProbe& probe)
{
    ProcessRequest request = probe.request;
    request.discard_output = true;

    try
    {
        ProcessResult result = invoker.check(request);
        spdlog::debug("Capability {} probe exited with code {}",
                      capability_name(probe.capability), result.exit_code);
        return result.succeeded();
    }
    catch (const std::exception& e)
    {
        spdlog::debug("Capability {} probe could not run: {}",
                      capability_name(probe.capability), e.what());
        return false;
    }
    catch (...)
    {
        spdlog::debug("Capability {} probe could not run: unknown exception",
                      capability_name(probe.capability));
        return false;
    }
}

CapabilitySet detect_capabilities(ProcessInvoker& invoker,
                                  const std::vector<CapabilityProbe>& probes)
{
    CapabilitySet capabilities;
    for (const auto& probe : probes)
    {
        if (probe_capability(invoker, probe))
        {
            capabilities.add(probe.capability);
        }
    }
    spdlog::info("Detected capabilities: {}", capabilities.to_string());
    return capabilities;
}

std::vector<CapabilityProbe> default_capability_probes(const std::string& dotnet_tool)
{
    std::vector<CapabilityProbe> probes;

    CapabilityProbe container;
    container.capability = Capability::ContainerRuntime;
    container.request.command = "docker";
    container.request.arguments = {"info"};
    probes.push_back(container);

    CapabilityProbe interactive;
    interactive.capability = Capability::InteractiveTool;
    interactive.request.command = dotnet_tool;
    interactive.request.arguments = {"dev-certs", "https", "--check", "--trust"};
    probes.push_back(interactive);

    return probes;
}

} // namespace buildflow
