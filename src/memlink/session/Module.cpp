#include "Module.hpp"

#include <limits>

namespace memlink
{

namespace
{
constexpr ModuleInfo kAbsoluteModule{ 0, std::numeric_limits<size_t>::max() };
} // namespace

const char* ModuleName(Module module) noexcept
{
    switch (module)
    {
    case Module::Absolute:
        return "absolute";
    case Module::Client:
        return "client";
    case Module::Engine:
        return "engine";
    case Module::SchemaSystem:
        return "schemasystem";
    }
    return "invalid";
}

std::optional<ModuleInfo> ModuleLocator::Resolve(Module module, const ModuleTable& table) noexcept
{
    switch (module)
    {
    case Module::Absolute:
        return kAbsoluteModule;
    case Module::Client:
        return table.client;
    case Module::Engine:
        return table.engine;
    case Module::SchemaSystem:
        return table.schema_system;
    }
    return std::nullopt;
}

std::optional<uint64_t> ModuleLocator::ContainingOffset(Module module, const ModuleTable& table,
                                                        uint64_t address) noexcept
{
    auto info = Resolve(module, table);
    if (!info || !info->Contains(address))
        return std::nullopt;

    return address - info->base_address;
}

} // namespace memlink
