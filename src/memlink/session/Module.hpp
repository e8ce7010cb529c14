#pragma once

#include "../process/ProcessFinder.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace memlink
{

enum class Module
{
    /// Absolute address in the target, no base translation
    Absolute,

    Client,
    Engine,
    SchemaSystem
};

const char* ModuleName(Module module) noexcept;

struct ModuleInfo
{
    uint64_t base_address = 0;
    size_t module_size = 0;

    bool Contains(uint64_t address) const noexcept
    {
        return address >= base_address && address - base_address < module_size;
    }
};

/**
 * @brief Module bases of the target process, captured once at session creation
 */
struct ModuleTable
{
    ProcessId process_id = 0;

    ModuleInfo client;
    ModuleInfo engine;
    ModuleInfo schema_system;
};

class ModuleLocator
{
public:
    /**
     * @brief Resolve a module to its (base, size) pair
     * @return nullopt for a value outside the Module enumeration
     */
    static std::optional<ModuleInfo> Resolve(Module module, const ModuleTable& table) noexcept;

    /**
     * @brief Convert an absolute address to an offset relative to the module base
     * @return nullopt if the module is invalid or the address is not inside it
     */
    static std::optional<uint64_t> ContainingOffset(Module module, const ModuleTable& table,
                                                    uint64_t address) noexcept;
};

} // namespace memlink
