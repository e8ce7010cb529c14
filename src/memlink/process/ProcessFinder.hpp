#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

namespace memlink
{

using ProcessId = pid_t;

class ProcessFinder
{
public:
    /**
     * @brief Find processes whose name or executable file name matches
     *
     * On Linux, /proc/<pid>/comm is consulted as a fallback for
     * case-insensitive searches.
     */
    static std::vector<ProcessId> FindByName(const std::string& name, bool case_sensitive = false);

    static ProcessId GetCurrentProcessId();

private:
    static std::string ToLower(const std::string& str);
};

} // namespace memlink
