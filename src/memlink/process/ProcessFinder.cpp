#include "ProcessFinder.hpp"

#include <libmem/libmem.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace memlink
{

namespace
{
std::string FileNameOf(const std::string& path)
{
    size_t last_slash = path.find_last_of('/');
    if (last_slash == std::string::npos)
        last_slash = path.find_last_of('\\');
    return last_slash == std::string::npos ? path : path.substr(last_slash + 1);
}
} // namespace

std::string ProcessFinder::ToLower(const std::string& str)
{
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c)
                   {
                       return static_cast<char>(std::tolower(c));
                   });
    return result;
}

std::vector<ProcessId> ProcessFinder::FindByName(const std::string& name, bool case_sensitive)
{
    std::vector<ProcessId> matching_pids;
    if (name.empty())
        return matching_pids;

    std::string search_name = case_sensitive ? name : ToLower(name);

    auto processes = libmem::EnumProcesses();
    if (processes)
    {
        for (const auto& proc : *processes)
        {
            std::string proc_name = case_sensitive ? proc.name : ToLower(proc.name);
            std::string exe_name = case_sensitive ? FileNameOf(proc.path) : ToLower(FileNameOf(proc.path));

            if (proc_name == search_name || (!proc.path.empty() && exe_name == search_name))
            {
                matching_pids.push_back(static_cast<ProcessId>(proc.pid));
            }
        }
    }

#ifndef _WIN32
    // /proc/[pid]/comm holds the (truncated) name the kernel knows the process by
    if (matching_pids.empty() && !case_sensitive)
    {
        std::error_code ec;
        std::filesystem::directory_iterator it("/proc", ec);
        if (ec)
            return matching_pids;

        for (const auto& entry : it)
        {
            std::string dirname = entry.path().filename().string();
            if (dirname.empty() || !std::all_of(dirname.begin(), dirname.end(), ::isdigit))
                continue;

            std::ifstream comm_file(entry.path() / "comm");
            std::string comm_name;
            if (comm_file.is_open() && std::getline(comm_file, comm_name) && ToLower(comm_name) == search_name)
            {
                matching_pids.push_back(static_cast<ProcessId>(std::strtol(dirname.c_str(), nullptr, 10)));
            }
        }
    }
#endif

    return matching_pids;
}

ProcessId ProcessFinder::GetCurrentProcessId()
{
    static const ProcessId s_current_pid = []
    {
        auto process = libmem::GetProcess();
        return process ? static_cast<ProcessId>(process->pid) : static_cast<ProcessId>(0);
    }();
    return s_current_pid;
}

} // namespace memlink
