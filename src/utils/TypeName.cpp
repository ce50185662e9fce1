#include "TypeName.hpp"

#include <cpptrace/cpptrace.hpp>

namespace checkend::utils
{

std::string demangledName(const std::type_info& type)
{
    return cpptrace::demangle(type.name());
}

std::string simpleName(const std::string& qualified_name)
{
    // Ignore separators inside template argument lists.
    int angle_depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < qualified_name.size(); ++i)
    {
        const char c = qualified_name[i];
        if (c == '<')
            ++angle_depth;
        else if (c == '>' && angle_depth > 0)
            --angle_depth;
        else if (angle_depth == 0 && c == ':' && i + 1 < qualified_name.size() && qualified_name[i + 1] == ':')
        {
            start = i + 2;
            ++i;
        }
    }
    return qualified_name.substr(start);
}

} // namespace checkend::utils
