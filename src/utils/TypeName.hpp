#pragma once

#include <string>
#include <typeinfo>

namespace checkend::utils
{

/// Demangled, human readable name of a runtime type (e.g. "std::runtime_error").
std::string demangledName(const std::type_info& type);

/// Last `::`-separated component of a qualified name, template arguments included.
std::string simpleName(const std::string& qualified_name);

} // namespace checkend::utils
