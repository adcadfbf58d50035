//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Name decomposition helpers for Type.  Package and simple names are derived on
// demand from the single stored string so the value stays one allocation wide.
//
//===----------------------------------------------------------------------===//

#include "core/Type.hpp"

#include <utility>

namespace archcheck::core
{

Type::Type(std::string fullName) : fullName_(std::move(fullName)) {}

std::string Type::simpleName() const
{
    const auto cut = fullName_.find_last_of(".$");
    if (cut == std::string::npos)
        return fullName_;
    return fullName_.substr(cut + 1);
}

std::string Type::packageName() const
{
    const auto dot = fullName_.rfind('.');
    if (dot == std::string::npos)
        return {};
    return fullName_.substr(0, dot);
}

std::string Type::topLevelName() const
{
    const auto dollar = fullName_.find('$');
    if (dollar == std::string::npos)
        return fullName_;
    return fullName_.substr(0, dollar);
}

std::string formatTypeList(const std::vector<Type> &types)
{
    std::string out = "[";
    for (size_t i = 0; i < types.size(); ++i)
    {
        if (i)
            out += ", ";
        out += types[i].fullName();
    }
    out += ']';
    return out;
}

std::vector<Type> typesNamed(const std::vector<std::string> &names)
{
    std::vector<Type> types;
    types.reserve(names.size());
    for (const auto &name : names)
        types.emplace_back(name);
    return types;
}

} // namespace archcheck::core
