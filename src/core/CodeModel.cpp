//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Read-side queries of CodeModel.  Edge lookups go through the call graph
// index built by ModelBuilder::build(); the index stores positions into the
// dependency vector so results come back in insertion order.
//
//===----------------------------------------------------------------------===//

#include "core/CodeModel.hpp"

namespace archcheck::core
{
namespace
{
template <class Key>
std::vector<const Dependency *> collect(const std::unordered_map<Key, std::vector<size_t>> &index,
                                        Key key,
                                        const std::vector<Dependency> &deps)
{
    std::vector<const Dependency *> out;
    auto it = index.find(key);
    if (it == index.end())
        return out;
    out.reserve(it->second.size());
    for (size_t idx : it->second)
        out.push_back(&deps[idx]);
    return out;
}
} // namespace

CodeModel::CodeModel() = default;
CodeModel::~CodeModel() = default;
CodeModel::CodeModel(CodeModel &&) noexcept = default;
CodeModel &CodeModel::operator=(CodeModel &&) noexcept = default;

const Class *CodeModel::findClass(std::string_view fullName) const
{
    auto it = byName_.find(std::string(fullName));
    return it == byName_.end() ? nullptr : it->second;
}

std::vector<const Dependency *> CodeModel::callsTo(const CodeUnit &target) const
{
    std::vector<const Dependency *> out;
    for (const Dependency *dep : dependenciesTo(target))
    {
        if (dep->kind == DependencyKind::Call)
            out.push_back(dep);
    }
    return out;
}

std::vector<const Dependency *> CodeModel::dependenciesTo(const Member &target) const
{
    return collect<const Member *>(graph_.incoming, &target, dependencies_);
}

std::vector<const Dependency *> CodeModel::dependenciesFrom(const CodeUnit &origin) const
{
    return collect<const CodeUnit *>(graph_.outgoing, &origin, dependencies_);
}

} // namespace archcheck::core
