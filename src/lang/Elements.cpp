// File: src/lang/Elements.cpp
// Purpose: Implements element collection per kind.
// Key invariants: See Elements.hpp.
// Ownership/Lifetime: Non-owning views into the model.
// Links: docs/codemap.md

#include "lang/Elements.hpp"

#include "core/CodeModel.hpp"

namespace archcheck::lang
{

namespace
{

/// Concatenate @p project applied to every analyzed class.
template <class T, class F> std::vector<const T *> gather(const core::CodeModel &model, F project)
{
    std::vector<const T *> out;
    for (const core::Class *cls : model.classes())
    {
        auto part = project(*cls);
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

} // namespace

std::vector<const core::Class *> ElementKind<core::Class>::collect(const core::CodeModel &model)
{
    return model.classes();
}

std::vector<const core::Field *> ElementKind<core::Field>::collect(const core::CodeModel &model)
{
    return gather<core::Field>(model, [](const core::Class &cls) { return cls.fields(); });
}

std::vector<const core::Method *> ElementKind<core::Method>::collect(const core::CodeModel &model)
{
    return gather<core::Method>(model, [](const core::Class &cls) { return cls.methods(); });
}

std::vector<const core::Constructor *> ElementKind<core::Constructor>::collect(const core::CodeModel &model)
{
    return gather<core::Constructor>(model, [](const core::Class &cls) { return cls.constructors(); });
}

std::vector<const core::CodeUnit *> ElementKind<core::CodeUnit>::collect(const core::CodeModel &model)
{
    return gather<core::CodeUnit>(model, [](const core::Class &cls) { return cls.codeUnits(); });
}

std::vector<const core::Member *> ElementKind<core::Member>::collect(const core::CodeModel &model)
{
    return gather<core::Member>(model, [](const core::Class &cls) { return cls.members(); });
}

} // namespace archcheck::lang
