// File: src/lang/Elements.hpp
// Purpose: Maps each selectable element type to its plural name and to the
//          elements of that kind in a model.
// Key invariants: collect() returns elements of analyzed classes only, in class
//                 import order and then member declaration order.
// Ownership/Lifetime: Returned pointers are owned by the model.
// Links: docs/codemap.md
#pragma once

#include "core/Class.hpp"
#include "core/Member.hpp"

#include <string_view>
#include <vector>

namespace archcheck::core
{
class CodeModel;
} // namespace archcheck::core

namespace archcheck::lang
{

template <class T> struct ElementKind;

template <> struct ElementKind<core::Class>
{
    static constexpr std::string_view name = "classes";
    static std::vector<const core::Class *> collect(const core::CodeModel &model);
};

template <> struct ElementKind<core::Field>
{
    static constexpr std::string_view name = "fields";
    static std::vector<const core::Field *> collect(const core::CodeModel &model);
};

template <> struct ElementKind<core::Method>
{
    static constexpr std::string_view name = "methods";
    static std::vector<const core::Method *> collect(const core::CodeModel &model);
};

template <> struct ElementKind<core::Constructor>
{
    static constexpr std::string_view name = "constructors";
    static std::vector<const core::Constructor *> collect(const core::CodeModel &model);
};

template <> struct ElementKind<core::CodeUnit>
{
    static constexpr std::string_view name = "code units";
    static std::vector<const core::CodeUnit *> collect(const core::CodeModel &model);
};

template <> struct ElementKind<core::Member>
{
    static constexpr std::string_view name = "members";
    static std::vector<const core::Member *> collect(const core::CodeModel &model);
};

} // namespace archcheck::lang
