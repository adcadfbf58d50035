// File: src/core/fwd.hpp
// Purpose: Forward declarations for the code model entities.
// Key invariants: None.
// Ownership/Lifetime: Declarations only.
// Links: docs/codemap.md
#pragma once

namespace archcheck::core
{
class Type;
class Element;
class Class;
class Member;
class Field;
class CodeUnit;
class Method;
class Constructor;
struct Dependency;
class CodeModel;
} // namespace archcheck::core

namespace archcheck::build
{
class ModelBuilder;
} // namespace archcheck::build
