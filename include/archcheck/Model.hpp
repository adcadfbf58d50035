// File: include/archcheck/Model.hpp
// Purpose: Stable façade for the code model and its builder.
// Key invariants: Re-exports only; no additional behavior.
// Ownership/Lifetime: Types mirror definitions in archcheck::core and archcheck::build.
// Links: docs/codemap.md
#pragma once

#include "build/ModelBuilder.hpp"
#include "core/Class.hpp"
#include "core/CodeModel.hpp"
#include "core/Dependency.hpp"
#include "core/Member.hpp"
#include "core/Modifier.hpp"
#include "core/Type.hpp"

/// @file include/archcheck/Model.hpp
/// @brief Public forwarding header for importers and tests that assemble a
///        CodeModel programmatically.
