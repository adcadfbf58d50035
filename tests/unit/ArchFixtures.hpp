// File: tests/unit/ArchFixtures.hpp
// Purpose: Small hand-assembled code models shared by the rule engine tests.
// Key invariants: Every fixture lists its classes in a fixed order so failure
//                 reports are stable.
// Ownership/Lifetime: Fixtures return models by value; pointers handed out
//                     alongside stay valid while the model lives.
// Links: docs/codemap.md
#pragma once

#include "archcheck/Model.hpp"

#include <cstdint>
#include <string>

namespace archcheck::test
{

inline const core::Type kString("java.lang.String");
inline const core::Type kVoid("void");

/// Widget(String) with use(String); GoodCaller's constructor and call() and
/// BadCaller.callWrongly() each construct a Widget and call use().
struct WidgetScenario
{
    core::CodeModel model;

    static constexpr uint32_t kGoodCtorLine = 8;
    static constexpr uint32_t kGoodMethodLine = 13;
    static constexpr uint32_t kBadMethodLine = 9;

    static WidgetScenario make()
    {
        build::ModelBuilder b;

        auto &widget = b.addClass("com.acme.Widget", {core::Modifier::Public});
        auto &widgetCtor = b.addConstructor(widget, {kString}, {core::Modifier::Public});
        auto &use = b.addMethod(widget, "use", {kString}, kVoid, {core::Modifier::Public});

        auto &good = b.addClass("com.acme.GoodCaller");
        auto &goodCtor = b.addConstructor(good, {});
        auto &goodCall = b.addMethod(good, "call", {}, kVoid);
        b.addCall(goodCtor, widgetCtor, kGoodCtorLine);
        b.addCall(goodCtor, use, kGoodCtorLine + 1);
        b.addCall(goodCall, widgetCtor, kGoodMethodLine);
        b.addCall(goodCall, use, kGoodMethodLine + 1);

        auto &bad = b.addClass("com.acme.BadCaller");
        auto &callWrongly = b.addMethod(bad, "callWrongly", {}, kVoid);
        b.addCall(callWrongly, widgetCtor, kBadMethodLine);
        b.addCall(callWrongly, use, kBadMethodLine + 1);

        return WidgetScenario{b.build()};
    }
};

/// A package-private, unannotated constructor Target(String) that builds a
/// Widget, next to a protected method annotated with @com.acme.A.
inline core::CodeModel makeTargetModel()
{
    build::ModelBuilder b;
    auto &widget = b.addClass("com.acme.Widget");
    auto &widgetCtor = b.addConstructor(widget, {kString});

    auto &target = b.addClass("com.acme.Target");
    auto &ctor = b.addConstructor(target, {kString});
    b.setLine(ctor, 4);
    auto &method = b.addMethod(target, "describe", {}, kString, {core::Modifier::Protected});
    b.setLine(method, 9);
    b.annotate(method, core::Type("com.acme.A"));
    b.addCall(ctor, widgetCtor, 5);
    return b.build();
}

} // namespace archcheck::test
