// File: src/lang/ConditionEvent.cpp
// Purpose: Implements condition events and message rendering.
// Key invariants: Rendering is a pure function of the element and the text.
// Ownership/Lifetime: See ConditionEvent.hpp.
// Links: docs/codemap.md

#include "lang/ConditionEvent.hpp"

#include "core/Element.hpp"

#include <algorithm>
#include <utility>

namespace archcheck::lang
{

ConditionEvent::ConditionEvent(std::vector<const core::Element *> correlated,
                               bool violated,
                               std::string message)
    : correlated_(std::move(correlated)), violated_(violated), message_(std::move(message))
{
}

ConditionEvent ConditionEvent::violated(const core::Element &element, std::string message)
{
    return ConditionEvent({&element}, true, std::move(message));
}

ConditionEvent ConditionEvent::satisfied(const core::Element &element, std::string message)
{
    return ConditionEvent({&element}, false, std::move(message));
}

void ConditionEvents::add(ConditionEvent event)
{
    events_.push_back(std::move(event));
}

bool ConditionEvents::containViolation() const
{
    return std::any_of(events_.begin(),
                       events_.end(),
                       [](const ConditionEvent &e) { return e.isViolation(); });
}

std::vector<std::string> ConditionEvents::violationMessages() const
{
    std::vector<std::string> out;
    for (const auto &e : events_)
    {
        if (e.isViolation())
            out.push_back(e.message());
    }
    return out;
}

std::string elementMessage(const core::Element &element, std::string_view text)
{
    std::string out = element.description();
    out += ' ';
    out += text;
    out += " in ";
    out += element.sourceLocation().str();
    return out;
}

} // namespace archcheck::lang
