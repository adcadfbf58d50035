// File: src/lang/ConditionEvent.hpp
// Purpose: Declares the events conditions emit and the per-check event sink.
// Key invariants: ConditionEvents is append-only and preserves emission order.
// Ownership/Lifetime: Events reference model elements; the model outlives them.
// Links: docs/codemap.md
#pragma once

#include "core/fwd.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace archcheck::lang
{

/// @brief Outcome of checking one element (or one edge of it) against a condition.
class ConditionEvent
{
  public:
    ConditionEvent(std::vector<const core::Element *> correlated, bool violated, std::string message);

    static ConditionEvent violated(const core::Element &element, std::string message);
    static ConditionEvent satisfied(const core::Element &element, std::string message);

    [[nodiscard]] bool isViolation() const
    {
        return violated_;
    }

    [[nodiscard]] const std::string &message() const
    {
        return message_;
    }

    /// @brief Elements the event is about, primary element first.
    [[nodiscard]] const std::vector<const core::Element *> &correlatedElements() const
    {
        return correlated_;
    }

  private:
    std::vector<const core::Element *> correlated_;
    bool violated_;
    std::string message_;
};

/// @brief Ordered sink filled by Condition::check.
class ConditionEvents
{
  public:
    void add(ConditionEvent event);

    [[nodiscard]] const std::vector<ConditionEvent> &events() const
    {
        return events_;
    }

    [[nodiscard]] bool containViolation() const;

    /// @brief Messages of the violated events, in emission order.
    [[nodiscard]] std::vector<std::string> violationMessages() const;

    [[nodiscard]] bool empty() const
    {
        return events_.empty();
    }

    [[nodiscard]] size_t size() const
    {
        return events_.size();
    }

  private:
    std::vector<ConditionEvent> events_;
};

/// @brief Standard message shape: "<element description> <text> in (<File>:<line>)".
std::string elementMessage(const core::Element &element, std::string_view text);

} // namespace archcheck::lang
