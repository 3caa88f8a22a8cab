#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight aliases/enums (SectionName/DesiredState).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <optional>
#include <string>

/* std::nullopt addresses the lines above the first section header */
using SectionName = std::optional<std::string>;

enum class DesiredState { Present, Absent };
