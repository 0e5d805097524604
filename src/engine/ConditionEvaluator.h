/**
 * ConditionEvaluator.h
 *
 * Evaluates dialogue conditions against a read-only view of the game state.
 *
 * Evaluation never fails: unknown or malformed conditions read as false and
 * are reported through the log sink.
 */

#pragma once

#include "DialogueTypes.h"
#include "GameState.h"
#include <vector>

namespace Parley {

bool evaluateCondition(const DialogueCondition& condition, const GameStateView& state);

/**
 * True when every condition holds; an empty list is true
 */
bool evaluateConditions(const std::vector<DialogueCondition>& conditions,
                        const GameStateView& state);

} // namespace Parley
