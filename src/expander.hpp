#pragma once
#include "model.hpp"
#include <vector>

// По одному Start и одному Stop на каждый интервал, в календарном формате
// (день недели, час, минута). Stop раньше Start при совпадении момента.
// Вход должен пройти normalize(); иначе InternalConsistencyFault.
std::vector<TriggerInstant> expand(const std::vector<NormalizedInterval>& intervals);

int trigger_minute_of_week(const TriggerInstant& t);
