#pragma once
#include "model.hpp"
#include <optional>
#include <string>
#include <vector>

// Разворачивает расписания без дня недели на все семь дней, проверяет время,
// вырожденные и пересекающиеся окна. Всё или ничего: при первой ошибке бросает
// InvalidTimeError / DegenerateIntervalError / OverlapError.
// Результат отсортирован по start.
std::vector<NormalizedInterval> normalize(
    const std::vector<BlockSchedule>& entries,
    const std::optional<std::vector<std::string>>& global_hosts = std::nullopt);

// Повторная проверка инвариантов уже нормализованного набора
// (диапазоны, порядок, непересечение). Бросает InternalConsistencyFault.
void check_intervals(const std::vector<NormalizedInterval>& intervals);

BlockSchedule to_block_schedule(const NormalizedInterval& iv);
