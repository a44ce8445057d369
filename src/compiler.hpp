#pragma once
#include "model.hpp"
#include <optional>

struct ActiveWindow {
    NormalizedInterval interval;
    int remaining_minutes{0};
};

// Валидация + развёртка. При ошибке конфигурации ничего не возвращает (исключение).
CompiledSchedule compile_schedule(const Config& cfg);

// Окно, которое содержит минуту недели m (с учётом перехода вс->пн).
std::optional<ActiveWindow> active_at(const CompiledSchedule& cs, int minute_of_week);

int total_blocked_minutes(const CompiledSchedule& cs);
