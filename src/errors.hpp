#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

// Ошибки пользовательской конфигурации расписаний (валидация).
struct ScheduleError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct InvalidTimeError : ScheduleError {
    using ScheduleError::ScheduleError;
};

struct DegenerateIntervalError : ScheduleError {
    using ScheduleError::ScheduleError;
};

struct OverlapError : ScheduleError {
    OverlapError(const std::string& msg,
                 std::size_t first_index, std::string first_id,
                 std::size_t second_index, std::string second_id)
    : ScheduleError(msg),
      first_index(first_index), first_id(std::move(first_id)),
      second_index(second_index), second_id(std::move(second_id)) {}

    std::size_t first_index;
    std::string first_id;
    std::size_t second_index;
    std::string second_id;
};

// Файл конфигурации не читается или не соответствует схеме.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Нарушен инвариант, который должна была обеспечить валидация. Это дефект, не ошибка пользователя.
struct InternalConsistencyFault : std::logic_error {
    using std::logic_error::logic_error;
};
