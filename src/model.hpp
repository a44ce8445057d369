#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class Weekday { Monday = 0, Tuesday, Wednesday, Thursday, Friday, Saturday, Sunday };

struct BlockSchedule {
    std::string id;                    // ключ в [Schedule]
    std::size_t index{0};              // позиция в исходном списке
    std::optional<Weekday> weekday;    // пусто -> каждый день недели
    int start_hour{0};
    int start_minute{0};
    int end_hour{0};
    int end_minute{0};
    std::optional<std::vector<std::string>> host_blacklist; // заменяет глобальный список
    std::optional<bool> block_as_whitelist;
};

// [start, end) в минутах от понедельника 00:00. end может выйти за 10080,
// если окно переходит через полночь воскресенья.
struct NormalizedInterval {
    int start{0};
    int end{0};

    std::size_t source_index{0};
    std::string source_id;
    Weekday weekday{Weekday::Monday};

    std::vector<std::string> hosts;
    bool block_as_whitelist{false};

    int duration() const { return end - start; }
};

enum class TriggerAction { Stop, Start };

struct TriggerInstant {
    Weekday weekday{Weekday::Monday};
    int hour{0};
    int minute{0};
    TriggerAction action{TriggerAction::Start};

    // только для Start
    int duration_minutes{0};
    std::vector<std::string> hosts;
    bool block_as_whitelist{false};

    std::size_t source_index{0};
    std::string source_id;
};

struct CompiledSchedule {
    std::vector<NormalizedInterval> intervals;   // отсортированы по start
    std::vector<TriggerInstant>     triggers;    // отсортированы по времени, Stop раньше Start
};

struct Config {
    std::string username;
    std::string selfcontrol_path;
    std::optional<std::vector<std::string>> host_blacklist;
    bool legacy_mode{false};
    std::vector<BlockSchedule> schedules;
};
