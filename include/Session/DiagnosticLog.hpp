#pragma once

#include <zephyr/types.h>
#include <stddef.h>

enum class LogLevel : uint8_t {
    Info = 30,
    Error = 50,
};

// String field when str is set, numeric otherwise
struct LogField {
    const char* key;
    const char* str;
    int32_t num;
};

struct LogEntry {
    LogLevel level;
    int64_t time_ms;
    const char* message;
    const LogField* fields;
    size_t field_count;
};

typedef void (*DiagnosticSink)(const LogEntry& entry, void* context);

/**
 * @brief Structured lifecycle records for an optional external consumer.
 *
 * Every entry also goes to the Zephyr log. The sink is called
 * synchronously and its absence changes nothing else.
 */
class DiagnosticLog {
public:
    void set_sink(DiagnosticSink new_sink, void* new_context) {
        sink = new_sink;
        context = new_context;
    }

    void info(const char* message, const LogField* fields = nullptr, size_t field_count = 0);
    void error(const char* message, const LogField* fields = nullptr, size_t field_count = 0);

private:
    void write(LogLevel level, const char* message, const LogField* fields, size_t field_count);

    DiagnosticSink sink{ nullptr };
    void* context{ nullptr };
};
