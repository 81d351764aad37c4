#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

#include "Session/DiagnosticLog.hpp"

LOG_MODULE_REGISTER(BreathSession_diag, CONFIG_BREATHLINK_LOG_LEVEL);

void DiagnosticLog::info(const char* message, const LogField* fields, size_t field_count) {
    write(LogLevel::Info, message, fields, field_count);
}

void DiagnosticLog::error(const char* message, const LogField* fields, size_t field_count) {
    write(LogLevel::Error, message, fields, field_count);
}

void DiagnosticLog::write(LogLevel level, const char* message, const LogField* fields, size_t field_count) {
    if (level == LogLevel::Error) {
        LOG_ERR("%s", message);
    } else {
        LOG_INF("%s", message);
    }

    for (size_t i = 0; i < field_count; i++) {
        if (fields[i].str) {
            LOG_DBG("  %s: %s", fields[i].key, fields[i].str);
        } else {
            LOG_DBG("  %s: %d", fields[i].key, (int)fields[i].num);
        }
    }

    if (!sink) {
        return;
    }

    const LogEntry entry = {
        .level = level,
        .time_ms = k_uptime_get(),
        .message = message,
        .fields = fields,
        .field_count = field_count,
    };
    sink(entry, context);
}
