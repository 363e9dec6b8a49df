// folio_config.cpp - Reflow and Layout Parameters Implementation

#include "folio_config.hpp"
#include "../lib/log.h"
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace folio {

static log_category_t* config_log() {
    static log_category_t* category = log_get_category("folio.config");
    return category;
}

// ============================================================================
// Validation
// ============================================================================

bool reflow_params_validate(const ReflowParams& params) {
    bool ok = true;
    if (params.page_capacity <= 0) {
        clog_error(config_log(), "page_capacity must be positive (got %.2f)", params.page_capacity);
        ok = false;
    }
    if (params.height_tolerance < 0) {
        clog_error(config_log(), "height_tolerance must not be negative (got %.2f)", params.height_tolerance);
        ok = false;
    }
    if (params.min_split_offset < 1) {
        clog_error(config_log(), "min_split_offset must be at least 1 (got %d)", params.min_split_offset);
        ok = false;
    }
    if (params.settle_interval_ms < 0) {
        clog_error(config_log(), "settle_interval_ms must not be negative (got %d)", params.settle_interval_ms);
        ok = false;
    }
    if (params.max_split_probes < 1) {
        clog_error(config_log(), "max_split_probes must be at least 1 (got %d)", params.max_split_probes);
        ok = false;
    }
    if (params.page_margin < 0) {
        clog_error(config_log(), "page_margin must not be negative (got %.2f)", params.page_margin);
        ok = false;
    }
    return ok;
}

bool estimated_layout_params_validate(const EstimatedLayoutParams& params) {
    bool ok = true;
    if (params.chars_per_line < 1) {
        clog_error(config_log(), "layout.chars_per_line must be at least 1 (got %d)", params.chars_per_line);
        ok = false;
    }
    if (params.line_height <= 0) {
        clog_error(config_log(), "layout.line_height must be positive (got %.2f)", params.line_height);
        ok = false;
    }
    if (params.block_spacing < 0 || params.image_height <= 0 || params.page_padding < 0) {
        clog_error(config_log(), "layout spacing, image height and padding must not be negative");
        ok = false;
    }
    if (params.page_height <= params.page_padding * 2 || params.page_width <= 0) {
        clog_error(config_log(), "layout.page_height must exceed twice the padding and width must be positive");
        ok = false;
    }
    return ok;
}

// ============================================================================
// Parsing
// ============================================================================

enum class ConfigValueType : uint8_t {
    Int,
    Float,
};

struct ConfigKey {
    const char* name;
    ConfigValueType type;
    void* target;
};

static char* trim(char* s) {
    while (*s && isspace((unsigned char)*s)) s++;
    char* end = s + strlen(s);
    while (end > s && isspace((unsigned char)end[-1])) end--;
    *end = '\0';
    return s;
}

static bool parse_value(const ConfigKey& key, const char* text) {
    char* end = nullptr;
    errno = 0;
    if (key.type == ConfigValueType::Int) {
        long v = strtol(text, &end, 10);
        if (errno != 0 || end == text || *end != '\0') return false;
        *(int*)key.target = (int)v;
    } else {
        float v = strtof(text, &end);
        if (errno != 0 || end == text || *end != '\0') return false;
        *(float*)key.target = v;
    }
    return true;
}

bool config_parse_string(const char* text, FolioConfig* config) {
    if (!text || !config) return false;

    FolioConfig parsed = *config;
    ConfigKey keys[] = {
        {"page_capacity",        ConfigValueType::Float, &parsed.reflow.page_capacity},
        {"height_tolerance",     ConfigValueType::Float, &parsed.reflow.height_tolerance},
        {"min_split_offset",     ConfigValueType::Int,   &parsed.reflow.min_split_offset},
        {"settle_interval_ms",   ConfigValueType::Int,   &parsed.reflow.settle_interval_ms},
        {"max_split_probes",     ConfigValueType::Int,   &parsed.reflow.max_split_probes},
        {"page_margin",          ConfigValueType::Float, &parsed.reflow.page_margin},
        {"layout.chars_per_line", ConfigValueType::Int,  &parsed.layout.chars_per_line},
        {"layout.line_height",   ConfigValueType::Float, &parsed.layout.line_height},
        {"layout.block_spacing", ConfigValueType::Float, &parsed.layout.block_spacing},
        {"layout.image_height",  ConfigValueType::Float, &parsed.layout.image_height},
        {"layout.page_height",   ConfigValueType::Float, &parsed.layout.page_height},
        {"layout.page_padding",  ConfigValueType::Float, &parsed.layout.page_padding},
        {"layout.page_width",    ConfigValueType::Float, &parsed.layout.page_width},
    };
    const int key_count = (int)(sizeof(keys) / sizeof(keys[0]));

    bool ok = true;
    int line_no = 0;
    const char* p = text;
    while (*p) {
        const char* eol = strchr(p, '\n');
        size_t len = eol ? (size_t)(eol - p) : strlen(p);
        std::string raw(p, len);
        p = eol ? eol + 1 : p + len;
        line_no++;

        char* line = trim(&raw[0]);
        char* hash = strchr(line, '#');
        if (hash) *hash = '\0';
        line = trim(line);
        if (!line[0]) continue;

        char* eq = strchr(line, '=');
        if (!eq) {
            clog_error(config_log(), "line %d: expected 'key = value'", line_no);
            ok = false;
            continue;
        }
        *eq = '\0';
        char* name = trim(line);
        char* value = trim(eq + 1);

        int k = 0;
        while (k < key_count && strcmp(keys[k].name, name) != 0) k++;
        if (k == key_count) {
            clog_warn(config_log(), "line %d: unknown key '%s' ignored", line_no, name);
            continue;
        }
        if (!parse_value(keys[k], value)) {
            clog_error(config_log(), "line %d: invalid value '%s' for %s", line_no, value, name);
            ok = false;
            continue;
        }
        clog_debug(config_log(), "%s = %s", name, value);
    }

    if (!ok) return false;
    if (!reflow_params_validate(parsed.reflow) || !estimated_layout_params_validate(parsed.layout)) {
        return false;
    }
    *config = parsed;
    return true;
}

bool config_load_file(const char* path, FolioConfig* config) {
    if (!path) return false;
    FILE* file = fopen(path, "rb");
    if (!file) {
        clog_error(config_log(), "cannot open config file '%s'", path);
        return false;
    }

    std::string text;
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), file)) > 0) {
        text.append(buffer, n);
    }
    bool read_error = ferror(file) != 0;
    fclose(file);
    if (read_error) {
        clog_error(config_log(), "error reading config file '%s'", path);
        return false;
    }

    clog_info(config_log(), "loading config from '%s'", path);
    return config_parse_string(text.c_str(), config);
}

} // namespace folio
