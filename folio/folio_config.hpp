// folio_config.hpp - Reflow and Layout Parameters
//
// Parameters are plain structs with a defaults() constructor. A config file
// holds `key = value` lines; `#` starts a comment. Keys prefixed with
// `layout.` configure the estimated layout used by headless hosts.

#ifndef FOLIO_CONFIG_HPP
#define FOLIO_CONFIG_HPP

namespace folio {

// ============================================================================
// Reflow Parameters
// ============================================================================

struct ReflowParams {
    float page_capacity;        // content height budget per page
    float height_tolerance;     // slack before a block counts as overflowing
    int min_split_offset;       // tokens kept on each side of a split
    int settle_interval_ms;     // debounce delay before a reflow pass
    int max_split_probes;       // iteration cap of the split search
    float page_margin;          // horizontal inset for split hit testing

    static ReflowParams defaults() {
        ReflowParams p = {};
        p.page_capacity = 896.0f;     // 1056 page minus 80 padding top and bottom
        p.height_tolerance = 1.0f;
        p.min_split_offset = 2;
        p.settle_interval_ms = 16;    // about one frame
        p.max_split_probes = 30;
        p.page_margin = 8.0f;
        return p;
    }
};

// ============================================================================
// Estimated Layout Parameters
// ============================================================================

struct EstimatedLayoutParams {
    int chars_per_line;         // characters before a line wraps
    float line_height;
    float block_spacing;        // vertical gap after each block
    float image_height;
    float page_height;          // full page height including padding
    float page_padding;         // top padding before content starts
    float page_width;

    static EstimatedLayoutParams defaults() {
        EstimatedLayoutParams p = {};
        p.chars_per_line = 80;
        p.line_height = 32.0f;
        p.block_spacing = 0.0f;
        p.image_height = 256.0f;
        p.page_height = 1056.0f;
        p.page_padding = 80.0f;
        p.page_width = 816.0f;
        return p;
    }
};

struct FolioConfig {
    ReflowParams reflow;
    EstimatedLayoutParams layout;

    static FolioConfig defaults() {
        FolioConfig c;
        c.reflow = ReflowParams::defaults();
        c.layout = EstimatedLayoutParams::defaults();
        return c;
    }
};

// Values outside their valid range are rejected with an error log
bool reflow_params_validate(const ReflowParams& params);
bool estimated_layout_params_validate(const EstimatedLayoutParams& params);

// Parse `key = value` lines into config. Keys not present keep their
// current value. Returns false on malformed lines or invalid values.
bool config_parse_string(const char* text, FolioConfig* config);
bool config_load_file(const char* path, FolioConfig* config);

} // namespace folio

#endif // FOLIO_CONFIG_HPP
