// folio_split.cpp - Split Point Resolution Implementation

#include "folio_split.hpp"
#include "folio_probe.hpp"
#include "../lib/log.h"

namespace folio {

static constexpr int MAX_LINE_RECTS = 256;

static log_category_t* split_log() {
    static log_category_t* category = log_get_category("folio.split");
    return category;
}

const char* split_method_name(SplitMethod method) {
    switch (method) {
        case SplitMethod::None:    return "none";
        case SplitMethod::LineBox: return "line-box";
        case SplitMethod::Search:  return "search";
    }
    return "unknown";
}

bool split_bounds(int block_start, int block_end, int min_split_offset, int* lo, int* hi) {
    if (block_end - block_start < min_split_offset * 2) return false;
    *lo = block_start + min_split_offset;
    *hi = block_end - min_split_offset;
    return true;
}

static bool rect_fits(const Rect& rect, float page_bottom, const ReflowParams& params) {
    return rect.bottom <= page_bottom + params.height_tolerance;
}

// ============================================================================
// Binary Search
// ============================================================================

SplitResult resolve_split(int block_start, int block_end, float page_bottom,
                          LayoutOracle* layout, const ReflowParams& params) {
    SplitResult result = {};
    result.method = SplitMethod::None;

    int lo, hi;
    if (!layout || !split_bounds(block_start, block_end, params.min_split_offset, &lo, &hi)) {
        clog_debug(split_log(), "block [%d, %d) too small to split", block_start, block_end);
        return result;
    }

    ProbeSearchResult search = bounded_probe_search(lo, hi, params.max_split_probes,
        [&](int pos) {
            Rect rect;
            if (!layout->measure_offset_rect(pos, &rect)) return ProbeVerdict::Failed;
            return rect_fits(rect, page_bottom, params) ? ProbeVerdict::Accept : ProbeVerdict::Reject;
        });

    result.probes = search.probes;
    if (search.capped) {
        clog_warn(split_log(), "split search hit the %d probe cap in [%d, %d]",
                  params.max_split_probes, lo, hi);
    }
    if (!search.found) {
        clog_debug(split_log(), "no fitting split in [%d, %d] after %d probes (%d failed)",
                   lo, hi, search.probes, search.failures);
        return result;
    }

    result.found = true;
    result.pos = clampi(search.value, lo, hi);
    result.method = SplitMethod::Search;
    clog_debug(split_log(), "split at %d after %d probes", result.pos, result.probes);
    return result;
}

// ============================================================================
// Line Box Fast Path
// ============================================================================

SplitResult resolve_split_fast(const SplitRequest& request, LayoutOracle* layout,
                               const ReflowParams& params) {
    SplitResult result = {};
    result.method = SplitMethod::None;

    int lo, hi;
    if (!layout || !split_bounds(request.block_start, request.block_end,
                                 params.min_split_offset, &lo, &hi)) {
        return result;
    }

    Rect lines[MAX_LINE_RECTS];
    int count = layout->measure_line_rects(request.page_index, request.block_index,
                                           lines, MAX_LINE_RECTS);
    float limit = request.page_bottom + params.height_tolerance;

    for (int i = 0; i < count; i++) {
        const Rect& line = lines[i];
        if (line.bottom <= limit) continue;

        // hit test just inside the first overflowing line, at the capacity line
        float x = clampf(line.left + 1, request.frame.left + params.page_margin,
                         request.frame.right - params.page_margin);
        float y = clampf(request.page_bottom - 1, line.top + 1, line.bottom - 1);
        int pos;
        if (layout->offset_at_point(x, y, &pos)) {
            pos = clampi(pos, lo, hi);
            Rect caret;
            result.probes = 1;
            if (layout->measure_offset_rect(pos, &caret) && rect_fits(caret, request.page_bottom, params)) {
                result.found = true;
                result.pos = pos;
                result.method = SplitMethod::LineBox;
                clog_debug(split_log(), "line box %d gives split at %d", i, pos);
                return result;
            }
        }
        break;
    }

    SplitResult fallback = resolve_split(request.block_start, request.block_end,
                                         request.page_bottom, layout, params);
    fallback.probes += result.probes;
    return fallback;
}

} // namespace folio
