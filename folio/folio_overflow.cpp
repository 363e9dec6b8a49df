// folio_overflow.cpp - Page Overflow Detection Implementation

#include "folio_overflow.hpp"
#include "../lib/log.h"

namespace folio {

static log_category_t* overflow_log = nullptr;

OverflowLocation find_overflow(const Document& doc, LayoutOracle* layout, const ReflowParams& params) {
    if (!overflow_log) overflow_log = log_get_category("folio.overflow");

    OverflowLocation loc = {};
    loc.page_index = -1;
    loc.block_index = -1;
    if (!layout) return loc;

    for (int i = 0; i < doc.page_count(); i++) {
        PageFrame frame;
        if (!layout->measure_page(i, &frame)) {
            clog_debug(overflow_log, "page %d not rendered, skipped", i);
            continue;
        }

        float page_bottom = frame.content_top + params.page_capacity;
        float limit = page_bottom + params.height_tolerance;
        const NodeRef& page = doc.page(i);

        for (int j = 0; j < page->child_count(); j++) {
            float bottom;
            if (!layout->measure_block_bottom(i, j, &bottom)) {
                clog_debug(overflow_log, "page %d block %d unmeasurable", i, j);
                continue;
            }
            if (bottom > limit) {
                loc.found = true;
                loc.page_index = i;
                loc.block_index = j;
                loc.page_bottom = page_bottom;
                loc.block_bottom = bottom;
                loc.frame = frame;
                clog_debug(overflow_log, "page %d overflows at block %d: bottom=%.1f limit=%.1f",
                           i, j, bottom, limit);
                return loc;
            }
        }
    }
    return loc;
}

} // namespace folio
