// folio_layout.hpp - Layout Oracle Interface
//
// The reflow engine never computes heights. Every geometric fact comes from
// a LayoutOracle supplied by the host rendering surface, which answers
// queries against the tree it most recently rendered. Any query may fail
// (content not painted yet, stale view); failures are reported through the
// bool return and treated as "unmeasurable" by callers.
//
// All coordinates share one vertical axis, growing downward.

#ifndef FOLIO_LAYOUT_HPP
#define FOLIO_LAYOUT_HPP

#include "folio_node.hpp"
#include <algorithm>

namespace folio {

// ============================================================================
// Geometry
// ============================================================================

struct Rect {
    float left;
    float top;
    float right;
    float bottom;

    float width() const { return right - left; }
    float height() const { return bottom - top; }
};

inline float clampf(float value, float lo, float hi) {
    return std::max(lo, std::min(hi, value));
}

inline int clampi(int value, int lo, int hi) {
    return std::max(lo, std::min(hi, value));
}

// Rendered frame of a page's content box
struct PageFrame {
    float content_top;
    float left;
    float right;
};

// ============================================================================
// Layout Oracle
// ============================================================================

class LayoutOracle {
public:
    virtual ~LayoutOracle() = default;

    // Content box of a rendered page; false when the page is not attached
    virtual bool measure_page(int page_index, PageFrame* out) = 0;

    // Bottom edge of a block's rendered box
    virtual bool measure_block_bottom(int page_index, int block_index, float* out_bottom) = 0;

    // Caret rectangle at an absolute document position
    virtual bool measure_offset_rect(int pos, Rect* out) = 0;

    // Line boxes of a rendered block, top to bottom. Returns the number of
    // rectangles written, 0 when unavailable.
    virtual int measure_line_rects(int page_index, int block_index, Rect* out, int max_rects) {
        (void)page_index; (void)block_index; (void)out; (void)max_rects;
        return 0;
    }

    // Document position under a point
    virtual bool offset_at_point(float x, float y, int* out_pos) {
        (void)x; (void)y; (void)out_pos;
        return false;
    }

    // The host committed a new document; subsequent queries describe it
    virtual void commit(const Document& doc) {
        (void)doc;
    }
};

} // namespace folio

#endif // FOLIO_LAYOUT_HPP
