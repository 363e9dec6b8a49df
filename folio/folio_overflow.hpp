// folio_overflow.hpp - Page Overflow Detection
//
// Scans pages in document order and reports the first block whose rendered
// bottom edge crosses its page's capacity line.

#ifndef FOLIO_OVERFLOW_HPP
#define FOLIO_OVERFLOW_HPP

#include "folio_node.hpp"
#include "folio_layout.hpp"
#include "folio_config.hpp"

namespace folio {

struct OverflowLocation {
    bool found;
    int page_index;
    int block_index;
    float page_bottom;      // capacity line: content top + page capacity
    float block_bottom;     // measured bottom of the offending block
    PageFrame frame;        // frame of the overflowing page
};

// Bottom edges within page_bottom + height_tolerance count as fitting.
// Pages the oracle cannot measure are skipped, as are unmeasurable blocks.
OverflowLocation find_overflow(const Document& doc, LayoutOracle* layout, const ReflowParams& params);

} // namespace folio

#endif // FOLIO_OVERFLOW_HPP
