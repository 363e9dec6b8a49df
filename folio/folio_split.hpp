// folio_split.hpp - Split Point Resolution
//
// Given the token range of an overflowing block, find the document position
// at which the page content must be cut so that everything before it fits
// the page's capacity line. At least min_split_offset tokens stay on each
// side of the cut.

#ifndef FOLIO_SPLIT_HPP
#define FOLIO_SPLIT_HPP

#include "folio_layout.hpp"
#include "folio_config.hpp"
#include <cstdint>

namespace folio {

enum class SplitMethod : uint8_t {
    None,
    LineBox,        // hit test on the first overflowing line box
    Search,         // bounded binary search over caret rectangles
};

const char* split_method_name(SplitMethod method);

struct SplitResult {
    bool found;
    int pos;
    int probes;
    SplitMethod method;
};

struct SplitRequest {
    int block_start;        // open token of the offending block
    int block_end;          // position after its close token
    float page_bottom;      // capacity line of the page
    int page_index;
    int block_index;
    PageFrame frame;
};

// Allowed split positions [lo, hi]; false when the block is too small to split
bool split_bounds(int block_start, int block_end, int min_split_offset, int* lo, int* hi);

// Largest position in the split bounds whose caret rectangle fits
SplitResult resolve_split(int block_start, int block_end, float page_bottom,
                          LayoutOracle* layout, const ReflowParams& params);

// Line box hit test first, binary search when no verified line boundary is found
SplitResult resolve_split_fast(const SplitRequest& request, LayoutOracle* layout,
                               const ReflowParams& params);

} // namespace folio

#endif // FOLIO_SPLIT_HPP
