// folio_reflow.hpp - Reflow Transaction Builder and Reflow Pass
//
// A reflow pass is a pure function of the committed editor state and the
// layout oracle's view of it: detect the first overflowing page, resolve a
// split point, and build one transaction that moves the overflow forward.
// At most one page is fixed per pass; cascades are resolved by later passes.

#ifndef FOLIO_REFLOW_HPP
#define FOLIO_REFLOW_HPP

#include "folio_transaction.hpp"
#include "folio_layout.hpp"
#include "folio_config.hpp"
#include "folio_split.hpp"

namespace folio {

enum class ReflowMode : uint8_t {
    MergeForward,   // prepend to the next page, append a page at the end
    InsertPage,     // always insert a new page right after the source page
};

// Cut page_index's content at split_pos and move the tail. `out` must be a
// fresh transaction on `state`. Returns false (and leaves `out` untouched)
// when nothing would move or the schema lacks page or paragraph kinds.
bool build_reflow(const EditorState& state, int page_index, int split_pos,
                  ReflowMode mode, Transaction* out);

struct ReflowPassResult {
    bool overflow;          // an overflowing page was found
    bool applied;           // `out` holds a reflow transaction
    int page_index;
    int block_index;
    int split_pos;
    bool whole_block;       // cut before the offending block
    SplitMethod method;
};

ReflowPassResult run_reflow_pass(const EditorState& state, LayoutOracle* layout,
                                 const ReflowParams& params, Transaction* out);

} // namespace folio

#endif // FOLIO_REFLOW_HPP
