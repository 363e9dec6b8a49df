// folio_transaction.hpp - Atomic Document Transactions
//
// A Transaction collects replacement steps against an EditorState and
// produces a new document snapshot plus a selection. Nothing is visible to
// the host until the whole transaction is dispatched, so a transaction is
// applied either completely or not at all.
//
// Replacement steps operate on whole nodes: a range either covers sibling
// pages (document level) or sibling blocks of one page (page level).

#ifndef FOLIO_TRANSACTION_HPP
#define FOLIO_TRANSACTION_HPP

#include "folio_node.hpp"

namespace folio {

// ============================================================================
// Editor State
// ============================================================================

struct EditorState {
    Document doc;
    int selection;      // absolute cursor position
    Schema schema;
};

// Document plus a cursor at the first valid position
EditorState make_editor_state(const Document& doc, const Schema& schema);

// ============================================================================
// Step Maps
// ============================================================================

// [pos, pos + old_size) was replaced by new_size tokens
struct StepMap {
    int pos;
    int old_size;
    int new_size;
};

// Map a position across one step. Positions inside a replaced range move to
// its start (assoc < 0) or end (assoc > 0).
int step_map(const StepMap& map, int pos, int assoc);

// ============================================================================
// Transaction
// ============================================================================

class Transaction {
public:
    explicit Transaction(const EditorState& state);

    // Replace [from, to) with nodes. Both ends must sit on node boundaries
    // at the same level; pages replace pages, blocks replace blocks.
    bool replace_range(int from, int to, const Fragment& nodes);
    bool replace_range(int from, int to, const NodeRef& node);
    bool insert(int pos, const NodeRef& node);
    bool delete_range(int from, int to);

    // Insert characters inside a text block; the cursor follows the text
    bool insert_text(int pos, const std::string& text);

    // Resolved to the nearest cursor position, searching forward first
    void set_selection(int pos);
    void set_selection(int pos, int bias);

    int map(int pos, int assoc = 1) const;

    const Document& doc() const { return doc_; }
    const Document& before() const { return before_; }
    int selection() const { return selection_; }
    bool doc_changed() const { return !steps_.empty(); }
    bool selection_set() const { return selection_set_; }
    int step_count() const { return (int)steps_.size(); }
    const std::vector<StepMap>& steps() const { return steps_; }

    void scroll_into_view() { scroll_ = true; }
    bool wants_scroll() const { return scroll_; }

    void set_origin(const char* origin) { origin_ = origin; }
    const char* origin() const { return origin_; }

private:
    bool replace_pages(int from, int to, const ResolvedPos& rf, const ResolvedPos& rt,
                       const Fragment& nodes);
    bool replace_blocks(int from, int to, const ResolvedPos& rf, const ResolvedPos& rt,
                        const Fragment& nodes);
    void record(int from, int to, int new_size);

    Document before_;
    Document doc_;
    int selection_;
    bool selection_set_;
    bool scroll_;
    const char* origin_;
    std::vector<StepMap> steps_;
};

} // namespace folio

#endif // FOLIO_TRANSACTION_HPP
