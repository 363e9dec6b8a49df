// folio_commands.hpp - User Page Commands
//
// Explicit page operations bound to editor commands. Each builds one
// transaction into `out` (a fresh transaction on `state`) and returns
// whether the command applies; nothing is written on failure.

#ifndef FOLIO_COMMANDS_HPP
#define FOLIO_COMMANDS_HPP

#include "folio_transaction.hpp"

namespace folio {

// Empty page at the end of the document; the cursor moves into it
bool cmd_append_page(const EditorState& state, Transaction* out);

// Delete the last page unless it is the only one
bool cmd_remove_last_page(const EditorState& state, Transaction* out);

// Manual page break: content after the cursor moves to a new page inserted
// after the current one, the cursor follows it
bool cmd_split_page_at_cursor(const EditorState& state, Transaction* out);

} // namespace folio

#endif // FOLIO_COMMANDS_HPP
