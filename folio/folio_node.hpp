// folio_node.hpp - Document Model for Paged Editing
//
// Immutable document tree: a Document is an ordered, non-empty list of
// Pages; a Page holds an ordered, non-empty list of Blocks. Nodes are
// shared between document snapshots and never mutated after creation;
// edits build new nodes and replace old ones wholesale.
//
// Positions use an integer token model: every text block contributes an
// open token, one token per character and a close token; an image is a
// single atomic token; a page wraps its content in an open and close token.

#ifndef FOLIO_NODE_HPP
#define FOLIO_NODE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace folio {

// ============================================================================
// Node Kinds
// ============================================================================

enum class NodeKind : uint8_t {
    Paragraph,
    Heading,
    ListItem,
    Quote,
    Image,
    Page,
};

const char* node_kind_name(NodeKind kind);

inline bool is_text_block(NodeKind kind) {
    return kind == NodeKind::Paragraph || kind == NodeKind::Heading ||
           kind == NodeKind::ListItem || kind == NodeKind::Quote;
}

inline bool is_block(NodeKind kind) {
    return kind != NodeKind::Page;
}

// ============================================================================
// Node
// ============================================================================

struct Node;
typedef std::shared_ptr<const Node> NodeRef;
typedef std::vector<NodeRef> Fragment;

// Page identity and style; copied unchanged when a page is rebuilt
struct PageAttrs {
    std::string id;
    std::string style_class;

    bool operator==(const PageAttrs& other) const {
        return id == other.id && style_class == other.style_class;
    }
};

struct Node {
    NodeKind kind;
    int level;                  // heading level (1-6), 0 otherwise
    std::string text;           // text blocks
    std::string src;            // images
    PageAttrs attrs;            // pages
    Fragment children;          // pages
    int size;                   // cached token size

    // Token size of this node including its own open/close tokens
    int node_size() const { return size; }
    // Token size of the content between the open and close tokens
    int content_size() const;
    int child_count() const { return (int)children.size(); }
    const NodeRef& child(int index) const { return children[index]; }
};

// ============================================================================
// Node Construction
// ============================================================================

NodeRef make_paragraph(const std::string& text);
NodeRef make_heading(int level, const std::string& text);
NodeRef make_list_item(const std::string& text);
NodeRef make_quote(const std::string& text);
NodeRef make_image(const std::string& src);
NodeRef make_page(const PageAttrs& attrs, const Fragment& content);

// Same kind and attributes as `block`, different text
NodeRef text_block_with_text(const Node& block, const std::string& text);

// ============================================================================
// Fragment Helpers
// ============================================================================

int fragment_size(const Fragment& fragment);

// Content between token offsets [from, to) of a fragment. Text blocks cut
// in the middle keep their kind and attributes and are truncated.
Fragment fragment_cut(const Fragment& fragment, int from, int to);
inline Fragment fragment_cut(const Fragment& fragment, int from) {
    return fragment_cut(fragment, from, fragment_size(fragment));
}

Fragment fragment_append(const Fragment& head, const Fragment& tail);

// Text length plus one per image; placeholders contribute nothing
int fragment_content_measure(const Fragment& fragment);

// ============================================================================
// Schema
// ============================================================================

// Node kinds enabled by the host editor
struct Schema {
    uint32_t kinds;

    bool allows(NodeKind kind) const {
        return (kinds & (1u << (uint32_t)kind)) != 0;
    }

    Schema without(NodeKind kind) const {
        Schema s = *this;
        s.kinds &= ~(1u << (uint32_t)kind);
        return s;
    }

    static Schema standard() {
        Schema s;
        s.kinds = (1u << (uint32_t)NodeKind::Paragraph) |
                  (1u << (uint32_t)NodeKind::Heading) |
                  (1u << (uint32_t)NodeKind::ListItem) |
                  (1u << (uint32_t)NodeKind::Quote) |
                  (1u << (uint32_t)NodeKind::Image) |
                  (1u << (uint32_t)NodeKind::Page);
        return s;
    }
};

// Empty paragraph used wherever a page or fragment would otherwise be empty.
// Returns an empty fragment when the schema has no paragraph kind.
Fragment ensure_fragment(const Fragment& fragment, const Schema& schema);

// ============================================================================
// Document
// ============================================================================

struct Document {
    Fragment pages;

    int page_count() const { return (int)pages.size(); }
    const NodeRef& page(int index) const { return pages[index]; }
    int content_size() const { return fragment_size(pages); }

    // Position of the page's open token
    int page_pos(int page_index) const;
    // Position of the first content token inside the page
    int page_start(int page_index) const { return page_pos(page_index) + 1; }
    // Position of the page's close token
    int page_end(int page_index) const;
    // Position of a block's open token
    int block_pos(int page_index, int block_index) const;

    // Page whose content contains pos (inclusive of both content edges), -1 if none
    int page_at(int pos) const;
};

Document make_document(const Fragment& pages);
// Single page holding an empty paragraph
Document make_empty_document();

// Sum of fragment_content_measure over all pages
int document_content_measure(const Document& doc);

// ============================================================================
// Position Resolution
// ============================================================================

struct ResolvedPos {
    bool valid;
    int pos;
    int depth;          // 0: between pages, 1: between blocks, 2: inside a text block
    int page_index;     // depth >= 1
    int block_index;    // depth 1: index of the block after pos; depth 2: containing block
    int offset;         // depth 1: offset inside page content; depth 2: text offset
};

ResolvedPos resolve_pos(const Document& doc, int pos);

// A position a text cursor can occupy: inside a text block, or a block
// boundary next to an image
bool is_cursor_pos(const Document& doc, int pos);

// Nearest cursor position, searching first in the direction of bias
// (+1 forward, -1 backward). Falls back to the first cursor position.
int resolve_cursor(const Document& doc, int pos, int bias);

// Debug dump: one line per page and block
std::string document_dump(const Document& doc);

} // namespace folio

#endif // FOLIO_NODE_HPP
