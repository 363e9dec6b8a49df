// folio_node.cpp - Document Model Implementation

#include "folio_node.hpp"
#include <algorithm>
#include <cstdio>

namespace folio {

const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Paragraph: return "paragraph";
        case NodeKind::Heading:   return "heading";
        case NodeKind::ListItem:  return "list_item";
        case NodeKind::Quote:     return "quote";
        case NodeKind::Image:     return "image";
        case NodeKind::Page:      return "page";
    }
    return "unknown";
}

int Node::content_size() const {
    if (kind == NodeKind::Image) return 0;
    return size - 2;
}

// ============================================================================
// Node Construction
// ============================================================================

static NodeRef make_text_block(NodeKind kind, int level, const std::string& text) {
    std::shared_ptr<Node> node = std::make_shared<Node>();
    node->kind = kind;
    node->level = level;
    node->text = text;
    node->size = (int)text.size() + 2;
    return node;
}

NodeRef make_paragraph(const std::string& text) {
    return make_text_block(NodeKind::Paragraph, 0, text);
}

NodeRef make_heading(int level, const std::string& text) {
    if (level < 1) level = 1;
    if (level > 6) level = 6;
    return make_text_block(NodeKind::Heading, level, text);
}

NodeRef make_list_item(const std::string& text) {
    return make_text_block(NodeKind::ListItem, 0, text);
}

NodeRef make_quote(const std::string& text) {
    return make_text_block(NodeKind::Quote, 0, text);
}

NodeRef make_image(const std::string& src) {
    std::shared_ptr<Node> node = std::make_shared<Node>();
    node->kind = NodeKind::Image;
    node->level = 0;
    node->src = src;
    node->size = 1;
    return node;
}

NodeRef make_page(const PageAttrs& attrs, const Fragment& content) {
    std::shared_ptr<Node> node = std::make_shared<Node>();
    node->kind = NodeKind::Page;
    node->level = 0;
    node->attrs = attrs;
    node->children = content;
    // a page is never built without blocks
    if (node->children.empty()) {
        node->children.push_back(make_paragraph(""));
    }
    node->size = fragment_size(node->children) + 2;
    return node;
}

NodeRef text_block_with_text(const Node& block, const std::string& text) {
    return make_text_block(block.kind, block.level, text);
}

// ============================================================================
// Fragment Helpers
// ============================================================================

int fragment_size(const Fragment& fragment) {
    int size = 0;
    for (const NodeRef& node : fragment) {
        size += node->size;
    }
    return size;
}

Fragment fragment_cut(const Fragment& fragment, int from, int to) {
    Fragment result;
    if (to <= from) return result;

    int pos = 0;
    for (const NodeRef& child : fragment) {
        int end = pos + child->size;
        if (end > from && pos < to) {
            if (is_text_block(child->kind) && (pos < from || end > to)) {
                int len = (int)child->text.size();
                int text_from = std::max(0, from - pos - 1);
                int text_to = std::min(len, to - pos - 1);
                if (text_to < text_from) text_to = text_from;
                result.push_back(text_block_with_text(
                    *child, child->text.substr(text_from, text_to - text_from)));
            } else {
                result.push_back(child);
            }
        }
        pos = end;
        if (pos >= to) break;
    }
    return result;
}

Fragment fragment_append(const Fragment& head, const Fragment& tail) {
    Fragment result;
    result.reserve(head.size() + tail.size());
    result.insert(result.end(), head.begin(), head.end());
    result.insert(result.end(), tail.begin(), tail.end());
    return result;
}

int fragment_content_measure(const Fragment& fragment) {
    int measure = 0;
    for (const NodeRef& node : fragment) {
        if (node->kind == NodeKind::Page) {
            measure += fragment_content_measure(node->children);
        } else if (node->kind == NodeKind::Image) {
            measure += 1;
        } else {
            measure += (int)node->text.size();
        }
    }
    return measure;
}

Fragment ensure_fragment(const Fragment& fragment, const Schema& schema) {
    if (!fragment.empty()) return fragment;
    Fragment placeholder;
    if (schema.allows(NodeKind::Paragraph)) {
        placeholder.push_back(make_paragraph(""));
    }
    return placeholder;
}

// ============================================================================
// Document
// ============================================================================

int Document::page_pos(int page_index) const {
    int pos = 0;
    for (int i = 0; i < page_index && i < page_count(); i++) {
        pos += pages[i]->size;
    }
    return pos;
}

int Document::page_end(int page_index) const {
    return page_pos(page_index) + pages[page_index]->size - 1;
}

int Document::block_pos(int page_index, int block_index) const {
    int pos = page_start(page_index);
    const NodeRef& pg = pages[page_index];
    for (int i = 0; i < block_index && i < pg->child_count(); i++) {
        pos += pg->child(i)->size;
    }
    return pos;
}

int Document::page_at(int pos) const {
    int p = 0;
    for (int i = 0; i < page_count(); i++) {
        int start = p + 1;
        int end = p + pages[i]->size - 1;
        if (pos >= start && pos <= end) return i;
        p += pages[i]->size;
    }
    return -1;
}

Document make_document(const Fragment& pages) {
    Document doc;
    doc.pages = pages;
    if (doc.pages.empty()) {
        doc.pages.push_back(make_page(PageAttrs(), Fragment()));
    }
    return doc;
}

Document make_empty_document() {
    return make_document(Fragment());
}

int document_content_measure(const Document& doc) {
    return fragment_content_measure(doc.pages);
}

// ============================================================================
// Position Resolution
// ============================================================================

ResolvedPos resolve_pos(const Document& doc, int pos) {
    ResolvedPos r = {};
    r.pos = pos;
    r.page_index = -1;
    r.block_index = -1;
    if (pos < 0 || pos > doc.content_size()) return r;

    int p = 0;
    for (int i = 0; i < doc.page_count(); i++) {
        const NodeRef& pg = doc.page(i);
        if (pos == p) {
            r.valid = true;
            r.depth = 0;
            r.page_index = i;
            return r;
        }
        int start = p + 1;
        int end = p + pg->size - 1;
        if (pos >= start && pos <= end) {
            r.valid = true;
            r.page_index = i;
            int bp = start;
            for (int j = 0; j < pg->child_count(); j++) {
                const NodeRef& block = pg->child(j);
                if (pos == bp) {
                    r.depth = 1;
                    r.block_index = j;
                    r.offset = pos - start;
                    return r;
                }
                if (pos > bp && pos < bp + block->size) {
                    r.depth = 2;
                    r.block_index = j;
                    r.offset = pos - bp - 1;
                    return r;
                }
                bp += block->size;
            }
            r.depth = 1;
            r.block_index = pg->child_count();
            r.offset = pos - start;
            return r;
        }
        p += pg->size;
    }

    // end of document
    r.valid = true;
    r.depth = 0;
    r.page_index = doc.page_count();
    return r;
}

bool is_cursor_pos(const Document& doc, int pos) {
    ResolvedPos r = resolve_pos(doc, pos);
    if (!r.valid) return false;
    if (r.depth == 2) return true;
    if (r.depth != 1) return false;

    const NodeRef& pg = doc.page(r.page_index);
    if (r.block_index < pg->child_count() &&
        pg->child(r.block_index)->kind == NodeKind::Image) {
        return true;
    }
    if (r.block_index > 0 && pg->child(r.block_index - 1)->kind == NodeKind::Image) {
        return true;
    }
    return false;
}

int resolve_cursor(const Document& doc, int pos, int bias) {
    int size = doc.content_size();
    pos = std::max(0, std::min(pos, size));
    if (is_cursor_pos(doc, pos)) return pos;

    int dir = bias < 0 ? -1 : 1;
    for (int p = pos + dir; p >= 0 && p <= size; p += dir) {
        if (is_cursor_pos(doc, p)) return p;
    }
    for (int p = pos - dir; p >= 0 && p <= size; p -= dir) {
        if (is_cursor_pos(doc, p)) return p;
    }
    return pos;
}

std::string document_dump(const Document& doc) {
    std::string out;
    char line[160];
    for (int i = 0; i < doc.page_count(); i++) {
        const NodeRef& pg = doc.page(i);
        snprintf(line, sizeof(line), "page %d pos=%d size=%d id='%s'\n",
                 i, doc.page_pos(i), pg->size, pg->attrs.id.c_str());
        out += line;
        for (int j = 0; j < pg->child_count(); j++) {
            const NodeRef& block = pg->child(j);
            if (block->kind == NodeKind::Image) {
                snprintf(line, sizeof(line), "  %s src='%s'\n",
                         node_kind_name(block->kind), block->src.c_str());
            } else {
                std::string preview = block->text.substr(0, 48);
                snprintf(line, sizeof(line), "  %s len=%d \"%s%s\"\n",
                         node_kind_name(block->kind), (int)block->text.size(),
                         preview.c_str(), block->text.size() > 48 ? "..." : "");
            }
            out += line;
        }
    }
    return out;
}

} // namespace folio
