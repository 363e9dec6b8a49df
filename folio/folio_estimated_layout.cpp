// folio_estimated_layout.cpp - Deterministic Layout Oracle Implementation

#include "folio_estimated_layout.hpp"
#include "../lib/log.h"
#include <cmath>

namespace folio {

EstimatedLayout::EstimatedLayout(const EstimatedLayoutParams& params)
    : params_(params) {
}

float EstimatedLayout::char_width() const {
    float width = params_.page_width - 2 * params_.page_padding;
    if (width <= 0) width = params_.page_width;
    return width / (float)params_.chars_per_line;
}

int EstimatedLayout::line_count(const Node& block) const {
    if (!is_text_block(block.kind)) return 1;
    int len = (int)block.text.size();
    int lines = (len + params_.chars_per_line - 1) / params_.chars_per_line;
    return lines > 0 ? lines : 1;
}

// ============================================================================
// Layout
// ============================================================================

void EstimatedLayout::commit(const Document& doc) {
    pages_.clear();
    pages_.reserve(doc.page_count());

    int page_pos = 0;
    for (int i = 0; i < doc.page_count(); i++) {
        const NodeRef& page = doc.page(i);
        PageBox pb;
        pb.pos = page_pos;
        pb.size = page->size;
        pb.content_top = i * params_.page_height + params_.page_padding;

        float y = pb.content_top;
        int block_pos = page_pos + 1;
        for (const NodeRef& block : page->children) {
            BlockBox bb;
            bb.pos = block_pos;
            bb.size = block->size;
            bb.is_text = is_text_block(block->kind);
            bb.text_length = bb.is_text ? (int)block->text.size() : 0;
            bb.lines = line_count(*block);
            bb.top = y;
            bb.bottom = y + (bb.is_text ? bb.lines * params_.line_height : params_.image_height);
            pb.blocks.push_back(bb);

            y = bb.bottom + params_.block_spacing;
            block_pos += block->size;
        }
        pages_.push_back(pb);
        page_pos += page->size;
    }
    log_debug("estimated layout: committed %d pages", (int)pages_.size());
}

float EstimatedLayout::page_content_height(int page_index) const {
    if (page_index < 0 || page_index >= (int)pages_.size()) return 0;
    const PageBox& pb = pages_[page_index];
    if (pb.blocks.empty()) return 0;
    return pb.blocks.back().bottom - pb.content_top;
}

// ============================================================================
// Queries
// ============================================================================

bool EstimatedLayout::measure_page(int page_index, PageFrame* out) {
    if (page_index < 0 || page_index >= (int)pages_.size()) return false;
    out->content_top = pages_[page_index].content_top;
    out->left = 0;
    out->right = params_.page_width;
    return true;
}

bool EstimatedLayout::measure_block_bottom(int page_index, int block_index, float* out_bottom) {
    if (page_index < 0 || page_index >= (int)pages_.size()) return false;
    const PageBox& pb = pages_[page_index];
    if (block_index < 0 || block_index >= (int)pb.blocks.size()) return false;
    *out_bottom = pb.blocks[block_index].bottom;
    return true;
}

const EstimatedLayout::BlockBox* EstimatedLayout::find_block(int pos, int* out_page) const {
    for (int i = 0; i < (int)pages_.size(); i++) {
        const PageBox& pb = pages_[i];
        int content_start = pb.pos + 1;
        int content_end = pb.pos + pb.size - 1;
        if (pos < content_start || pos > content_end) continue;
        if (pb.blocks.empty()) return nullptr;

        if (out_page) *out_page = i;
        for (const BlockBox& bb : pb.blocks) {
            if (pos >= bb.pos && pos < bb.pos + bb.size) return &bb;
        }
        // end of page content
        return &pb.blocks.back();
    }
    return nullptr;
}

bool EstimatedLayout::measure_offset_rect(int pos, Rect* out) {
    const BlockBox* bb = find_block(pos, nullptr);
    if (!bb) return false;

    float cw = char_width();
    if (!bb->is_text) {
        // caret before or after an atomic block
        bool after = pos > bb->pos;
        out->left = content_left();
        out->right = out->left + 1;
        out->top = after ? bb->bottom - params_.line_height : bb->top;
        out->bottom = after ? bb->bottom : bb->top + params_.line_height;
        return true;
    }

    int t = clampi(pos - bb->pos - 1, 0, bb->text_length);
    int cpl = params_.chars_per_line;
    int line = t / cpl;
    // a caret at a wrap point sits at the end of the previous line
    if (t > 0 && t % cpl == 0) line--;
    int column = t - line * cpl;

    out->left = content_left() + column * cw;
    out->right = out->left + 1;
    out->top = bb->top + line * params_.line_height;
    out->bottom = out->top + params_.line_height;
    return true;
}

int EstimatedLayout::measure_line_rects(int page_index, int block_index, Rect* out, int max_rects) {
    if (page_index < 0 || page_index >= (int)pages_.size()) return 0;
    const PageBox& pb = pages_[page_index];
    if (block_index < 0 || block_index >= (int)pb.blocks.size()) return 0;
    const BlockBox& bb = pb.blocks[block_index];
    if (!bb.is_text) return 0;

    float cw = char_width();
    int cpl = params_.chars_per_line;
    int count = 0;
    for (int line = 0; line < bb.lines && count < max_rects; line++) {
        int chars = std::min(cpl, bb.text_length - line * cpl);
        if (chars < 1) chars = 1;
        Rect& r = out[count++];
        r.left = content_left();
        r.right = r.left + chars * cw;
        r.top = bb.top + line * params_.line_height;
        r.bottom = r.top + params_.line_height;
    }
    return count;
}

bool EstimatedLayout::offset_at_point(float x, float y, int* out_pos) {
    if (pages_.empty() || y < 0) return false;
    int page_index = (int)std::floor(y / params_.page_height);
    if (page_index >= (int)pages_.size()) return false;

    const PageBox& pb = pages_[page_index];
    if (pb.blocks.empty()) return false;

    const BlockBox* hit = &pb.blocks.back();
    for (const BlockBox& bb : pb.blocks) {
        if (y < bb.bottom) {
            hit = &bb;
            break;
        }
    }

    if (!hit->is_text) {
        *out_pos = y < (hit->top + hit->bottom) / 2 ? hit->pos : hit->pos + 1;
        return true;
    }

    int cpl = params_.chars_per_line;
    int line = clampi((int)std::floor((y - hit->top) / params_.line_height), 0, hit->lines - 1);
    int line_chars = std::max(0, std::min(cpl, hit->text_length - line * cpl));
    int column = clampi((int)std::lround((x - content_left()) / char_width()), 0, line_chars);
    *out_pos = hit->pos + 1 + line * cpl + column;
    return true;
}

} // namespace folio
