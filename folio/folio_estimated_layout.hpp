// folio_estimated_layout.hpp - Deterministic Layout Oracle
//
// A headless LayoutOracle that lays pages out on a fixed grid instead of
// asking a rendering surface. Text wraps every chars_per_line characters,
// each line is line_height tall, images have a fixed height. Pages are
// stacked vertically every page_height units and content is never clipped,
// so overflowing blocks report positions below their page's capacity.
//
// Used by the command line driver and the tests; real hosts supply an
// oracle backed by their renderer.

#ifndef FOLIO_ESTIMATED_LAYOUT_HPP
#define FOLIO_ESTIMATED_LAYOUT_HPP

#include "folio_layout.hpp"
#include "folio_config.hpp"
#include <vector>

namespace folio {

class EstimatedLayout : public LayoutOracle {
public:
    explicit EstimatedLayout(const EstimatedLayoutParams& params);
    ~EstimatedLayout() override = default;

    bool measure_page(int page_index, PageFrame* out) override;
    bool measure_block_bottom(int page_index, int block_index, float* out_bottom) override;
    bool measure_offset_rect(int pos, Rect* out) override;
    int measure_line_rects(int page_index, int block_index, Rect* out, int max_rects) override;
    bool offset_at_point(float x, float y, int* out_pos) override;
    void commit(const Document& doc) override;

    // Height used by the content of a page (bottom of its last block
    // relative to the content top)
    float page_content_height(int page_index) const;
    int line_count(const Node& block) const;
    int page_count() const { return (int)pages_.size(); }
    const EstimatedLayoutParams& params() const { return params_; }

private:
    struct BlockBox {
        int pos;            // open token position
        int size;
        int text_length;
        bool is_text;
        float top;
        float bottom;
        int lines;
    };

    struct PageBox {
        int pos;
        int size;
        float content_top;
        std::vector<BlockBox> blocks;
    };

    const BlockBox* find_block(int pos, int* out_page) const;
    float content_left() const { return params_.page_padding; }
    float char_width() const;

    EstimatedLayoutParams params_;
    std::vector<PageBox> pages_;
};

} // namespace folio

#endif // FOLIO_ESTIMATED_LAYOUT_HPP
