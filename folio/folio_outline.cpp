// folio_outline.cpp - Plain Text Outline Format Implementation

#include "folio_outline.hpp"
#include "../lib/log.h"
#include <cstdio>
#include <cstring>

namespace folio {

static bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, strlen(prefix), prefix) == 0;
}

static std::string trim_right(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\r");
    return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

static int heading_level(const std::string& line) {
    int level = 0;
    while (level < (int)line.size() && line[level] == '#') level++;
    if (level < 1 || level > 6 || level >= (int)line.size() || line[level] != ' ') return 0;
    return level;
}

static NodeRef parse_block(const std::string& line, int line_no) {
    int level = heading_level(line);
    if (level > 0) return make_heading(level, line.substr(level + 1));
    if (starts_with(line, "- ")) return make_list_item(line.substr(2));
    if (starts_with(line, "> ")) return make_quote(line.substr(2));
    if (line == "\\") return make_paragraph("");
    if (starts_with(line, "![")) {
        if (line.size() < 3 || line[line.size() - 1] != ']') {
            log_error("outline: line %d: unterminated image reference", line_no);
            return nullptr;
        }
        return make_image(line.substr(2, line.size() - 3));
    }
    return make_paragraph(line);
}

bool outline_parse(const char* text, Document* out) {
    if (!text || !out) return false;

    Fragment pages;
    Fragment blocks;
    int line_no = 0;

    const char* p = text;
    while (*p) {
        const char* eol = strchr(p, '\n');
        size_t len = eol ? (size_t)(eol - p) : strlen(p);
        std::string line = trim_right(std::string(p, len));
        p = eol ? eol + 1 : p + len;
        line_no++;

        if (line.empty()) continue;
        if (line == "---") {
            pages.push_back(make_page(PageAttrs(), blocks));
            blocks.clear();
            continue;
        }

        NodeRef block = parse_block(line, line_no);
        if (!block) return false;
        blocks.push_back(block);
    }
    if (!blocks.empty() || pages.empty()) {
        pages.push_back(make_page(PageAttrs(), blocks));
    }

    for (int i = 0; i < (int)pages.size(); i++) {
        // stable identities so hosts can track pages across reflows
        std::shared_ptr<Node> page = std::make_shared<Node>(*pages[i]);
        page->attrs.id = "page-" + std::to_string(i + 1);
        page->attrs.style_class = "editor-page";
        pages[i] = page;
    }

    *out = make_document(pages);
    return true;
}

bool outline_load_file(const char* path, Document* out) {
    FILE* file = fopen(path, "rb");
    if (!file) {
        log_error("outline: cannot open '%s'", path);
        return false;
    }
    std::string text;
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), file)) > 0) {
        text.append(buffer, n);
    }
    bool read_error = ferror(file) != 0;
    fclose(file);
    if (read_error) {
        log_error("outline: error reading '%s'", path);
        return false;
    }
    return outline_parse(text.c_str(), out);
}

std::string outline_write(const Document& doc) {
    std::string out;
    for (int i = 0; i < doc.page_count(); i++) {
        if (i > 0) out += "---\n";
        for (const NodeRef& block : doc.page(i)->children) {
            switch (block->kind) {
                case NodeKind::Heading:
                    out += std::string(block->level, '#') + " " + block->text;
                    break;
                case NodeKind::ListItem:
                    out += "- " + block->text;
                    break;
                case NodeKind::Quote:
                    out += "> " + block->text;
                    break;
                case NodeKind::Image:
                    out += "![" + block->src + "]";
                    break;
                default:
                    out += block->text.empty() ? std::string("\\") : block->text;
                    break;
            }
            out += "\n";
        }
    }
    return out;
}

} // namespace folio
