// folio_outline.hpp - Plain Text Outline Format
//
// Line oriented text form of a paged document, used by the command line
// driver and test fixtures. Every non-empty line is one block:
//
//   # Title            heading, one '#' per level (1-6)
//   - item             list item
//   > quoted           quote
//   ![figure.png]      image
//   \                  empty paragraph
//   ---                page break
//   anything else      paragraph
//
// Blank lines are ignored.

#ifndef FOLIO_OUTLINE_HPP
#define FOLIO_OUTLINE_HPP

#include "folio_node.hpp"
#include <string>

namespace folio {

bool outline_parse(const char* text, Document* out);
bool outline_load_file(const char* path, Document* out);
std::string outline_write(const Document& doc);

} // namespace folio

#endif // FOLIO_OUTLINE_HPP
