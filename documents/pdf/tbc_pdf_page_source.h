#ifndef TBC_PDF_PAGE_SOURCE_H
#define TBC_PDF_PAGE_SOURCE_H

#include "../tbc_page_feed.h"
#include "../../clustering/tbc_text_clustering.h"
#include "../../utils/tbc_string.h"

#include <memory>
#include <vector>

namespace PoDoFo {
  class PdfMemDocument;
  class PdfPage;
}

// Reads the span, drawing and link feeds of single PDF pages
class tbc_pdf_page_source
{
private:
  std::unique_ptr<PoDoFo::PdfMemDocument> m_pdf;
  tbc_string m_filename;

public:
  // Throws tbc_document_error when the file cannot be loaded or has no pages
  explicit tbc_pdf_page_source(const tbc_string& filename);
  ~tbc_pdf_page_source();

  size_t page_count() const;

  // Zero based page index; throws tbc_document_error when out of range
  tbc_page_feed read_page(size_t page_index) const;

  const tbc_string& get_filename() const { return m_filename; }

private:
  static void extract_spans_and_drawings(const PoDoFo::PdfPage& page, tbc_page_feed& feed);
  static void extract_links(PoDoFo::PdfPage& page, tbc_page_feed& feed);
};

// Loads one page and clusters it
std::vector<tbc_layout_block> cluster_pdf_page(const tbc_string& filename, size_t page_index,
                                               const tbc_cluster_config& config = tbc_cluster_config());

#endif // TBC_PDF_PAGE_SOURCE_H
