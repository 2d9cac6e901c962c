#ifndef PLX_PDF_DOCUMENT_H
#define PLX_PDF_DOCUMENT_H

#include "../../utils/plx_string.h"
#include <memory>
#include <vector>

namespace PoDoFo {
  class PdfMemDocument;
  class PdfPage;
}

// One word as laid out on the page, in PDF points (origin bottom-left).
struct plx_pdf_word
{
  plx_string text;
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;
};

// Read-only view of a PDF file. Every failure surfaces as source_unavailable_error.
class plx_pdf_document
{
  std::unique_ptr<PoDoFo::PdfMemDocument> m_pdf;
  plx_string m_path;

  const PoDoFo::PdfPage& require_page(int page_number) const;

public:
  plx_pdf_document();
  ~plx_pdf_document();

  plx_pdf_document(const plx_pdf_document&) = delete;
  plx_pdf_document& operator=(const plx_pdf_document&) = delete;

  void load(const plx_string& path);
  bool is_loaded() const { return m_pdf != nullptr; }

  void page_size(int page_number, double& width_pt, double& height_pt) const;

  /**
   * @brief Extracts word-level text with bounding boxes.
   * @param page_number 0-based page index.
   * @return Words in content-stream order. Entries without a bounding box are skipped.
   */
  std::vector<plx_pdf_word> words(int page_number) const;
};

#endif // PLX_PDF_DOCUMENT_H
