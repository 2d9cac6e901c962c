#include "plx_pdf_document.h"
#include "../../extraction/plx_extraction_exceptions.h"
#include <podofo/podofo.h>
#include <filesystem>
#include <iostream>
#include <system_error>

using namespace PoDoFo;

plx_pdf_document::plx_pdf_document() {}

plx_pdf_document::~plx_pdf_document() {}

void plx_pdf_document::load(const plx_string& path)
{
  m_pdf.reset();
  m_path = path;

  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path.to_std_const(), ec))
  {
    throw source_unavailable_error("PDF not found: " + path.to_std_const(), path);
  }

  auto doc = std::make_unique<PdfMemDocument>();
  try
  {
    doc->Load(path.to_std_const());
  }
  catch (const PdfError& e)
  {
    throw source_unavailable_error("PDF could not be parsed: " + path.to_std_const() + " (" + e.what() + ")", path);
  }
  catch (const std::exception& e)
  {
    throw source_unavailable_error("PDF could not be read: " + path.to_std_const() + " (" + e.what() + ")", path);
  }
  m_pdf = std::move(doc);
}

const PdfPage& plx_pdf_document::require_page(int page_number) const
{
  if (!m_pdf)
  {
    throw source_unavailable_error("No PDF loaded", m_path);
  }
  std::string where = "page " + std::to_string(page_number) + " of " + m_path.to_std_const();
  try
  {
    auto& pages = m_pdf->GetPages();
    if (page_number < 0 || static_cast<unsigned>(page_number) >= pages.GetCount())
    {
      throw source_unavailable_error("Out of range: " + where, m_path);
    }
    return pages.GetPageAt(static_cast<unsigned>(page_number));
  }
  catch (const PdfError& e)
  {
    throw source_unavailable_error("Broken page tree at " + where + " (" + e.what() + ")", m_path);
  }
}

void plx_pdf_document::page_size(int page_number, double& width_pt, double& height_pt) const
{
  const PdfPage& page = require_page(page_number);
  try
  {
    Rect rect = page.GetRect();
    width_pt = rect.Width;
    height_pt = rect.Height;
  }
  catch (const PdfError& e)
  {
    throw source_unavailable_error("No page box on page " + std::to_string(page_number) +
                                   " of " + m_path.to_std_const() + " (" + e.what() + ")", m_path);
  }
}

std::vector<plx_pdf_word> plx_pdf_document::words(int page_number) const
{
  const PdfPage& page = require_page(page_number);

  PdfTextExtractParams params;
  params.Flags = PdfTextExtractFlags::TokenizeWords | PdfTextExtractFlags::ComputeBoundingBox;

  std::vector<PdfTextEntry> entries;
  try
  {
    page.ExtractTextTo(entries, params);
  }
  catch (const PdfError& e)
  {
    throw source_unavailable_error("Text extraction failed on page " + std::to_string(page_number) +
                                   " of " + m_path.to_std_const() + " (" + e.what() + ")", m_path);
  }

  std::vector<plx_pdf_word> result;
  result.reserve(entries.size());
  size_t without_box = 0;
  for (const auto& entry : entries)
  {
    if (!entry.BoundingBox.has_value())
    {
      ++without_box;
      continue;
    }
    const Rect& box = *entry.BoundingBox;
    plx_pdf_word word;
    word.text = plx_string(entry.Text);
    word.x = box.X;
    word.y = box.Y;
    word.width = box.Width;
    word.height = box.Height;
    result.push_back(word);
  }

  if (without_box > 0)
  {
    std::cerr << "Warning: " << without_box << " text entries without bounding box skipped on page "
              << page_number << " of " << m_path << std::endl;
  }
  return result;
}
