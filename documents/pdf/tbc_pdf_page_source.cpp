/**
 * Page feed extraction on top of the PoDoFo content stream reader.
 * Text state handling follows PoDoFo's PdfPage_TextExtraction.cpp
 * SPDX-FileCopyrightText: (C) 2021 Francesco Pretto <ceztko@gmail.com>
 * SPDX-License-Identifier: LGPL-2.0-or-later
 * SPDX-License-Identifier: MPL-2.0
 */

#include "tbc_pdf_page_source.h"
#include "../../clustering/tbc_cluster_exceptions.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <unordered_map>

#include <main/PdfMemDocument.h>
#include <main/PdfPage.h>
#include <main/PdfTextState.h>
#include <main/PdfMath.h>
#include <main/PdfContentStreamReader.h>
#include <main/PdfFont.h>
#include <main/PdfVariant.h>
#include <main/PdfArray.h>
#include <main/PdfString.h>
#include <main/PdfName.h>
#include <main/PdfDictionary.h>
#include <main/PdfAnnotation.h>
#include <auxiliary/StateStack.h>

using namespace std;
using namespace PoDoFo;

// TJ displacement (in thousandths of an em) that reads as a word gap
constexpr double WORD_GAP_THOUSANDTHS = 250.0;

namespace {

  // 5.2 Text State Parameters and Operators, 4.3 Graphics State
  struct page_state
  {
    Matrix CTM;
    Matrix T_m;
    Matrix T_lm;
    double T_l = 0;
    PdfTextState PdfState;
    uint32_t fill_color = 0;

    page_state()
    {
      PdfState.FontSize = -1;
    }

    Matrix T_rm() const { return T_m * CTM; }
  };

  struct path_point
  {
    double x;
    double y;
  };

  class feed_context
  {
  public:
    feed_context(const PdfPage& page, tbc_page_feed& feed);

    void BT_Operator();
    void Tf_Operator(const PdfName& fontname, double fontsize);
    void cm_Operator(double a, double b, double c, double d, double e, double f);
    void Tm_Operator(double a, double b, double c, double d, double e, double f);
    void TdTD_Operator(double tx, double ty);
    void TStar_Operator();
    void advance(double tx);
    void q_Operator();
    void Q_Operator();

    // Decodes with the active font, returns the advance in text space
    double scan(const PdfString& str, string& decoded);
    void emit_span(const string& text, double advance, const page_state& start_state);

    void m_Operator(double x, double y);
    void l_Operator(double x, double y);
    void re_Operator(double x, double y, double width, double height);
    void paint_path();
    void discard_path();

    StateStack<page_state> States;

  private:
    Vector2 to_page(double x, double y) const;

    const PdfPage& m_page;
    tbc_page_feed& m_feed;
    double m_originX;
    double m_originY;
    double m_pageHeight;
    unsigned m_depth = 0;
    unordered_map<string, const PdfFont*> m_fonts;
    vector<tbc_drawing> m_pendingPath;
    bool m_hasCurrentPoint = false;
    path_point m_currentPoint = { 0, 0 };
  };

  feed_context::feed_context(const PdfPage& page, tbc_page_feed& feed)
    : m_page(page),
      m_feed(feed),
      m_originX(page.GetRect().X),
      m_originY(page.GetRect().Y),
      m_pageHeight(page.GetRect().Height)
  {
    States.Push();
    m_feed.page_width = page.GetRect().Width;
    m_feed.page_height = m_pageHeight;
  }

  void feed_context::BT_Operator()
  {
    States.Current->T_m = Matrix();
    States.Current->T_lm = Matrix();
  }

  void feed_context::Tf_Operator(const PdfName& fontname, double fontsize)
  {
    States.Current->PdfState.FontSize = fontsize;

    const string font_key(fontname.GetString());
    auto cached_font = m_fonts.find(font_key);
    if (cached_font != m_fonts.end()) {
      States.Current->PdfState.Font = cached_font->second;
      return;
    }

    const PdfFont* font = nullptr;
    try {
      const auto& resources = m_page.GetResources();
      font = resources.GetFont(fontname);
    } catch (const std::exception& e) {
      std::cerr << "[PDF FEED] Font " << font_key << " not available: " << e.what() << std::endl;
    }
    States.Current->PdfState.Font = font;
    m_fonts[font_key] = font;
  }

  void feed_context::cm_Operator(double a, double b, double c, double d, double e, double f)
  {
    Matrix transform(a, b, c, d, e, f);
    States.Current->CTM = transform * States.Current->CTM;
  }

  void feed_context::Tm_Operator(double a, double b, double c, double d, double e, double f)
  {
    States.Current->T_m = Matrix(a, b, c, d, e, f);
    States.Current->T_lm = States.Current->T_m;
  }

  void feed_context::TdTD_Operator(double tx, double ty)
  {
    Matrix transform = Matrix::CreateTranslation(Vector2(tx, ty));
    States.Current->T_lm = transform * States.Current->T_lm;
    States.Current->T_m = States.Current->T_lm;
  }

  void feed_context::TStar_Operator()
  {
    TdTD_Operator(0, -States.Current->T_l);
  }

  void feed_context::advance(double tx)
  {
    Matrix transform = Matrix::CreateTranslation(Vector2(tx, 0));
    States.Current->T_m = transform * States.Current->T_m;
  }

  void feed_context::q_Operator()
  {
    States.Push();
    m_depth++;
  }

  void feed_context::Q_Operator()
  {
    // Unbalanced Q in broken streams must not pop the page state
    if (m_depth == 0) {
      return;
    }
    States.Pop();
    m_depth--;
  }

  double feed_context::scan(const PdfString& str, string& decoded)
  {
    decoded.clear();
    const PdfFont* font = States.Current->PdfState.Font;
    if (font == nullptr) {
      decoded = string(str.GetString());
      return 0.0;
    }

    vector<double> lengths;
    vector<unsigned> positions;
    font->TryScanEncodedString(str, States.Current->PdfState, decoded, lengths, positions);

    double total = 0.0;
    for (double len : lengths) {
      total += len;
    }
    return total;
  }

  Vector2 feed_context::to_page(double x, double y) const
  {
    Vector2 p = Vector2(x, y) * States.Current->CTM;
    return Vector2(p.X - m_originX, (m_originY + m_pageHeight) - p.Y);
  }

  void feed_context::emit_span(const string& text, double advance, const page_state& start_state)
  {
    tbc_string trimmed = tbc_string(text).trim();
    if (trimmed.empty()) {
      return;
    }

    double font_size = start_state.PdfState.FontSize > 0 ? start_state.PdfState.FontSize : 12.0;
    Matrix T_rm = start_state.T_rm();
    Vector2 origin = Vector2(0, 0) * T_rm;
    Vector2 run_end = Vector2(advance, 0) * T_rm;
    Vector2 ascent = Vector2(0, font_size) * T_rm;

    double x0 = std::min(origin.X, run_end.X) - m_originX;
    double x1 = std::max(origin.X, run_end.X) - m_originX;
    if (advance <= 0) {
      x1 = x0 + trimmed.length_utf8() * font_size * 0.6;
    }
    double baseline = (m_originY + m_pageHeight) - origin.Y;
    double height = std::hypot(ascent.X - origin.X, ascent.Y - origin.Y);
    if (height <= 0) {
      height = font_size;
    }

    tbc_string font_name = "Arial";
    const PdfFont* font = start_state.PdfState.Font;
    if (font != nullptr) {
      try {
        string name(font->GetName());
        size_t plus_pos = name.find('+');
        if (plus_pos != string::npos) {
          name = name.substr(plus_pos + 1);
        }
        font_name = name;
      } catch (const std::exception& e) {
        std::cerr << "[PDF FEED] Failed to read font name: " << e.what() << std::endl;
      }
    }

    tbc_bounding_box bbox(baseline - height, x0, baseline, x1);
    m_feed.spans.emplace_back(trimmed, bbox, tbc_font_style::from_font_name(font_name, height),
                              start_state.fill_color);
  }

  void feed_context::m_Operator(double x, double y)
  {
    m_currentPoint = { x, y };
    m_hasCurrentPoint = true;
  }

  void feed_context::l_Operator(double x, double y)
  {
    if (m_hasCurrentPoint) {
      Vector2 p0 = to_page(m_currentPoint.x, m_currentPoint.y);
      Vector2 p1 = to_page(x, y);
      m_pendingPath.push_back(tbc_drawing::line(p0.X, p0.Y, p1.X, p1.Y));
    }
    m_currentPoint = { x, y };
    m_hasCurrentPoint = true;
  }

  void feed_context::re_Operator(double x, double y, double width, double height)
  {
    Vector2 corners[] = {
      to_page(x, y), to_page(x + width, y), to_page(x, y + height), to_page(x + width, y + height)
    };

    double x0 = corners[0].X, x1 = corners[0].X;
    double y0 = corners[0].Y, y1 = corners[0].Y;
    for (const auto& c : corners) {
      x0 = std::min(x0, c.X);
      x1 = std::max(x1, c.X);
      y0 = std::min(y0, c.Y);
      y1 = std::max(y1, c.Y);
    }
    m_pendingPath.push_back(tbc_drawing::rect(x0, y0, x1, y1));
    m_currentPoint = { x, y };
    m_hasCurrentPoint = true;
  }

  void feed_context::paint_path()
  {
    m_feed.drawings.insert(m_feed.drawings.end(), m_pendingPath.begin(), m_pendingPath.end());
    discard_path();
  }

  void feed_context::discard_path()
  {
    m_pendingPath.clear();
    m_hasCurrentPoint = false;
  }

  uint32_t encode_rgb(double r, double g, double b)
  {
    auto channel = [](double v) {
      return static_cast<uint32_t>(std::lround(std::clamp(v, 0.0, 1.0) * 255.0));
    };
    return (channel(r) << 16) | (channel(g) << 8) | channel(b);
  }

  void read(const PdfVariantStack& stack, double &tx, double &ty)
  {
    tx = stack[1].GetReal();
    ty = stack[0].GetReal();
  }

  void read(const PdfVariantStack& stack, double &a, double &b, double &c, double &d)
  {
    a = stack[3].GetReal();
    b = stack[2].GetReal();
    c = stack[1].GetReal();
    d = stack[0].GetReal();
  }

  void read(const PdfVariantStack& stack, double &a, double &b, double &c, double &d, double &e, double &f)
  {
    a = stack[5].GetReal();
    b = stack[4].GetReal();
    c = stack[3].GetReal();
    d = stack[2].GetReal();
    e = stack[1].GetReal();
    f = stack[0].GetReal();
  }

} // namespace

tbc_pdf_page_source::tbc_pdf_page_source(const tbc_string& filename)
  : m_pdf(std::make_unique<PdfMemDocument>()), m_filename(filename)
{
  try {
    m_pdf->Load(filename.to_std_const());
  } catch (const std::exception& e) {
    std::cerr << "[PDF FEED] Loading " << filename.c_str() << " failed: " << e.what() << std::endl;
    throw tbc_document_error(tbc_string("Cannot load PDF: ") + e.what(), filename);
  }

  if (m_pdf->GetPages().GetCount() == 0) {
    throw tbc_document_error("PDF has no pages", filename);
  }
  std::cerr << "[PDF FEED] Loaded " << filename.c_str() << " with " << page_count() << " pages" << std::endl;
}

tbc_pdf_page_source::~tbc_pdf_page_source() = default;

size_t tbc_pdf_page_source::page_count() const
{
  return m_pdf->GetPages().GetCount();
}

tbc_page_feed tbc_pdf_page_source::read_page(size_t page_index) const
{
  if (page_index >= page_count()) {
    throw tbc_document_error("Page index " + std::to_string(page_index) + " out of range (document has "
                             + std::to_string(page_count()) + " pages)", m_filename);
  }

  tbc_page_feed feed;
  try {
    PdfPage& page = m_pdf->GetPages().GetPageAt(static_cast<unsigned>(page_index));
    extract_spans_and_drawings(page, feed);
    extract_links(page, feed);
  } catch (const tbc_exception&) {
    throw;
  } catch (const std::exception& e) {
    throw tbc_document_error(tbc_string("Cannot read page content: ") + e.what(), m_filename);
  }

  std::cerr << "[PDF FEED] Page " << page_index << ": " << feed.spans.size() << " spans, "
            << feed.drawings.size() << " drawings, " << feed.links.size() << " links" << std::endl;
  return feed;
}

void tbc_pdf_page_source::extract_spans_and_drawings(const PdfPage& page, tbc_page_feed& feed)
{
  feed_context context(page, feed);

  PdfContentReaderArgs args;
  args.Flags = PdfContentReaderFlags::None;

  PdfContentStreamReader reader(page, args);
  PdfContent content;
  string decoded;

  while (reader.TryReadNext(content))
  {
    if (content.Type != PdfContentType::Operator)
      continue;

    if (content.Warnings != PdfContentWarnings::None)
    {
      // Ignore invalid operators
      continue;
    }

    switch (content.Operator)
    {
      case PdfOperator::TL:
      {
        context.States.Current->T_l = content.Stack[0].GetReal();
        break;
      }
      case PdfOperator::cm:
      {
        double a, b, c, d, e, f;
        read(content.Stack, a, b, c, d, e, f);
        context.cm_Operator(a, b, c, d, e, f);
        break;
      }
      case PdfOperator::Td:
      case PdfOperator::TD:
      {
        double tx, ty;
        read(content.Stack, tx, ty);
        context.TdTD_Operator(tx, ty);
        if (content.Operator == PdfOperator::TD)
          context.States.Current->T_l = -ty;
        break;
      }
      case PdfOperator::Tm:
      {
        double a, b, c, d, e, f;
        read(content.Stack, a, b, c, d, e, f);
        context.Tm_Operator(a, b, c, d, e, f);
        break;
      }
      case PdfOperator::T_Star:
      {
        context.TStar_Operator();
        break;
      }
      case PdfOperator::Tf:
      {
        double fontSize = content.Stack[0].GetReal();
        const PdfName& fontName = content.Stack[1].GetName();
        context.Tf_Operator(fontName, fontSize);
        break;
      }
      case PdfOperator::Tj:
      case PdfOperator::Quote:
      case PdfOperator::DoubleQuote:
      {
        if (content.Operator == PdfOperator::Quote)
        {
          context.TStar_Operator();
        }
        else if (content.Operator == PdfOperator::DoubleQuote)
        {
          context.States.Current->PdfState.CharSpacing = content.Stack[0].GetReal();
          context.States.Current->PdfState.WordSpacing = content.Stack[1].GetReal();
          context.TStar_Operator();
        }

        page_state start_state = *context.States.Current;
        const PdfString& str = content.Stack[content.Stack.size() - 1].GetString();
        double advance = context.scan(str, decoded);
        context.emit_span(decoded, advance, start_state);
        context.advance(advance);
        break;
      }
      case PdfOperator::TJ:
      {
        // One span per TJ array, large negative kerning reads as a space
        page_state start_state = *context.States.Current;
        string text;
        double run_advance = 0.0;
        const PdfArray& arr = content.Stack[0].GetArray();
        for (unsigned i = 0; i < arr.size(); i++)
        {
          const PdfVariant& variant = arr[i];
          if (variant.IsString())
          {
            double advance = context.scan(variant.GetString(), decoded);
            text += decoded;
            run_advance += advance;
            context.advance(advance);
          }
          else if (variant.IsNumber())
          {
            double value = variant.GetReal();
            const PdfTextState& state = context.States.Current->PdfState;
            double t_j = -value / 1000.0 * state.FontSize * state.FontScale;
            if (-value >= WORD_GAP_THOUSANDTHS && !text.empty() && text.back() != ' ')
            {
              text += ' ';
            }
            run_advance += t_j;
            context.advance(t_j);
          }
        }
        context.emit_span(text, run_advance, start_state);
        break;
      }
      case PdfOperator::g:
      {
        double gray = content.Stack[0].GetReal();
        context.States.Current->fill_color = encode_rgb(gray, gray, gray);
        break;
      }
      case PdfOperator::rg:
      {
        double r = content.Stack[2].GetReal();
        double g = content.Stack[1].GetReal();
        double b = content.Stack[0].GetReal();
        context.States.Current->fill_color = encode_rgb(r, g, b);
        break;
      }
      case PdfOperator::m:
      {
        double x, y;
        read(content.Stack, x, y);
        context.m_Operator(x, y);
        break;
      }
      case PdfOperator::l:
      {
        double x, y;
        read(content.Stack, x, y);
        context.l_Operator(x, y);
        break;
      }
      case PdfOperator::re:
      {
        double x, y, width, height;
        read(content.Stack, x, y, width, height);
        context.re_Operator(x, y, width, height);
        break;
      }
      case PdfOperator::S:
      case PdfOperator::s:
      case PdfOperator::f:
      case PdfOperator::F:
      case PdfOperator::f_Star:
      case PdfOperator::B:
      case PdfOperator::B_Star:
      case PdfOperator::b:
      case PdfOperator::b_Star:
      {
        context.paint_path();
        break;
      }
      case PdfOperator::n:
      {
        context.discard_path();
        break;
      }
      case PdfOperator::q:
      {
        context.q_Operator();
        break;
      }
      case PdfOperator::Q:
      {
        context.Q_Operator();
        break;
      }
      case PdfOperator::BT:
      {
        context.BT_Operator();
        break;
      }
      default:
        break;
    }
  }
}

void tbc_pdf_page_source::extract_links(PdfPage& page, tbc_page_feed& feed)
{
  const Rect page_rect = page.GetRect();
  auto& annotations = page.GetAnnotations();

  for (unsigned i = 0; i < annotations.GetCount(); i++)
  {
    PdfAnnotation& annot = annotations.GetAnnotAt(i);
    if (annot.GetType() != PdfAnnotationType::Link)
      continue;

    tbc_hyperlink link;
    Rect r = annot.GetRect();
    double top = (page_rect.Y + page_rect.Height) - (r.Y + r.Height);
    double left = r.X - page_rect.X;
    link.bbox = tbc_bounding_box(top, left, top + r.Height, left + r.Width);

    const PdfObject* action = annot.GetDictionary().FindKey("A");
    if (action != nullptr && action->IsDictionary())
    {
      const PdfObject* uri = action->GetDictionary().FindKey("URI");
      if (uri != nullptr && uri->IsString())
      {
        link.uri = tbc_string(std::string(uri->GetString().GetString()));
      }
    }

    feed.links.push_back(link);
  }
}

std::vector<tbc_layout_block> cluster_pdf_page(const tbc_string& filename, size_t page_index,
                                               const tbc_cluster_config& config)
{
  tbc_pdf_page_source source(filename);
  tbc_text_clustering clustering(config);
  return clustering.cluster(source.read_page(page_index));
}
