#include "tbc_watermark_detector.h"
#include "tbc_cluster_exceptions.h"
#include "../utils/tbc_unicode.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace {

  // ECMAScript \b only knows ASCII word characters. Non-ASCII letters become
  // '_' (a word character no domain label contains) so a domain glued to
  // Cyrillic or accented text does not start at a false word boundary.
  std::string mask_word_chars(const tbc_string& text) {
    std::string masked;
    masked.reserve(text.size());
    for (char32_t cp : text.code_points()) {
      if (cp < 0x80) {
        masked += static_cast<char>(cp);
      } else {
        masked += tbc_unicode::is_alpha(cp) ? '_' : ' ';
      }
    }
    return masked;
  }

} // namespace

bool tbc_watermark_candidate::has_signal(const tbc_string& tag) const {
  return std::find(signals.begin(), signals.end(), tag) != signals.end();
}

tbc_watermark_filter::tbc_watermark_filter(std::vector<tbc_bounding_box> regions_val, double pad_val)
  : regions(std::move(regions_val)), pad(pad_val)
{
}

bool tbc_watermark_filter::is_watermark(const tbc_bounding_box& bbox) const {
  for (const auto& region : regions) {
    if (bbox.intersects(region, pad)) {
      return true;
    }
  }
  return false;
}

tbc_watermark_detector::tbc_watermark_detector(const tbc_watermark_params& params_val, bool verbose_val)
  : params(params_val), verbose(verbose_val)
{
  try {
    domain_re = std::regex(params.domain_pattern.to_std_const(), std::regex::ECMAScript | std::regex::icase);
    email_re = std::regex(params.email_pattern.to_std_const(), std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    throw tbc_exception(tbc_string("Invalid watermark pattern: ") + e.what());
  }
}

bool tbc_watermark_detector::has_url(const tbc_string& text) const {
  return std::regex_search(mask_word_chars(text), domain_re);
}

bool tbc_watermark_detector::has_email(const tbc_string& text) const {
  return std::regex_search(text.to_std_const(), email_re);
}

std::vector<tbc_watermark_candidate> tbc_watermark_detector::find_candidates(
    const std::vector<tbc_span>& spans, const std::vector<tbc_hyperlink>& links) const {
  return find_candidates(spans, links, params.detector_use_color_hint);
}

std::vector<tbc_watermark_candidate> tbc_watermark_detector::find_candidates(
    const std::vector<tbc_span>& spans, const std::vector<tbc_hyperlink>& links,
    bool use_color_hint) const {
  std::vector<tbc_bounding_box> link_rects;
  for (const auto& link : links) {
    if (params.external_links_only && !link.has_uri()) {
      continue;
    }
    link_rects.push_back(link.bbox);
  }

  std::vector<tbc_watermark_candidate> candidates;
  for (const auto& span : spans) {
    tbc_string text = span.text.trim();
    if (text.empty()) {
      continue;
    }

    bool url = has_url(text);
    bool email = has_email(text);
    bool link_hit = std::any_of(link_rects.begin(), link_rects.end(),
                                [&span](const tbc_bounding_box& rect) { return span.bbox.intersects(rect); });
    bool near_white = use_color_hint && span.color >= params.near_white_threshold;

    int strong = int(url) + int(email) + int(link_hit);
    int weak = int(near_white);

    // A light color alone is not enough
    if (strong == 0) {
      continue;
    }

    tbc_watermark_candidate candidate;
    candidate.bbox = span.bbox;
    candidate.text = text;
    if (url) candidate.signals.push_back(TBC_SIGNAL_URL_TEXT);
    if (email) candidate.signals.push_back(TBC_SIGNAL_EMAIL_TEXT);
    if (link_hit) candidate.signals.push_back(TBC_SIGNAL_LINK_HIT);
    if (near_white) candidate.signals.push_back(TBC_SIGNAL_NEAR_WHITE);
    candidate.score = strong * params.strong_weight + weak;
    candidates.push_back(candidate);
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const tbc_watermark_candidate& a, const tbc_watermark_candidate& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.bbox.top != b.bbox.top) return a.bbox.top < b.bbox.top;
    return a.bbox.left < b.bbox.left;
  });

  if (verbose) {
    std::cout << "[WATERMARK] " << candidates.size() << " candidate(s) among "
              << spans.size() << " span(s)" << std::endl;
    for (const auto& candidate : candidates) {
      std::cout << "[WATERMARK]   score=" << candidate.score << " \"" << candidate.text.c_str() << "\"" << std::endl;
    }
  }

  return candidates;
}

tbc_watermark_filter tbc_watermark_detector::make_filter(const std::vector<tbc_span>& spans,
                                                         const std::vector<tbc_hyperlink>& links) const {
  std::vector<tbc_watermark_candidate> candidates = find_candidates(spans, links, params.filter_use_color_hint);

  std::vector<tbc_bounding_box> regions;
  regions.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    regions.push_back(candidate.bbox);
  }
  return tbc_watermark_filter(std::move(regions), params.pad);
}
