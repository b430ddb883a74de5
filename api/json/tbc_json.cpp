#include "tbc_json.h"
#include "../../clustering/tbc_cluster_exceptions.h"

#include <nlohmann/json.hpp>
#include <iostream>

namespace {

  // Numbers of a JSON array; anything else gives an empty list
  std::vector<double> number_list(const nlohmann::json& j_val) {
    std::vector<double> values;
    if (!j_val.is_array()) {
      return values;
    }
    for (const auto& el : j_val) {
      if (!el.is_number()) {
        break;
      }
      values.push_back(el.get<double>());
    }
    return values;
  }

  tbc_string string_field(const nlohmann::json& obj, const char* key, const tbc_string& def = tbc_string()) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
      return def;
    }
    return tbc_string(it->get<std::string>());
  }

  double number_field(const nlohmann::json& obj, const char* key, double def) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
      return def;
    }
    return it->get<double>();
  }

  nlohmann::json bbox_to_json(const tbc_bounding_box& bbox) {
    return nlohmann::json::array({ bbox.left, bbox.top, bbox.right, bbox.bottom });
  }

  bool read_span(const nlohmann::json& j_span, tbc_span& span) {
    if (!j_span.is_object()) {
      return false;
    }

    tbc_string text = string_field(j_span, "text").trim();
    if (text.empty()) {
      return false;
    }

    tbc_font_style style = tbc_font_style::from_font_name(string_field(j_span, "font"),
                                                          number_field(j_span, "size", 0.0));
    auto bold_it = j_span.find("bold");
    if (bold_it != j_span.end() && bold_it->is_boolean()) {
      style.bold = bold_it->get<bool>();
    }
    auto italic_it = j_span.find("italic");
    if (italic_it != j_span.end() && italic_it->is_boolean()) {
      style.italic = italic_it->get<bool>();
    }

    uint32_t color = 0;
    auto color_it = j_span.find("color");
    if (color_it != j_span.end() && color_it->is_number_unsigned()) {
      color = color_it->get<uint32_t>();
    } else if (color_it != j_span.end() && color_it->is_string()) {
      // "#RRGGBB"
      tbc_string hex(color_it->get<std::string>());
      if (hex.starts_with("#")) {
        hex = hex.substr(1);
      }
      color = static_cast<uint32_t>(hex.to_int(0, 16));
    }

    auto bbox_it = j_span.find("bbox");
    tbc_bounding_box bbox = bbox_it != j_span.end() ? tbc_bounding_box::from_values(number_list(*bbox_it))
                                                    : tbc_bounding_box();
    span = tbc_span(text, bbox, style, color);
    return true;
  }

  bool read_drawing(const nlohmann::json& j_drawing, tbc_drawing& drawing) {
    if (!j_drawing.is_object()) {
      return false;
    }

    tbc_string type = string_field(j_drawing, "type");
    if (type == "line") {
      std::vector<double> p0 = number_list(j_drawing.value("p0", nlohmann::json()));
      std::vector<double> p1 = number_list(j_drawing.value("p1", nlohmann::json()));
      if (p0.size() < 2 || p1.size() < 2) {
        return false;
      }
      drawing = tbc_drawing::line(p0[0], p0[1], p1[0], p1[1]);
      return true;
    }
    if (type == "rect") {
      std::vector<double> r = number_list(j_drawing.value("rect", nlohmann::json()));
      if (r.size() < 4) {
        return false;
      }
      drawing = tbc_drawing::rect(r[0], r[1], r[2], r[3]);
      return true;
    }
    return false;
  }

  tbc_hyperlink read_link(const nlohmann::json& j_link) {
    tbc_hyperlink link;
    if (!j_link.is_object()) {
      return link;
    }
    auto uri_it = j_link.find("uri");
    if (uri_it != j_link.end() && uri_it->is_string()) {
      link.uri = tbc_string(uri_it->get<std::string>());
    }
    auto bbox_it = j_link.find("bbox");
    if (bbox_it != j_link.end()) {
      link.bbox = tbc_bounding_box::from_values(number_list(*bbox_it));
    }
    return link;
  }

  const nlohmann::json& array_field(const nlohmann::json& obj, const char* key) {
    static const nlohmann::json empty_array = nlohmann::json::array();
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) {
      return empty_array;
    }
    return *it;
  }

} // namespace

tbc_page_feed tbc_json::read_page_feed(const tbc_string& json_string) {
  nlohmann::json parsed_json;
  try {
    parsed_json = nlohmann::json::parse(json_string.to_std_const());
  } catch (const nlohmann::json::parse_error& e) {
    std::cerr << "[JSON] Parse error: " << e.what() << " at byte " << e.byte << std::endl;
    throw tbc_feed_error(tbc_string("Invalid page feed JSON: ") + e.what());
  }

  if (!parsed_json.is_object()) {
    throw tbc_feed_error("Page feed JSON does not represent an object at the top level");
  }

  tbc_page_feed feed;
  feed.page_width = number_field(parsed_json, "page_width", 0.0);
  feed.page_height = number_field(parsed_json, "page_height", 0.0);

  size_t skipped = 0;
  for (const auto& j_span : array_field(parsed_json, "spans")) {
    tbc_span span;
    if (read_span(j_span, span)) {
      feed.spans.push_back(span);
    } else {
      skipped++;
    }
  }

  for (const auto& j_drawing : array_field(parsed_json, "drawings")) {
    tbc_drawing drawing;
    if (read_drawing(j_drawing, drawing)) {
      feed.drawings.push_back(drawing);
    } else {
      skipped++;
    }
  }

  for (const auto& j_link : array_field(parsed_json, "links")) {
    feed.links.push_back(read_link(j_link));
  }

  if (skipped > 0) {
    std::cerr << "[JSON] Skipped " << skipped << " unusable span or drawing entries" << std::endl;
  }
  return feed;
}

tbc_string tbc_json::write_blocks(const std::vector<tbc_layout_block>& blocks, int indent) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& block : blocks) {
    nlohmann::json j_block = nlohmann::json::object();
    j_block["bbox"] = bbox_to_json(block.bbox);
    j_block["text"] = block.text.to_std_const();
    j_block["font"] = {
      { "name", block.style.font.to_std_const() },
      { "size", block.style.size },
      { "bold", block.style.bold },
      { "italic", block.style.italic }
    };

    nlohmann::json j_spans = nlohmann::json::array();
    for (const auto& span : block.items) {
      j_spans.push_back({ { "text", span.text.to_std_const() }, { "bbox", bbox_to_json(span.bbox) } });
    }
    j_block["spans"] = j_spans;
    arr.push_back(j_block);
  }

  // Invalid UTF-8 from broken fonts is replaced instead of throwing
  return tbc_string(arr.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace));
}

tbc_string tbc_json::write_watermarks(const std::vector<tbc_watermark_candidate>& candidates, int indent) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& candidate : candidates) {
    nlohmann::json signals = nlohmann::json::array();
    for (const auto& tag : candidate.signals) {
      signals.push_back(tag.to_std_const());
    }
    arr.push_back({
      { "bbox", bbox_to_json(candidate.bbox) },
      { "text", candidate.text.to_std_const() },
      { "signals", signals },
      { "score", candidate.score }
    });
  }
  return tbc_string(arr.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace));
}
