#include "tbc_cluster_config.h"
#include "../utils/tbc_env.h"

std::vector<tbc_string> tbc_label_terms_ru() {
  return {
    "руководитель",
    "директор",
    "проректор",
    "заведующий",
    "начальник",
  };
}

std::vector<tbc_string> tbc_label_terms_en() {
  return {
    "director",
    "manager",
    "leader",
    "head of",
    "acting",
    "deputy",
    "chief",
  };
}

tbc_underline_params::tbc_underline_params() {
  label_terms = tbc_label_terms_ru();
  for (const tbc_string& term : tbc_label_terms_en()) {
    label_terms.push_back(term);
  }
}

namespace {

  void read_double(const char* key, double& target) {
    if (env_is_set(key)) {
      target = env_value(key).trim().to_double(target);
    }
  }

  void read_size(const char* key, size_t& target) {
    if (env_is_set(key)) {
      long value = env_value(key).trim().to_int(static_cast<long>(target));
      if (value >= 0) {
        target = static_cast<size_t>(value);
      }
    }
  }

  void read_bool(const char* key, bool& target) {
    if (!env_is_set(key)) {
      return;
    }
    tbc_string value = env_value(key).trim().lower_utf8();
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
      target = true;
    } else if (value == "0" || value == "false" || value == "no" || value == "off") {
      target = false;
    }
  }

} // namespace

tbc_cluster_config tbc_cluster_config::from_env() {
  tbc_cluster_config config;

  read_double("TBC_DISTANCE_THRESHOLD", config.graph.distance_threshold);
  read_double("TBC_VERTICAL_TOLERANCE", config.graph.vertical_tolerance);
  read_double("TBC_OVERLAP_THRESHOLD", config.graph.overlap_threshold);
  read_size("TBC_SHORT_SPAN_LIMIT", config.graph.short_span_limit);

  if (env_is_set("TBC_NEAR_WHITE_THRESHOLD")) {
    long value = env_value("TBC_NEAR_WHITE_THRESHOLD").trim().to_int(-1, 0);
    if (value >= 0) {
      config.watermark.near_white_threshold = static_cast<uint32_t>(value);
    }
  }
  read_double("TBC_WATERMARK_PAD", config.watermark.pad);
  read_bool("TBC_EXTERNAL_LINKS_ONLY", config.watermark.external_links_only);

  read_double("TBC_DRAWING_Y_TOLERANCE", config.underline.drawing_y_tolerance);
  read_double("TBC_DRAWING_MIN_LENGTH", config.underline.drawing_min_length);
  read_double("TBC_UNDERLINE_PIXELS_PER_CHAR", config.underline.pixels_per_char);
  read_size("TBC_UNDERLINE_MIN_CHARS", config.underline.min_chars);
  read_double("TBC_SIGN_Y_TOLERANCE", config.underline.same_line_y_tolerance);
  read_double("TBC_SIGN_MIN_GAP", config.underline.right_min_gap);

  if (env_is_set("TBC_LABEL_TERMS")) {
    std::vector<tbc_string> terms;
    for (const tbc_string& term : env_value("TBC_LABEL_TERMS").split(",")) {
      tbc_string trimmed = term.trim();
      if (!trimmed.empty()) {
        terms.push_back(trimmed);
      }
    }
    config.underline.label_terms = terms;
  }

  read_bool("TBC_VERBOSE", config.verbose);
  return config;
}
