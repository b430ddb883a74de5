#include "documents/pdf/tbc_pdf_page_source.h"
#include "documents/tbc_blocks_to_markdown.h"
#include "documents/tbc_block_overlay.h"
#include "api/json/tbc_json.h"
#include "clustering/tbc_text_clustering.h"
#include "utils/tbc_env.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {

  enum class output_format { json, markdown };

  struct cli_options {
    tbc_string input;
    size_t page = 0;
    output_format format = output_format::json;
    tbc_string overlay_path;
    bool watermarks = false;
  };

  void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <input.pdf|input.json> [page] [--markdown|--json] [--overlay out.png] [--watermarks]" << std::endl;
    std::cerr << "Groups the text spans of one page into blocks. Page is zero based." << std::endl;
  }

  bool parse_args(int argc, char* argv[], cli_options& options) {
    bool have_page = false;
    for (int i = 1; i < argc; i++) {
      tbc_string arg(argv[i]);
      if (arg == "--markdown") {
        options.format = output_format::markdown;
      } else if (arg == "--json") {
        options.format = output_format::json;
      } else if (arg == "--watermarks") {
        options.watermarks = true;
      } else if (arg == "--overlay") {
        if (i + 1 >= argc) {
          std::cerr << "Error: --overlay needs an output path" << std::endl;
          return false;
        }
        options.overlay_path = argv[++i];
      } else if (arg.starts_with("--")) {
        std::cerr << "Error: Unknown option " << arg.c_str() << std::endl;
        return false;
      } else if (options.input.empty()) {
        options.input = arg;
      } else if (!have_page) {
        long page = arg.to_int(-1);
        if (page < 0) {
          std::cerr << "Error: Invalid page number " << arg.c_str() << std::endl;
          return false;
        }
        options.page = static_cast<size_t>(page);
        have_page = true;
      } else {
        std::cerr << "Error: Unexpected argument " << arg.c_str() << std::endl;
        return false;
      }
    }
    return !options.input.empty();
  }

  tbc_page_feed load_feed(const cli_options& options) {
    if (options.input.lower_utf8().ends_with(".json")) {
      std::ifstream json_file(options.input.to_std_const(), std::ios::binary);
      if (!json_file) {
        throw tbc_document_error("Cannot open JSON feed", options.input);
      }
      std::stringstream buffer;
      buffer << json_file.rdbuf();
      return tbc_json::read_page_feed(tbc_string(buffer.str()));
    }

    tbc_pdf_page_source source(options.input);
    return source.read_page(options.page);
  }

  void write_overlay(const tbc_string& path, const tbc_page_feed& feed,
                     const std::vector<tbc_layout_block>& blocks, const tbc_cluster_config& config) {
    double width = feed.page_width;
    double height = feed.page_height;
    // JSON feeds may come without a page size
    for (const auto& block : blocks) {
      width = std::max(width, block.bbox.right + 10.0);
      height = std::max(height, block.bbox.bottom + 10.0);
    }

    tbc_block_overlay overlay(width, height, env_value("TBC_OVERLAY_DPI", "144").to_double(144.0));
    overlay.draw_blocks(blocks);
    tbc_underline_injector injector(config.underline);
    overlay.draw_lines(injector.collect_horizontal_lines(feed.drawings));
    if (overlay.write(path)) {
      std::cerr << "[CLI] Overlay saved: " << path.c_str() << std::endl;
    }
  }

} // namespace

int main(int argc, char* argv[])
{
  cli_options options;
  if (!parse_args(argc, argv, options)) {
    print_usage(argv[0]);
    return 1;
  }

  load_env_file(".env");
  tbc_cluster_config config = tbc_cluster_config::from_env();

  try {
    tbc_page_feed feed = load_feed(options);
    tbc_text_clustering clustering(config);

    if (options.watermarks) {
      std::cout << tbc_json::write_watermarks(clustering.detect_watermarks(feed)).c_str() << std::endl;
      return 0;
    }

    std::vector<tbc_layout_block> blocks = clustering.cluster(feed);
    std::cerr << "[CLI] " << blocks.size() << " blocks on page " << options.page << std::endl;

    if (options.format == output_format::markdown) {
      std::cout << tbc_blocks_to_markdown::report(options.input, options.page, blocks).c_str();
    } else {
      std::cout << tbc_json::write_blocks(blocks).c_str() << std::endl;
    }

    if (!options.overlay_path.empty()) {
      write_overlay(options.overlay_path, feed, blocks, config);
    }
  } catch (const tbc_empty_page_error& e) {
    std::cerr << "[CLI] " << e.what() << std::endl;
    return 2;
  } catch (const tbc_document_error& e) {
    std::cerr << "[CLI] " << e.what() << " (" << e.get_filename().c_str() << ")" << std::endl;
    return 1;
  } catch (const tbc_exception& e) {
    std::cerr << "[CLI] " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[CLI] Unexpected error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
