#include <catch2/catch_all.hpp>
#include "../documents/pdf/tbc_pdf_page_source.h"
#include "../utils/tbc_env.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

// One A4 page with Helvetica text (Tj and TJ), a red fill color, a stroked
// rule, a filled rectangle, a translated text object and a footer under a
// URI link annotation
static const char* FIXTURE_CONTENT =
    "q\n"
    "BT /F1 12 Tf 100 700 Td (Invoice) Tj ET\n"
    "1 0 0 rg\n"
    "BT /F1 12 Tf 1 0 0 1 100 632 Tm [(Dir) -20 (ector)] TJ ET\n"
    "BT /F1 12 Tf 300 700 Td [(Total) -300 (due)] TJ ET\n"
    "0 g\n"
    "170 632 m 260 632 l S\n"
    "0.9 g\n"
    "400 500 100 50 re f\n"
    "0 g\n"
    "q 1 0 0 1 0 -100 cm\n"
    "BT /F1 10 Tf 100 300 Td (Shifted) Tj ET\n"
    "Q\n"
    "BT /F1 9 Tf 100 40 Td (example.com) Tj ET\n"
    "Q\n";

static std::string build_fixture_pdf() {
    std::vector<std::string> objects = {
        "<< /Type /Catalog /Pages 2 0 R >>",
        "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 595 842] "
        "/Resources << /Font << /F1 4 0 R >> >> /Contents 5 0 R /Annots [6 0 R] >>",
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>",
        "<< /Length " + std::to_string(std::string(FIXTURE_CONTENT).size()) + " >>\nstream\n"
            + FIXTURE_CONTENT + "endstream",
        "<< /Type /Annot /Subtype /Link /Rect [95 35 175 55] /Border [0 0 0] "
        "/A << /S /URI /URI (https://example.com/) >> >>"
    };

    std::string pdf = "%PDF-1.4\n";
    std::vector<size_t> offsets;
    for (size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(pdf.size());
        pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }

    size_t xref_offset = pdf.size();
    pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n";
    pdf += "0000000000 65535 f \n";
    for (size_t offset : offsets) {
        char entry[21];
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
        pdf += entry;
    }
    pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R >>\n";
    pdf += "startxref\n" + std::to_string(xref_offset) + "\n%%EOF\n";
    return pdf;
}

static tbc_string write_fixture_pdf() {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "tbc_page_source_fixture.pdf";
    std::ofstream out(path, std::ios::binary);
    out << build_fixture_pdf();
    out.close();
    return tbc_string(path.string());
}

static const tbc_span* find_span(const tbc_page_feed& feed, const tbc_string& text) {
    for (const auto& span : feed.spans) {
        if (span.text == text) {
            return &span;
        }
    }
    return nullptr;
}

SCENARIO("tbc_pdf_page_source reports unreadable documents") {
    GIVEN("A path that does not exist") {
        THEN("Loading throws a document error naming the file") {
            REQUIRE_THROWS_AS(tbc_pdf_page_source("/nonexistent/tbc/missing.pdf"), tbc_document_error);
            try {
                tbc_pdf_page_source source("/nonexistent/tbc/missing.pdf");
                FAIL("Expected tbc_document_error");
            } catch (const tbc_document_error& e) {
                REQUIRE(e.get_filename() == tbc_string("/nonexistent/tbc/missing.pdf"));
            }
        }
    }
}

SCENARIO("tbc_pdf_page_source reads spans, drawings and links from a page") {
    GIVEN("A generated one page document") {
        tbc_string pdf_path = write_fixture_pdf();
        tbc_pdf_page_source source(pdf_path);

        REQUIRE(source.get_filename() == pdf_path);
        REQUIRE(source.page_count() == 1);

        WHEN("Reading the first page") {
            tbc_page_feed feed = source.read_page(0);

            THEN("The page size comes from the media box") {
                REQUIRE(feed.page_width == Catch::Approx(595.0));
                REQUIRE(feed.page_height == Catch::Approx(842.0));
            }

            THEN("Every text object becomes one span") {
                REQUIRE(feed.spans.size() == 5);
            }

            THEN("Span boxes use a top-left origin") {
                const tbc_span* invoice = find_span(feed, "Invoice");
                REQUIRE(invoice != nullptr);
                REQUIRE(invoice->bbox.left == Catch::Approx(100.0).margin(0.01));
                REQUIRE(invoice->bbox.bottom == Catch::Approx(142.0).margin(0.01));
                REQUIRE(invoice->bbox.top == Catch::Approx(130.0).margin(0.01));
                REQUIRE(invoice->bbox.right > invoice->bbox.left);
                REQUIRE(invoice->color == 0);
            }

            THEN("The cm translation moves the text it encloses") {
                const tbc_span* shifted = find_span(feed, "Shifted");
                REQUIRE(shifted != nullptr);
                REQUIRE(shifted->bbox.bottom == Catch::Approx(642.0).margin(0.01));
                REQUIRE(shifted->bbox.top == Catch::Approx(632.0).margin(0.01));
            }

            THEN("TJ arrays join their strings and large gaps read as spaces") {
                const tbc_span* director = find_span(feed, "Director");
                REQUIRE(director != nullptr);
                REQUIRE(find_span(feed, "Total due") != nullptr);
            }

            THEN("The fill color is encoded as 0xRRGGBB") {
                const tbc_span* director = find_span(feed, "Director");
                REQUIRE(director != nullptr);
                REQUIRE(director->color == 0xFF0000u);
            }

            THEN("Painted paths become drawings") {
                REQUIRE(feed.drawings.size() == 2);

                auto line = std::find_if(feed.drawings.begin(), feed.drawings.end(),
                                         [](const tbc_drawing& d) { return d.is_line(); });
                REQUIRE(line != feed.drawings.end());
                REQUIRE(line->x0 == Catch::Approx(170.0));
                REQUIRE(line->x1 == Catch::Approx(260.0));
                REQUIRE(line->y0 == Catch::Approx(210.0));
                REQUIRE(line->y1 == Catch::Approx(210.0));

                auto rect = std::find_if(feed.drawings.begin(), feed.drawings.end(),
                                         [](const tbc_drawing& d) { return d.is_rect(); });
                REQUIRE(rect != feed.drawings.end());
                REQUIRE(rect->x0 == Catch::Approx(400.0));
                REQUIRE(rect->x1 == Catch::Approx(500.0));
                REQUIRE(rect->y0 == Catch::Approx(292.0));
                REQUIRE(rect->y1 == Catch::Approx(342.0));
            }

            THEN("Link annotations carry their URI and a flipped box") {
                REQUIRE(feed.links.size() == 1);
                REQUIRE(feed.links[0].has_uri());
                REQUIRE(*feed.links[0].uri == tbc_string("https://example.com/"));
                REQUIRE(feed.links[0].bbox.left == Catch::Approx(95.0));
                REQUIRE(feed.links[0].bbox.top == Catch::Approx(787.0));
                REQUIRE(feed.links[0].bbox.right == Catch::Approx(175.0));
                REQUIRE(feed.links[0].bbox.bottom == Catch::Approx(807.0));
            }
        }

        WHEN("Reading past the last page") {
            THEN("A document error is thrown") {
                REQUIRE_THROWS_AS(source.read_page(1), tbc_document_error);
            }
        }

        WHEN("Clustering the page") {
            std::vector<tbc_layout_block> blocks = cluster_pdf_page(pdf_path, 0);

            THEN("The linked footer is dropped as a watermark") {
                for (const auto& block : blocks) {
                    REQUIRE_FALSE(block.text.contains("example.com"));
                }
            }

            THEN("The rule after the label gets an underscore placeholder") {
                auto placeholder = std::find_if(blocks.begin(), blocks.end(), [](const tbc_layout_block& block) {
                    return block.text.consists_of(U"_");
                });
                REQUIRE(placeholder != blocks.end());
                REQUIRE(placeholder->text == tbc_string("____________"));
                REQUIRE(placeholder->bbox.left == Catch::Approx(170.0));
                REQUIRE(placeholder->bbox.right == Catch::Approx(260.0));
            }

            THEN("Blocks come out sorted by top edge") {
                for (size_t i = 1; i < blocks.size(); ++i) {
                    REQUIRE(blocks[i - 1].bbox.top <= blocks[i].bbox.top);
                }
            }
        }
    }
}

SCENARIO("tbc_pdf_page_source reads a sample document") {
    // TBC_TEST_PDF points at an extra sample document; skipped when unset
    tbc_string pdf_path = env_value("TBC_TEST_PDF");
    if (pdf_path.empty()) {
        SKIP("TBC_TEST_PDF not set");
    }

    GIVEN("The sample document") {
        tbc_pdf_page_source source(pdf_path);

        THEN("The first page yields spans inside the page") {
            REQUIRE(source.page_count() > 0);
            tbc_page_feed feed = source.read_page(0);
            REQUIRE(feed.page_width > 0);
            REQUIRE_FALSE(feed.spans.empty());
            for (const auto& span : feed.spans) {
                REQUIRE_FALSE(span.text.empty());
                REQUIRE(span.bbox.top <= span.bbox.bottom);
            }
        }
    }
}
