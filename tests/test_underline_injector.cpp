#include <catch2/catch_all.hpp>
#include "../clustering/tbc_underline_injector.h"

static tbc_layout_block make_block(const tbc_string& text, double left, double top, double right, double bottom) {
    tbc_span span(text, tbc_bounding_box(top, left, bottom, right), tbc_font_style("Arial", 11, false, false));
    return tbc_layout_block::from_span(span);
}

SCENARIO("tbc_underline_injector adds placeholders for drawn signature lines") {
    tbc_underline_params params;
    tbc_underline_injector injector(params);

    GIVEN("A Director label with a rule to its right") {
        std::vector<tbc_layout_block> blocks = { make_block("Director", 100, 200, 160, 215) };
        std::vector<tbc_drawing> drawings = { tbc_drawing::line(170, 210, 260, 210) };

        WHEN("Injecting") {
            size_t added = injector.inject(blocks, drawings);

            THEN("One underscore block covers the rule") {
                REQUIRE(added == 1);
                REQUIRE(blocks.size() == 2);

                const tbc_layout_block& placeholder = blocks[1];
                REQUIRE(placeholder.text == tbc_string("_").repeat(12));
                REQUIRE(placeholder.bbox == tbc_bounding_box(209, 170, 211, 260));
                REQUIRE(placeholder.style == tbc_font_style("Times New Roman", 14, false, false));
                REQUIRE(placeholder.items.size() == 1);
                REQUIRE(placeholder.items[0].color == 0);
            }

            THEN("The label block is left untouched") {
                REQUIRE(blocks[0].text == tbc_string("Director"));
            }
        }
    }

    GIVEN("A short rule") {
        std::vector<tbc_layout_block> blocks = { make_block("Chief accountant", 100, 200, 200, 215) };
        std::vector<tbc_drawing> drawings = { tbc_drawing::rect(205, 209, 240, 211) };

        THEN("The placeholder has the minimum length") {
            REQUIRE(injector.inject(blocks, drawings) == 1);
            REQUIRE(blocks[1].text == tbc_string("_____"));
        }
    }

    GIVEN("A label that already has typed underscores on its line") {
        std::vector<tbc_layout_block> blocks = {
            make_block("Director", 100, 200, 160, 215),
            make_block("____________", 170, 202, 260, 214)
        };
        std::vector<tbc_drawing> drawings = { tbc_drawing::line(170, 214, 260, 214) };

        THEN("Nothing is added") {
            REQUIRE(injector.inject(blocks, drawings) == 0);
            REQUIRE(blocks.size() == 2);
        }
    }

    GIVEN("A Russian label in capitals") {
        std::vector<tbc_layout_block> blocks = { make_block("ДИРЕКТОР", 100, 200, 160, 215) };
        std::vector<tbc_drawing> drawings = { tbc_drawing::line(260, 210, 170, 210) };

        THEN("It matches and the reversed rule is normalized") {
            REQUIRE(injector.inject(blocks, drawings) == 1);
            REQUIRE(blocks[1].bbox.left == 170.0);
            REQUIRE(blocks[1].bbox.right == 260.0);
        }
    }

    GIVEN("Rules that do not qualify") {
        std::vector<tbc_layout_block> blocks = { make_block("Director", 100, 200, 160, 215) };
        std::vector<tbc_drawing> drawings = {
            tbc_drawing::line(170, 210, 190, 210),   // too short
            tbc_drawing::line(170, 180, 260, 240),   // not horizontal
            tbc_drawing::line(20, 210, 162, 210),    // ends left of the gap
            tbc_drawing::line(170, 300, 260, 300),   // different line
            tbc_drawing::rect(170, 200, 260, 220)    // a box, not a rule
        };

        THEN("Nothing is added") {
            REQUIRE(injector.inject(blocks, drawings) == 0);
            REQUIRE(blocks.size() == 1);
        }
    }

    GIVEN("A block that is not a label") {
        std::vector<tbc_layout_block> blocks = { make_block("Total", 100, 200, 160, 215) };
        std::vector<tbc_drawing> drawings = { tbc_drawing::line(170, 210, 260, 210) };

        THEN("Nothing is added") {
            REQUIRE(injector.inject(blocks, drawings) == 0);
        }
    }

    GIVEN("Two rules to the right of a label") {
        std::vector<tbc_layout_block> blocks = { make_block("Deputy head", 100, 200, 180, 215) };
        std::vector<tbc_drawing> drawings = {
            tbc_drawing::line(300, 212, 400, 212),
            tbc_drawing::line(190, 210, 280, 210)
        };

        THEN("The first one in feed order wins") {
            REQUIRE(injector.inject(blocks, drawings) == 1);
            REQUIRE(blocks[1].bbox.left == 300.0);
        }
    }
}

SCENARIO("tbc_underline_injector recognizes labels and typed underlines") {
    tbc_underline_params params;
    tbc_underline_injector injector(params);

    THEN("Labels match as case-insensitive substrings") {
        REQUIRE(injector.is_label("Head of department"));
        REQUIRE(injector.is_label("Заведующий кафедрой"));
        REQUIRE(injector.is_label("Project MANAGER"));
        REQUIRE_FALSE(injector.is_label("Signature"));
    }

    THEN("A run or enough groups of underscores count as a typed line") {
        REQUIRE(injector.has_captured_underline("Name ____"));
        REQUIRE(injector.has_captured_underline("_ _ _ _"));
        REQUIRE(injector.has_captured_underline("__ __\t__  ___"));
        REQUIRE_FALSE(injector.has_captured_underline("___"));
        REQUIRE_FALSE(injector.has_captured_underline("__ __"));
        REQUIRE_FALSE(injector.has_captured_underline("snake_case_name"));
    }

    GIVEN("A custom vocabulary") {
        tbc_underline_params custom = params;
        custom.label_terms = { "Approved by" };
        tbc_underline_injector custom_injector(custom);

        THEN("Only its terms are labels") {
            REQUIRE(custom_injector.is_label("APPROVED BY:"));
            REQUIRE_FALSE(custom_injector.is_label("Director"));
        }
    }

    WHEN("Collecting lines") {
        std::vector<tbc_drawing> drawings = {
            tbc_drawing::rect(10, 100, 80, 102),
            tbc_drawing::line(90, 50, 10, 52),
            tbc_drawing::rect(10, 100, 30, 102)
        };
        auto lines = injector.collect_horizontal_lines(drawings);

        THEN("Long flat primitives are kept in feed order") {
            REQUIRE(lines.size() == 2);
            REQUIRE(lines[0].x0 == 10.0);
            REQUIRE(lines[0].x1 == 80.0);
            REQUIRE(lines[1].x0 == 10.0);
            REQUIRE(lines[1].x1 == 90.0);
            REQUIRE(lines[1].y0 == 50.0);
        }
    }
}
