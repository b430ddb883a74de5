#include <catch2/catch_all.hpp>
#include "../clustering/tbc_watermark_detector.h"
#include "../clustering/tbc_cluster_exceptions.h"

static tbc_span make_span(const tbc_string& text, double left, double top, double right, double bottom,
                          uint32_t color = 0) {
    return tbc_span(text, tbc_bounding_box(top, left, bottom, right), tbc_font_style("Arial", 10, false, false), color);
}

static tbc_hyperlink make_link(const tbc_string& uri, double left, double top, double right, double bottom) {
    tbc_hyperlink link;
    if (!uri.empty()) {
        link.uri = uri;
    }
    link.bbox = tbc_bounding_box(top, left, bottom, right);
    return link;
}

SCENARIO("tbc_watermark_detector scores text and link signals") {
    tbc_watermark_params params;
    tbc_watermark_detector detector(params);

    GIVEN("A URL footer covered by a link and a plain paragraph") {
        std::vector<tbc_span> spans = {
            make_span("Quarterly results", 50, 100, 200, 112),
            make_span("visit example.com", 50, 800, 150, 810)
        };
        std::vector<tbc_hyperlink> links = { make_link("https://example.com", 48, 798, 152, 812) };

        WHEN("Finding candidates") {
            auto candidates = detector.find_candidates(spans, links);

            THEN("Only the footer is a candidate with two strong signals") {
                REQUIRE(candidates.size() == 1);
                REQUIRE(candidates[0].text == tbc_string("visit example.com"));
                REQUIRE(candidates[0].signals == std::vector<tbc_string>{ TBC_SIGNAL_URL_TEXT, TBC_SIGNAL_LINK_HIT });
                REQUIRE(candidates[0].score == 2 * params.strong_weight);
            }
        }

        WHEN("Building the filter") {
            tbc_watermark_filter filter = detector.make_filter(spans, links);

            THEN("The footer region is excluded and the paragraph is kept") {
                REQUIRE(filter.size() == 1);
                REQUIRE(filter.is_watermark(spans[1]));
                REQUIRE_FALSE(filter.is_watermark(spans[0]));
            }
        }
    }

    GIVEN("An e-mail address") {
        std::vector<tbc_span> spans = { make_span("info@example.org", 10, 10, 90, 20) };

        THEN("Both the e-mail and the domain signal fire") {
            auto candidates = detector.find_candidates(spans, {});
            REQUIRE(candidates.size() == 1);
            REQUIRE(candidates[0].has_signal(TBC_SIGNAL_EMAIL_TEXT));
            REQUIRE(candidates[0].has_signal(TBC_SIGNAL_URL_TEXT));
            REQUIRE_FALSE(candidates[0].has_signal(TBC_SIGNAL_LINK_HIT));
        }
    }

    GIVEN("Light text without any strong signal") {
        std::vector<tbc_span> spans = { make_span("CONFIDENTIAL", 100, 400, 400, 440, 0xF5F5F5) };

        THEN("It is not a candidate") {
            REQUIRE(detector.find_candidates(spans, {}).empty());
            REQUIRE(detector.make_filter(spans, {}).empty());
        }
    }

    GIVEN("Domains next to non-ASCII text") {
        THEN("A domain glued to a Cyrillic word is not a URL") {
            REQUIRE_FALSE(detector.has_url("абвexample.com"));
            REQUIRE_FALSE(detector.has_url("éxample.com"));
        }

        THEN("A domain separated by a space or punctuation still is") {
            REQUIRE(detector.has_url("сайт example.com"));
            REQUIRE(detector.has_url("«example.com»"));
        }

        THEN("A trailing letter shortens the match like a word boundary would") {
            REQUIRE(detector.has_url("www.example.comабв"));
            REQUIRE_FALSE(detector.has_url("example.comабв"));
        }
    }

    GIVEN("Light text with a URL") {
        std::vector<tbc_span> spans = { make_span("www.example.net", 100, 400, 400, 440, 0xFFFFFF) };

        THEN("The standalone detector adds the weak color signal") {
            auto candidates = detector.find_candidates(spans, {});
            REQUIRE(candidates.size() == 1);
            REQUIRE(candidates[0].signals == std::vector<tbc_string>{ TBC_SIGNAL_URL_TEXT, TBC_SIGNAL_NEAR_WHITE });
            REQUIRE(candidates[0].score == params.strong_weight + 1);
        }

        THEN("Scoring without the color hint ignores the color") {
            auto candidates = detector.find_candidates(spans, {}, false);
            REQUIRE(candidates.size() == 1);
            REQUIRE_FALSE(candidates[0].has_signal(TBC_SIGNAL_NEAR_WHITE));
            REQUIRE(candidates[0].score == params.strong_weight);
        }
    }

    GIVEN("A link annotation without a target") {
        std::vector<tbc_span> spans = { make_span("Section 3", 10, 10, 60, 20) };
        std::vector<tbc_hyperlink> links = { make_link("", 0, 0, 100, 30) };

        THEN("It is ignored for external links only") {
            REQUIRE(detector.find_candidates(spans, links).empty());
        }

        THEN("It counts when internal links are accepted") {
            tbc_watermark_params internal = params;
            internal.external_links_only = false;
            tbc_watermark_detector internal_detector(internal);

            auto candidates = internal_detector.find_candidates(spans, links);
            REQUIRE(candidates.size() == 1);
            REQUIRE(candidates[0].signals == std::vector<tbc_string>{ TBC_SIGNAL_LINK_HIT });
        }
    }

    GIVEN("Several candidates") {
        std::vector<tbc_span> spans = {
            make_span("b.example.com", 200, 50, 260, 60),
            make_span("a.example.com", 100, 50, 160, 60),
            make_span("mail me: x@example.com", 100, 10, 200, 20),
            make_span("top.example.com", 100, 5, 160, 15)
        };

        THEN("They are ordered by score, then top, then left") {
            auto candidates = detector.find_candidates(spans, {});
            REQUIRE(candidates.size() == 4);
            REQUIRE(candidates[0].text == tbc_string("mail me: x@example.com"));
            REQUIRE(candidates[1].text == tbc_string("top.example.com"));
            REQUIRE(candidates[2].text == tbc_string("a.example.com"));
            REQUIRE(candidates[3].text == tbc_string("b.example.com"));
        }
    }

    WHEN("A pattern does not compile") {
        tbc_watermark_params broken = params;
        broken.domain_pattern = "([a-z";

        THEN("Construction throws") {
            REQUIRE_THROWS_AS(tbc_watermark_detector(broken), tbc_exception);
        }
    }
}

SCENARIO("tbc_watermark_filter checks regions with padding") {
    GIVEN("An empty filter") {
        tbc_watermark_filter filter({}, 0.5);

        THEN("Nothing is a watermark") {
            REQUIRE(filter.empty());
            REQUIRE_FALSE(filter.is_watermark(tbc_bounding_box(0, 0, 1000, 1000)));
        }
    }

    GIVEN("One region") {
        tbc_watermark_filter filter({ tbc_bounding_box(100, 100, 110, 200) }, 0.5);

        THEN("A box touching the region edge is caught through the padding") {
            REQUIRE(filter.is_watermark(tbc_bounding_box(110, 100, 120, 200)));
        }

        THEN("A box further away is kept") {
            REQUIRE_FALSE(filter.is_watermark(tbc_bounding_box(111, 100, 120, 200)));
        }
    }
}
