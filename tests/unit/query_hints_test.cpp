/** \file query_hints_test.cpp
 *  \brief Lexicon hint extraction and candidate majority inference.
 */

#include <catch2/catch_test_macros.hpp>

#include "facet/scoring/query_hints.hpp"
#include "facet_test_helpers.hpp"

#include <vector>

using namespace facet;
using namespace facet::scoring;
using facet_test_helpers::make_item;

TEST_CASE("Metal hints follow lexicon order on word boundaries", "[hints][metal]") {
    SECTION("platinum") {
        auto h = extract_query_hints("A platinum solitaire");
        REQUIRE(h.metal == "platinum");
        REQUIRE(h.metal_explicit);
    }
    SECTION("rose gold is not yellow gold") {
        REQUIRE(extract_query_hints("vintage rose gold band").metal == "rose gold");
        REQUIRE(extract_query_hints("pink-gold halo").metal == "rose gold");
    }
    SECTION("bare gold falls back to yellow gold") {
        REQUIRE(extract_query_hints("simple gold ring").metal == "yellow gold");
    }
    SECTION("substrings inside other words do not match") {
        auto h = extract_query_hints("goldsmith crafted opt-in");
        REQUIRE_FALSE(h.metal.has_value());
        REQUIRE_FALSE(h.metal_explicit);
    }
    SECTION("first lexicon entry wins") {
        REQUIRE(extract_query_hints("white gold or platinum").metal == "platinum");
    }
}

TEST_CASE("Color grades need context or upper case", "[hints][color]") {
    REQUIRE(extract_query_hints("E color oval").color == "E");
    REQUIRE(extract_query_hints("colour g please").color == "G");
    REQUIRE(extract_query_hints("grade h").color == "H");

    auto pronoun = extract_query_hints("I want a ring");
    REQUIRE_FALSE(pronoun.color.has_value());
    REQUIRE(extract_query_hints("color I stone").color == "I");

    REQUIRE_FALSE(extract_query_hints("a d e f").color.has_value());
    REQUIRE_FALSE(extract_query_hints("grade Z").color.has_value());

    SECTION("bare lower-case letter is not a grade") {
        const auto lone = extract_query_hints("a d diamond");
        REQUIRE_FALSE(lone.color.has_value());
        REQUIRE_FALSE(lone.color_explicit);
        REQUIRE(extract_query_hints("a D diamond").color == "D");
        REQUIRE(extract_query_hints("a d color diamond").color == "D");
    }

    auto h = extract_query_hints("F grade");
    REQUIRE(h.color_explicit);
}

TEST_CASE("Shape hints use synonyms", "[hints][shape]") {
    REQUIRE(extract_query_hints("teardrop pendant").shape == "Pear");
    REQUIRE(extract_query_hints("Round brilliant").shape == "Round");
    REQUIRE(extract_query_hints("navette").shape == "Marquise");
    REQUIRE_FALSE(extract_query_hints("").shape.has_value());

    auto all = extract_query_hints("D color cushion in platinum");
    REQUIRE(all.metal == "platinum");
    REQUIRE(all.color == "D");
    REQUIRE(all.shape == "Cushion");
    REQUIRE(all.any());
}

TEST_CASE("Unset hints are inferred from the top candidates", "[hints][infer]") {
    std::vector<metadata::Item> diamonds{
        make_item("d1", {{"color", std::string("g")}, {"shape", std::string("OVAL")}}),
        make_item("d2", {{"color", std::string("H")}, {"shape", std::string("round")}}),
        make_item("d3", {{"color", std::string("H")}, {"shape", std::string("Round")}}),
    };
    std::vector<metadata::Item> settings{
        make_item("s1", {{"metal", std::string("Platinum")}}),
        make_item("s2", {{"metal", std::string("Yellow Gold")}}),
    };
    std::vector<const metadata::Item*> dp{&diamonds[0], &diamonds[1], &diamonds[2]};
    std::vector<const metadata::Item*> sp{&settings[0], &settings[1]};

    SECTION("majority with first-seen tie break") {
        auto h = infer_hints(QueryHints{}, dp, sp);
        REQUIRE(h.color == "H");
        REQUIRE(h.shape == "Round");
        REQUIRE(h.metal == "platinum");
        REQUIRE_FALSE(h.color_explicit);
        REQUIRE_FALSE(h.metal_explicit);
    }
    SECTION("explicit hints survive") {
        auto h = infer_hints(extract_query_hints("rose gold"), dp, sp);
        REQUIRE(h.metal == "rose gold");
        REQUIRE(h.metal_explicit);
    }
    SECTION("top_n limits the vote") {
        auto h = infer_hints(QueryHints{}, dp, sp, 1);
        REQUIRE(h.color == "G");
        REQUIRE(h.shape == "Oval");
    }
    SECTION("no attributes leaves hints unset") {
        std::vector<metadata::Item> bare{make_item("x")};
        std::vector<const metadata::Item*> bp{&bare[0]};
        auto h = infer_hints(QueryHints{}, bp, bp);
        REQUIRE_FALSE(h.any());
    }
}
