/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE DiceTests
#include <boost/test/unit_test.hpp>

#include "core/Dice.hpp"
#include "core/GameError.hpp"
#include "mocks/ScriptedRandomSource.hpp"

using SoloAdventure::ContentError;
using SoloAdventure::Dice;
using SoloAdventure::DiceExpr;

// ============================================================================
// Test Fixture
// ============================================================================

struct DiceFixture {
    ScriptedRandomSource random;
    Dice dice{random};
};

// ============================================================================
// EXPRESSION PARSING TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(DiceExprTests)

BOOST_AUTO_TEST_CASE(TestParseFullExpression) {
    auto expr = DiceExpr::tryParse("2d6+3");
    BOOST_REQUIRE(expr.has_value());
    BOOST_CHECK_EQUAL(expr->count, 2);
    BOOST_CHECK_EQUAL(expr->sides, 6);
    BOOST_CHECK_EQUAL(expr->bonus, 3);
    BOOST_CHECK(!expr->isFlat());
}

BOOST_AUTO_TEST_CASE(TestParseVariants) {
    auto single = DiceExpr::tryParse("d8");
    BOOST_REQUIRE(single.has_value());
    BOOST_CHECK_EQUAL(single->count, 1);
    BOOST_CHECK_EQUAL(single->sides, 8);

    auto negative = DiceExpr::tryParse(" 1d4 - 1 ");
    BOOST_REQUIRE(negative.has_value());
    BOOST_CHECK_EQUAL(negative->bonus, -1);

    auto upper = DiceExpr::tryParse("3D10");
    BOOST_REQUIRE(upper.has_value());
    BOOST_CHECK_EQUAL(upper->count, 3);
    BOOST_CHECK_EQUAL(upper->sides, 10);
}

BOOST_AUTO_TEST_CASE(TestParseFlatNumber) {
    auto flat = DiceExpr::tryParse("5");
    BOOST_REQUIRE(flat.has_value());
    BOOST_CHECK(flat->isFlat());
    BOOST_CHECK_EQUAL(flat->count, 0);
    BOOST_CHECK_EQUAL(flat->sides, 0);
    BOOST_CHECK_EQUAL(flat->bonus, 5);
}

BOOST_AUTO_TEST_CASE(TestRejectMalformedExpressions) {
    BOOST_CHECK(!DiceExpr::tryParse("").has_value());
    BOOST_CHECK(!DiceExpr::tryParse("d").has_value());
    BOOST_CHECK(!DiceExpr::tryParse("1d0").has_value());
    BOOST_CHECK(!DiceExpr::tryParse("1d6+").has_value());
    BOOST_CHECK(!DiceExpr::tryParse("xd6").has_value());
    BOOST_CHECK(!DiceExpr::tryParse("fireball").has_value());

    BOOST_CHECK_THROW(DiceExpr::parse("1d"), ContentError);
}

BOOST_AUTO_TEST_CASE(TestToString) {
    BOOST_CHECK_EQUAL(DiceExpr::parse("1d8+1").toString(), "1d8+1");
    BOOST_CHECK_EQUAL(DiceExpr::parse("1d4-1").toString(), "1d4-1");
    BOOST_CHECK_EQUAL(DiceExpr::parse("2d6").toString(), "2d6");
    BOOST_CHECK_EQUAL(DiceExpr::parse("7").toString(), "7");
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ROLLING TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(RollTests, DiceFixture)

BOOST_AUTO_TEST_CASE(TestRollDetailListsFacesThenBonus) {
    random.push({3, 4});
    auto result = dice.roll("2d6+2");

    BOOST_CHECK_EQUAL(result.total, 9);
    BOOST_CHECK_EQUAL(result.detail, "3+4+2");
}

BOOST_AUTO_TEST_CASE(TestRollNegativeBonus) {
    random.push({1});
    auto result = dice.roll("1d4-1");

    BOOST_CHECK_EQUAL(result.total, 0);
    BOOST_CHECK_EQUAL(result.detail, "1-1");
}

BOOST_AUTO_TEST_CASE(TestFlatRollUsesNoDice) {
    auto result = dice.roll("4");

    BOOST_CHECK_EQUAL(result.total, 4);
    BOOST_CHECK_EQUAL(result.detail, "4");
    BOOST_CHECK_EQUAL(random.calls(), 0);
}

BOOST_AUTO_TEST_CASE(TestRollDieRejectsZeroSides) {
    BOOST_CHECK_THROW(dice.rollDie(0), ContentError);
    BOOST_CHECK_THROW(dice.roll("bogus"), ContentError);
}

BOOST_AUTO_TEST_CASE(TestCheckMeetsDc) {
    random.push({11, 10});
    auto pass = dice.check(2, 13);
    BOOST_CHECK(pass.success);
    BOOST_CHECK_EQUAL(pass.roll, 11);
    BOOST_CHECK_EQUAL(pass.total, 13);

    auto fail = dice.check(2, 13);
    BOOST_CHECK(!fail.success);
    BOOST_CHECK_EQUAL(fail.total, 12);
    BOOST_CHECK_EQUAL(random.calls(), 2);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// RANDOM SOURCE TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(RandomSourceTests)

BOOST_AUTO_TEST_CASE(TestSeededSourceStaysInRange) {
    SoloAdventure::MersenneRandomSource source(42);
    Dice dice(source);

    bool sawLow = false;
    bool sawHigh = false;
    for (int i = 0; i < 2000; ++i) {
        int face = dice.rollDie(6);
        BOOST_REQUIRE(face >= 1 && face <= 6);
        sawLow = sawLow || face == 1;
        sawHigh = sawHigh || face == 6;
    }
    BOOST_CHECK(sawLow);
    BOOST_CHECK(sawHigh);
}

BOOST_AUTO_TEST_CASE(TestSameSeedSameSequence) {
    SoloAdventure::MersenneRandomSource first(7);
    SoloAdventure::MersenneRandomSource second(7);
    for (int i = 0; i < 50; ++i) {
        BOOST_CHECK_EQUAL(first.uniformInt(1, 20), second.uniformInt(1, 20));
    }
}

BOOST_AUTO_TEST_SUITE_END()
