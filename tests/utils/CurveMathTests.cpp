/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE CurveMathTests
#include <boost/test/unit_test.hpp>

#include "utils/CurveMath.hpp"
#include <cmath>

using namespace FortressEngine;

BOOST_AUTO_TEST_SUITE(BezierTests)

BOOST_AUTO_TEST_CASE(TestEndpoints) {
    const Vector2D p0(-10.0f, 40.0f);
    const Vector2D p1(50.0f, 0.0f);
    const Vector2D p2(100.0f, 80.0f);

    BOOST_CHECK(CurveMath::quadBezier(p0, p1, p2, 0.0f) == p0);
    BOOST_CHECK(CurveMath::quadBezier(p0, p1, p2, 1.0f) == p2);
}

BOOST_AUTO_TEST_CASE(TestMidpoint) {
    const Vector2D mid = CurveMath::quadBezier(Vector2D(0.0f, 0.0f), Vector2D(50.0f, 100.0f),
                                               Vector2D(100.0f, 0.0f), 0.5f);
    BOOST_CHECK_CLOSE(mid.getX(), 50.0f, 0.001f);
    BOOST_CHECK_CLOSE(mid.getY(), 50.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestParameterClamped) {
    const Vector2D p0(0.0f, 0.0f);
    const Vector2D p2(10.0f, 10.0f);
    BOOST_CHECK(CurveMath::quadBezier(p0, Vector2D(5.0f, 0.0f), p2, -3.0f) == p0);
    BOOST_CHECK(CurveMath::quadBezier(p0, Vector2D(5.0f, 0.0f), p2, 7.0f) == p2);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SizeAndHashTests)

BOOST_AUTO_TEST_CASE(TestSizeFromMagnitude) {
    BOOST_CHECK_CLOSE(CurveMath::sizeFromMagnitude(0.0), 6.0f, 0.001f);
    BOOST_CHECK_CLOSE(CurveMath::sizeFromMagnitude(900.0), 12.0f, 0.001f);
    BOOST_CHECK_CLOSE(CurveMath::sizeFromMagnitude(5000.0),
                      static_cast<float>(std::log10(51.0) * 6.0 + 6.0), 0.001f);
    BOOST_CHECK_EQUAL(CurveMath::sizeFromMagnitude(1e12), 32.0f);
    BOOST_CHECK_EQUAL(CurveMath::sizeFromMagnitude(-50.0), 6.0f);
}

BOOST_AUTO_TEST_CASE(TestFnvHash) {
    BOOST_CHECK_EQUAL(CurveMath::hashIdentifier(""), 2166136261u);
    BOOST_CHECK_EQUAL(CurveMath::hashIdentifier("a"), 0xe40c292cu);
    BOOST_CHECK_EQUAL(CurveMath::hashIdentifier("txn-42"), CurveMath::hashIdentifier("txn-42"));
    BOOST_CHECK_NE(CurveMath::hashIdentifier("txn-42"), CurveMath::hashIdentifier("txn-43"));
}

BOOST_AUTO_TEST_CASE(TestOrbitPhaseRange) {
    for (const char* id : {"", "a", "t1", "t2", "txn-0001", "a-much-longer-identifier"}) {
        const float phase = CurveMath::orbitPhaseFor(id);
        BOOST_CHECK_GE(phase, 0.0f);
        BOOST_CHECK_LE(phase, 49.5f);
    }
    BOOST_CHECK_EQUAL(CurveMath::orbitPhaseFor("a"),
                      static_cast<float>(0xe40c292cu % 100u) * 0.5f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TriangleWaveTests)

BOOST_AUTO_TEST_CASE(TestRampUpAndDown) {
    BOOST_CHECK_EQUAL(CurveMath::triangleWave(0.0, 1.0), 0.0f);
    BOOST_CHECK_CLOSE(CurveMath::triangleWave(0.25, 1.0), 0.25f, 0.001f);
    BOOST_CHECK_CLOSE(CurveMath::triangleWave(1.0, 1.0), 1.0f, 0.001f);
    BOOST_CHECK_CLOSE(CurveMath::triangleWave(1.5, 1.0), 0.5f, 0.001f);
    BOOST_CHECK_SMALL(CurveMath::triangleWave(2.0, 1.0), 1e-6f);
    BOOST_CHECK_CLOSE(CurveMath::triangleWave(2.25, 1.0), 0.25f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestDegenerateInputs) {
    BOOST_CHECK_EQUAL(CurveMath::triangleWave(-1.0, 1.0), 0.0f);
    BOOST_CHECK_EQUAL(CurveMath::triangleWave(5.0, 0.0), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestClampToleratesInvertedBounds) {
    BOOST_CHECK_EQUAL(CurveMath::clamp(5.0, 1.0, 3.0), 3.0);
    BOOST_CHECK_EQUAL(CurveMath::clamp(-5.0, 1.0, 3.0), 1.0);
    BOOST_CHECK_EQUAL(CurveMath::clamp(2.0, 3.0, 1.0), 3.0);
}

BOOST_AUTO_TEST_SUITE_END()
