#include "rfloc/trilaterator.hpp"
#include <gtest/gtest.h>
#include <cmath>

using rfloc::MeasurementPoint;
using rfloc::PathLossModel;
using rfloc::Trilaterator;

namespace {

constexpr double kPi = 3.14159265358979323846;

MeasurementPoint pt(double x, double y, double rssi) {
    MeasurementPoint p;
    p.x = x;
    p.y = y;
    p.rssi = rssi;
    p.frequency = 2437.0;
    return p;
}

// Vericinin etrafında 120 derece aralıklı, model ile tam hesaplanmış üç ölçüm
std::vector<MeasurementPoint> ring(const PathLossModel& m, double ex, double ey, double r) {
    std::vector<MeasurementPoint> v;
    const double rssi = m.distance_to_rssi(r);
    for (int k = 0; k < 3; ++k) {
        const double a = kPi / 2.0 + k * 2.0 * kPi / 3.0;
        v.push_back(pt(ex + r * std::cos(a), ey + r * std::sin(a), rssi));
    }
    return v;
}

} // namespace

TEST(Trilaterator, NeedsThreePoints) {
    const PathLossModel m;
    const Trilaterator t(m);
    EXPECT_FALSE(t.triangulate({}).has_value());
    EXPECT_FALSE(t.triangulate({pt(0, 0, -50), pt(5, 0, -55)}).has_value());
}

TEST(Trilaterator, RecoversEmitterFromExactDistances) {
    const PathLossModel m;
    const Trilaterator t(m);
    const auto fix = t.triangulate(ring(m, 2.0, 3.0, 5.0));
    ASSERT_TRUE(fix.has_value());
    EXPECT_NEAR(fix->x, 2.0, 1e-6);
    EXPECT_NEAR(fix->y, 3.0, 1e-6);
    // geometri ideal (1.0), sinyal (-53.98 dBm) 0.6505, sayı 3/5
    EXPECT_NEAR(fix->confidence, 0.5 + 0.3 * 0.650515 + 0.2 * 0.6, 1e-4);
}

TEST(Trilaterator, KeepsCopyOfTemporaryModel) {
    const Trilaterator t(PathLossModel({3.2, 1.0, -38.0}));
    const PathLossModel ref({3.2, 1.0, -38.0});
    const auto fix = t.triangulate(ring(ref, 1.0, 1.0, 4.0));
    ASSERT_TRUE(fix.has_value());
    EXPECT_NEAR(fix->x, 1.0, 1e-6);
    EXPECT_NEAR(fix->y, 1.0, 1e-6);
}

TEST(Trilaterator, RecoversEmitterWithIndoorModel) {
    const PathLossModel m({3.2, 1.0, -38.0});
    const Trilaterator t(m);
    const auto fix = t.triangulate(ring(m, -4.0, 7.5, 3.0));
    ASSERT_TRUE(fix.has_value());
    EXPECT_NEAR(fix->x, -4.0, 1e-6);
    EXPECT_NEAR(fix->y, 7.5, 1e-6);
}

TEST(Trilaterator, CollinearPointsHaveNoFix) {
    const PathLossModel m;
    const Trilaterator t(m);
    EXPECT_FALSE(t.triangulate({pt(0, 0, -50), pt(1, 0, -52), pt(2, 0, -54)}).has_value());
    EXPECT_FALSE(t.triangulate({pt(0, 0, -50), pt(1, 1, -52), pt(3, 3, -54)}).has_value());
}

TEST(Trilaterator, NearlyCollinearBelowDeterminantEpsilon) {
    const PathLossModel m;
    const Trilaterator t(m);
    EXPECT_FALSE(t.triangulate({pt(0, 0, -50), pt(1, 0, -52), pt(2, 1e-12, -54)}).has_value());
}

TEST(Trilaterator, UsesStrongestThree) {
    const PathLossModel m;
    const Trilaterator t(m);
    auto pts = ring(m, 2.0, 3.0, 5.0);
    pts.insert(pts.begin(), pt(50.0, -50.0, -95.0));   // en zayıf, yok sayılmalı
    const auto fix = t.triangulate(pts);
    ASSERT_TRUE(fix.has_value());
    EXPECT_NEAR(fix->x, 2.0, 1e-6);
    EXPECT_NEAR(fix->y, 3.0, 1e-6);
}

TEST(Trilaterator, ConfidenceGrowsWithSampleCount) {
    const PathLossModel m;
    const Trilaterator t(m);
    auto pts = ring(m, 2.0, 3.0, 5.0);
    const double rssi = pts.front().rssi;

    const auto c3 = t.triangulate(pts);
    pts.push_back(pt(0.0, 0.0, rssi));   // eşit RSSI: ilk üç nokta seçili kalır
    const auto c4 = t.triangulate(pts);
    pts.push_back(pt(1.0, 1.0, rssi));
    const auto c5 = t.triangulate(pts);

    ASSERT_TRUE(c3 && c4 && c5);
    EXPECT_LE(c3->confidence, c4->confidence);
    EXPECT_LE(c4->confidence, c5->confidence);
    EXPECT_NEAR(c5->confidence - c3->confidence, 0.2 * 0.4, 1e-9);
    EXPECT_NEAR(c5->x, c3->x, 1e-9);
}

TEST(Trilaterator, ConfidenceIsClamped) {
    const PathLossModel m;
    const Trilaterator t(m);
    const auto fix = t.triangulate({pt(0, 0, -45), pt(5, 0, -55), pt(2.5, 4, -50)});
    ASSERT_TRUE(fix.has_value());
    EXPECT_GE(fix->confidence, 0.0);
    EXPECT_LE(fix->confidence, 1.0);

    // Çok zayıf sinyal: sinyal faktörü 0
    const auto weak = t.triangulate(ring(m, 0.0, 0.0, 500.0));
    ASSERT_TRUE(weak.has_value());
    EXPECT_NEAR(weak->confidence, 0.5 + 0.2 * 0.6, 1e-6);
}
