#include "rfloc/signature_classifier.hpp"
#include <gtest/gtest.h>

using rfloc::InterferenceType;
using rfloc::SignatureClassifier;

TEST(SignatureClassifier, PulsedStrongSignalIsMicrowave) {
    EXPECT_EQ(SignatureClassifier().classify(2450, -30, "pulsed"), InterferenceType::Microwave);
}

TEST(SignatureClassifier, EqualScoresFollowTableOrder) {
    // -50 dBm: Bluetooth, telefon, bebek monitörü, kamera, ZigBee hepsi eşleşir
    EXPECT_EQ(SignatureClassifier().classify(2437, -50), InterferenceType::Bluetooth);
}

TEST(SignatureClassifier, PatternBonusPromotesLaterEntry) {
    EXPECT_EQ(SignatureClassifier().classify(2437, -45, "continuous"), InterferenceType::WirelessPhone);
    EXPECT_EQ(SignatureClassifier().classify(2437, -25, "continuous"), InterferenceType::WirelessCamera);
}

TEST(SignatureClassifier, OverlappingHoppingSignaturesResolveToFirstDeclared) {
    // Bluetooth ve ZigBee -60 dBm'de ikisi de "hopping" ile 1.5 alır
    EXPECT_EQ(SignatureClassifier().classify(2450, -60, "hopping"), InterferenceType::Bluetooth);
}

TEST(SignatureClassifier, WeakSignalIsZigbee) {
    EXPECT_EQ(SignatureClassifier().classify(2450, -75), InterferenceType::Zigbee);
}

TEST(SignatureClassifier, RangesAreInclusive) {
    EXPECT_EQ(SignatureClassifier().classify(2500, -20, "pulsed"), InterferenceType::Microwave);
    EXPECT_EQ(SignatureClassifier().classify(2405, -80), InterferenceType::Zigbee);
}

TEST(SignatureClassifier, FallsBackByBand) {
    const SignatureClassifier c;
    EXPECT_EQ(c.classify(2495, -90), InterferenceType::Other24G);
    EXPECT_EQ(c.classify(2450, -10), InterferenceType::Other24G);
    EXPECT_EQ(c.classify(5500, -60), InterferenceType::Other5G);
    EXPECT_EQ(c.classify(900, -50), InterferenceType::Unknown);
    EXPECT_EQ(c.classify(6500, -50), InterferenceType::Unknown);
}

TEST(SignatureClassifier, TableOrderIsFixed) {
    const auto& t = SignatureClassifier::signatures();
    ASSERT_EQ(t.size(), 6u);
    EXPECT_EQ(t[0].type, InterferenceType::Microwave);
    EXPECT_EQ(t[1].type, InterferenceType::Bluetooth);
    EXPECT_EQ(t[2].type, InterferenceType::WirelessPhone);
    EXPECT_EQ(t[3].type, InterferenceType::BabyMonitor);
    EXPECT_EQ(t[4].type, InterferenceType::WirelessCamera);
    EXPECT_EQ(t[5].type, InterferenceType::Zigbee);
}
