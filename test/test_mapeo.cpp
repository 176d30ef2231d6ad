#include <gtest/gtest.h>
#include "control/MapeoActuacion.h"

using control::Actuacion;
using control::mapearActuacion;

TEST(MapeoActuacion, PlantarConCurvaGamma) {
    config::SesionTuning cfg;
    Actuacion a = mapearActuacion(16.0f, cfg);
    EXPECT_NEAR(a.acelerador, 0.5036f, 1e-3f);
    EXPECT_FLOAT_EQ(a.reversa, 0.0f);
}

TEST(MapeoActuacion, ZonaMuertaNoActua) {
    config::SesionTuning cfg;
    for (float ang : {0.0f, 1.0f, -1.0f, 1.99f, -1.99f}) {
        Actuacion a = mapearActuacion(ang, cfg);
        EXPECT_FLOAT_EQ(a.acelerador, 0.0f) << ang;
        EXPECT_FLOAT_EQ(a.reversa, 0.0f) << ang;
    }
}

TEST(MapeoActuacion, DorsiDaReversaSaturada) {
    config::SesionTuning cfg;
    Actuacion a = mapearActuacion(-45.0f, cfg);
    EXPECT_FLOAT_EQ(a.acelerador, 0.0f);
    EXPECT_FLOAT_EQ(a.reversa, 1.0f);
}

TEST(MapeoActuacion, NuncaAmbosPositivos) {
    config::SesionTuning cfg;
    for (float ang = -40.0f; ang <= 40.0f; ang += 0.5f) {
        Actuacion a = mapearActuacion(ang, cfg);
        EXPECT_FALSE(a.acelerador > 0.0f && a.reversa > 0.0f) << ang;
        EXPECT_LE(a.acelerador, 1.0f);
        EXPECT_LE(a.reversa, 1.0f);
    }
}

TEST(MapeoActuacion, ConversionKmh) {
    EXPECT_FLOAT_EQ(control::kmhDesdePxps(70.0f, 70.0f), 3.6f);
    EXPECT_FLOAT_EQ(control::kmhDesdePxps(0.0f, 70.0f), 0.0f);
}
