#include <gtest/gtest.h>
#include "control/CalibracionCero.h"

using control::CalibracionCero;

TEST(CalibracionCero, InactivaNoAcumula) {
    CalibracionCero c(4.0f);
    EXPECT_FALSE(c.activa());
    EXPECT_FALSE(c.agregar(10.0f, 1.0f));
    EXPECT_EQ(c.muestras(), 0u);
    EXPECT_FLOAT_EQ(c.cero(), 0.0f);
}

TEST(CalibracionCero, CierraAlCumplirLaDuracion) {
    CalibracionCero c(4.0f);
    c.iniciar();
    EXPECT_FALSE(c.agregar(1.0f, 1.0f));
    EXPECT_FALSE(c.agregar(2.0f, 1.0f));
    EXPECT_FALSE(c.agregar(3.0f, 1.0f));
    EXPECT_TRUE(c.agregar(6.0f, 1.0f));
    EXPECT_FALSE(c.activa());
    EXPECT_FLOAT_EQ(c.cero(), 3.0f);
    EXPECT_EQ(c.muestras(), 4u);
}

TEST(CalibracionCero, ReaperturaConservaCeroHastaCerrar) {
    CalibracionCero c(1.0f);
    c.iniciar();
    c.agregar(5.0f, 0.5f);
    c.agregar(5.0f, 0.5f);
    ASSERT_FLOAT_EQ(c.cero(), 5.0f);

    c.iniciar();
    EXPECT_TRUE(c.activa());
    EXPECT_FLOAT_EQ(c.transcurrido(), 0.0f);
    c.agregar(-1.0f, 0.5f);
    EXPECT_FLOAT_EQ(c.cero(), 5.0f);
    EXPECT_TRUE(c.agregar(-3.0f, 0.5f));
    EXPECT_FLOAT_EQ(c.cero(), -2.0f);
}

TEST(CalibracionCero, DtNegativoNoAvanza) {
    CalibracionCero c(1.0f);
    c.iniciar();
    EXPECT_FALSE(c.agregar(1.0f, -5.0f));
    EXPECT_FLOAT_EQ(c.transcurrido(), 0.0f);
    EXPECT_TRUE(c.activa());
}
