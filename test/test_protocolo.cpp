#include <gtest/gtest.h>
#include "comms/ProtocoloImu.h"

using comms::LineaImu;
using comms::TipoLinea;
using comms::parsearLinea;

TEST(ProtocoloImu, AnguloConPrefijo) {
    LineaImu l = parsearLinea("ANG:12.5");
    EXPECT_EQ(l.tipo, TipoLinea::ANGULO);
    EXPECT_FLOAT_EQ(l.valor, 12.5f);
}

TEST(ProtocoloImu, EspaciosYRetornoDeCarro) {
    LineaImu l = parsearLinea("  ANG: -3.25 \r");
    EXPECT_EQ(l.tipo, TipoLinea::ANGULO);
    EXPECT_FLOAT_EQ(l.valor, -3.25f);
}

TEST(ProtocoloImu, AnguloSinPrefijo) {
    LineaImu l = parsearLinea("7.5\n");
    EXPECT_EQ(l.tipo, TipoLinea::ANGULO);
    EXPECT_FLOAT_EQ(l.valor, 7.5f);
}

TEST(ProtocoloImu, Bateria) {
    LineaImu l = parsearLinea("VBAT:3.71");
    EXPECT_EQ(l.tipo, TipoLinea::BATERIA);
    EXPECT_FLOAT_EQ(l.valor, 3.71f);
}

TEST(ProtocoloImu, BateriaMalFormadaNoEsAngulo) {
    EXPECT_EQ(parsearLinea("VBAT:abc").tipo, TipoLinea::DESCARTADA);
    EXPECT_EQ(parsearLinea("VBAT:").tipo, TipoLinea::DESCARTADA);
}

TEST(ProtocoloImu, LineasDescartadas) {
    EXPECT_EQ(parsearLinea(nullptr).tipo, TipoLinea::DESCARTADA);
    EXPECT_EQ(parsearLinea("").tipo, TipoLinea::DESCARTADA);
    EXPECT_EQ(parsearLinea("   \r\n").tipo, TipoLinea::DESCARTADA);
    EXPECT_EQ(parsearLinea("IMU listo").tipo, TipoLinea::DESCARTADA);
    EXPECT_EQ(parsearLinea("ANG:").tipo, TipoLinea::DESCARTADA);
    EXPECT_EQ(parsearLinea("ANG:12.5x").tipo, TipoLinea::DESCARTADA);
    EXPECT_EQ(parsearLinea("12 13").tipo, TipoLinea::DESCARTADA);
}

TEST(ProtocoloImu, NoFinitosSeRechazan) {
    EXPECT_EQ(parsearLinea("ANG:nan").tipo, TipoLinea::DESCARTADA);
    EXPECT_EQ(parsearLinea("ANG:inf").tipo, TipoLinea::DESCARTADA);
    EXPECT_EQ(parsearLinea("VBAT:-inf").tipo, TipoLinea::DESCARTADA);
}
