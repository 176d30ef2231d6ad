#include <gtest/gtest.h>
#include "comms/MaquinaReconexion.h"

using comms::EstadoEnlace;
using comms::MaquinaReconexion;

TEST(MaquinaReconexion, PrimerIntentoInmediato) {
    MaquinaReconexion r(800, 1000);
    EXPECT_EQ(r.estado(), EstadoEnlace::DESCONECTADO);
    EXPECT_TRUE(r.puedeIntentar(0));
    r.inicioIntento(0);
    EXPECT_EQ(r.estado(), EstadoEnlace::CONECTANDO);
    EXPECT_FALSE(r.puedeIntentar(5000));
    EXPECT_EQ(r.intentos(), 1u);
}

TEST(MaquinaReconexion, SinDispositivoEsperaUnSegundo) {
    MaquinaReconexion r(800, 1000);
    r.inicioIntento(0);
    r.sinDispositivo(100);
    EXPECT_EQ(r.estado(), EstadoEnlace::DESCONECTADO);
    EXPECT_EQ(r.esperaRestante(600), 500u);
    EXPECT_FALSE(r.puedeIntentar(1099));
    EXPECT_TRUE(r.puedeIntentar(1100));
    EXPECT_EQ(r.esperaRestante(1100), 0u);
}

TEST(MaquinaReconexion, FalloEsperaBackoff) {
    MaquinaReconexion r(800, 1000);
    r.inicioIntento(0);
    r.conectado(50);
    EXPECT_EQ(r.estado(), EstadoEnlace::CONECTADO);
    EXPECT_EQ(r.esperaRestante(60), 0u);
    r.fallo(2000);
    EXPECT_EQ(r.fallos(), 1u);
    EXPECT_FALSE(r.puedeIntentar(2799));
    EXPECT_TRUE(r.puedeIntentar(2800));
}

TEST(MaquinaReconexion, CuentaReconexiones) {
    MaquinaReconexion r(800, 1000);
    r.inicioIntento(0);
    r.conectado(10);
    EXPECT_EQ(r.reconexiones(), 0u);
    r.fallo(100);
    r.inicioIntento(900);
    r.conectado(950);
    EXPECT_EQ(r.reconexiones(), 1u);
    EXPECT_EQ(r.intentos(), 2u);
    EXPECT_EQ(r.conectadoDesdeMs(), 950u);
}

TEST(MaquinaReconexion, ToleraDesbordeDeMillis) {
    MaquinaReconexion r(800, 1000);
    const uint32_t t0 = 0xFFFFFF00u;
    r.inicioIntento(t0);
    r.sinDispositivo(t0);
    EXPECT_FALSE(r.puedeIntentar(t0 + 999u));
    EXPECT_TRUE(r.puedeIntentar(t0 + 1000u));
}

TEST(MaquinaReconexion, Nombres) {
    EXPECT_STREQ(comms::nombreEstadoEnlace(EstadoEnlace::CONECTANDO), "CONECTANDO");
}

TEST(PedidoEnlace, SinEnlaceSeDescartaYNoQuedaPendiente) {
    comms::PedidoEnlace cero;
    EXPECT_FALSE(cero.solicitar(EstadoEnlace::DESCONECTADO));
    EXPECT_FALSE(cero.solicitar(EstadoEnlace::CONECTANDO));
    EXPECT_FALSE(cero.pendiente());
    // La conexión posterior no envía nada
    MaquinaReconexion r(800, 1000);
    r.inicioIntento(0);
    r.conectado(20);
    EXPECT_FALSE(cero.tomar());
}

TEST(PedidoEnlace, ConEnlaceSeEnviaUnaSolaVez) {
    comms::PedidoEnlace cero;
    EXPECT_TRUE(cero.solicitar(EstadoEnlace::CONECTADO));
    EXPECT_TRUE(cero.tomar());
    EXPECT_FALSE(cero.tomar());
}

TEST(PedidoEnlace, NuevoEnlaceDescartaPedidoViejo) {
    comms::PedidoEnlace cero;
    ASSERT_TRUE(cero.solicitar(EstadoEnlace::CONECTADO));
    // Enlace perdido antes de enviar y reconexión
    cero.descartar();
    EXPECT_FALSE(cero.pendiente());
    EXPECT_FALSE(cero.tomar());
}
