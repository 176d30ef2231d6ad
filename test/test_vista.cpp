#include <gtest/gtest.h>
#include <cmath>
#include "control/VistaSesion.h"

using namespace control;

namespace {

const float DT = 0.25f;
const float UMBRAL_V = 3.6f;

void correr(MotorSesion& m, float angulo, int ticks) {
    EntradaTick in;
    in.angulo_crudo = angulo;
    in.hay_angulo = true;
    for (int i = 0; i < ticks; ++i) m.tick(in, DT);
}

EstadoBateria bateria(float v) {
    EstadoBateria b;
    b.hay_lectura = true;
    b.voltaje = v;
    return b;
}

// Calibrado, iniciado y con la cuenta regresiva terminada (fase 0, TRÁS)
void hastaPrimeraFase(MotorSesion& m) {
    correr(m, 0.0f, 16);
    m.iniciar();
    correr(m, 0.0f, 32);
}

} // namespace

TEST(VistaSesion, CalibrandoTienePrioridad) {
    MotorSesion m(config::SesionTuning{});
    VistaSesion v = construirVista(m, bateria(3.2f), UMBRAL_V);
    EXPECT_EQ(v.aviso, Aviso::CALIBRANDO);
    EXPECT_TRUE(v.bateria_baja);
    EXPECT_FALSE(v.hay_barra);
}

TEST(VistaSesion, BateriaBajaAntesQueEsperandoInicio) {
    MotorSesion m(config::SesionTuning{});
    correr(m, 0.0f, 16);
    EXPECT_EQ(construirVista(m, bateria(3.5f), UMBRAL_V).aviso, Aviso::BATERIA_BAJA);
    VistaSesion v = construirVista(m, bateria(3.7f), UMBRAL_V);
    EXPECT_EQ(v.aviso, Aviso::ESPERANDO_INICIO);
    EXPECT_FALSE(v.hay_tiempo);
    EXPECT_EQ(v.reps_totales, 10u);
    EXPECT_FALSE(construirVista(m, EstadoBateria{}, UMBRAL_V).bateria_baja);
}

TEST(VistaSesion, CuentaRegresivaRedondeaHaciaArriba) {
    MotorSesion m(config::SesionTuning{});
    correr(m, 0.0f, 16);
    m.iniciar();
    correr(m, 0.0f, 1);
    VistaSesion v = construirVista(m, EstadoBateria{}, UMBRAL_V);
    EXPECT_EQ(v.aviso, Aviso::CUENTA_REGRESIVA);
    EXPECT_EQ(v.segundos_cuenta, 8);
    correr(m, 0.0f, 3);
    EXPECT_EQ(construirVista(m, EstadoBateria{}, UMBRAL_V).segundos_cuenta, 7);
}

TEST(VistaSesion, FaseTrasConBarraYMeta) {
    MotorSesion m(config::SesionTuning{});
    hastaPrimeraFase(m);
    correr(m, -25.0f, 1);
    VistaSesion v = construirVista(m, EstadoBateria{}, UMBRAL_V);
    EXPECT_EQ(v.aviso, Aviso::FASE_TRAS);
    EXPECT_EQ(v.tendencia, TendenciaAngular::DORSI);
    EXPECT_EQ(v.comando, Direccion::REVERSA);

    correr(m, -25.0f, 1);
    v = construirVista(m, EstadoBateria{}, UMBRAL_V);
    ASSERT_TRUE(v.hay_barra);
    EXPECT_EQ(v.fase, TipoFase::REP_TRAS);
    EXPECT_FLOAT_EQ(v.barra_total_s, 10.0f);
    EXPECT_FLOAT_EQ(v.barra_restante_s, 9.5f);
    EXPECT_NEAR(v.barra_progreso, 0.05f, 1e-5f);
    EXPECT_TRUE(v.meta_visible);
    EXPECT_FLOAT_EQ(v.meta_deg, -20.0f);
    EXPECT_TRUE(v.meta_cumplida);
    EXPECT_EQ(v.tendencia, TendenciaAngular::ESTABLE);
    EXPECT_FLOAT_EQ(v.angulo_deg, -25.0f);
    EXPECT_TRUE(v.hay_tiempo);
}

TEST(VistaSesion, TransicionMuestraAsentamientoPendiente) {
    MotorSesion m(config::SesionTuning{});
    hastaPrimeraFase(m);
    correr(m, -25.0f, 40);
    correr(m, 0.0f, 4);
    VistaSesion v = construirVista(m, EstadoBateria{}, UMBRAL_V);
    EXPECT_EQ(v.aviso, Aviso::FASE_TRANSICION);
    ASSERT_TRUE(v.hay_barra);
    EXPECT_FLOAT_EQ(v.barra_total_s, 3.0f);
    EXPECT_FLOAT_EQ(v.barra_restante_s, 2.0f);
    EXPECT_FALSE(v.meta_visible);
    EXPECT_EQ(v.reps_hechas, 1u);
    EXPECT_FLOAT_EQ(v.velocidad_kmh, 0.0f);
}

TEST(VistaSesion, BateriaBajaNoDetieneLaSesion) {
    MotorSesion m(config::SesionTuning{});
    hastaPrimeraFase(m);
    correr(m, 25.0f, 8);
    VistaSesion v = construirVista(m, bateria(3.4f), UMBRAL_V);
    EXPECT_EQ(v.aviso, Aviso::BATERIA_BAJA);
    EXPECT_TRUE(v.hay_barra);
    EXPECT_FLOAT_EQ(v.barra_restante_s, 8.0f);
    EXPECT_GT(v.velocidad_kmh, 0.0f);
    EXPECT_EQ(v.movimiento, Direccion::ADELANTE);
    EXPECT_FALSE(v.meta_cumplida);  // TRÁS con el pie hacia adelante
}

TEST(VistaSesion, SesionCompleta) {
    config::SesionTuning cfg;
    cfg.reps_por_direccion = 1;
    MotorSesion m(cfg);
    hastaPrimeraFase(m);
    correr(m, 0.0f, 40 + 12 + 40 + 12);
    ASSERT_EQ(m.estado().etapa, EtapaSesion::COMPLETA);
    VistaSesion v = construirVista(m, EstadoBateria{}, UMBRAL_V);
    EXPECT_EQ(v.aviso, Aviso::SESION_COMPLETA);
    EXPECT_FALSE(v.hay_barra);
    EXPECT_EQ(v.reps_hechas, 2u);
    EXPECT_EQ(v.reps_totales, 2u);
}

TEST(VistaSesion, FormatoMinutosSegundos) {
    char buf[12];
    formatearMmSs(125.7f, buf, sizeof(buf));
    EXPECT_STREQ(buf, "02:05");
    formatearMmSs(-3.0f, buf, sizeof(buf));
    EXPECT_STREQ(buf, "00:00");
    EXPECT_STREQ(nombreAviso(Aviso::FASE_FRENTE), "FRENTE");
}
