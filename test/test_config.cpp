#include <gtest/gtest.h>
#include "config/ConfigPerfil.h"

TEST(ConfigPerfil, ValoresPorDefecto) {
    config::ConfigPerfil p = config::cargarConfigDefault();
    EXPECT_STREQ(p.sensor.nombre_dispositivo, "ESP32_WROOM_IMU");
    EXPECT_EQ(p.sensor.backoff_fallo_ms, 800u);
    EXPECT_EQ(p.sensor.espera_sin_dispositivo_ms, 1000u);
    EXPECT_FLOAT_EQ(p.sensor.umbral_bateria_baja_v, 3.6f);
    EXPECT_EQ(p.sesion.reps_por_direccion, 5);
    EXPECT_FLOAT_EQ(p.sesion.cuenta_regresiva_s, 8.0f);
    EXPECT_EQ(p.logging.lineas_recientes, 64u);
    EXPECT_EQ(p.consola.baudios, 115200u);
}

TEST(SesionTuning, DefaultEsValido) {
    const char* motivo = nullptr;
    EXPECT_TRUE(config::validarSesionTuning(config::obtenerSesionTuningDefault(), &motivo));
    EXPECT_EQ(motivo, nullptr);
}

TEST(SesionTuning, HisteresisInvertidaEsInvalida) {
    config::SesionTuning t;
    t.umbral_salida_deg = 3.0f;
    t.umbral_entrada_deg = 3.0f;
    const char* motivo = nullptr;
    EXPECT_FALSE(config::validarSesionTuning(t, &motivo));
    ASSERT_NE(motivo, nullptr);
}

TEST(SesionTuning, ValoresFueraDeRango) {
    config::SesionTuning t;
    t.reps_por_direccion = 0;
    EXPECT_FALSE(config::validarSesionTuning(t));
    t = config::SesionTuning{};
    t.px_por_m = 0.0f;
    EXPECT_FALSE(config::validarSesionTuning(t));
    t = config::SesionTuning{};
    t.cuenta_regresiva_s = -1.0f;
    EXPECT_FALSE(config::validarSesionTuning(t));
    t = config::SesionTuning{};
    t.cuenta_regresiva_s = 0.0f;
    EXPECT_TRUE(config::validarSesionTuning(t));
}

TEST(SesionTuning, CinematicaYAsentamientoNegativosSonInvalidos) {
    const char* motivo = nullptr;
    config::SesionTuning t;
    t.tolerancia_asentamiento_deg = -0.5f;
    EXPECT_FALSE(config::validarSesionTuning(t, &motivo));
    EXPECT_STREQ(motivo, "tolerancia_asentamiento_deg negativa");
    t = config::SesionTuning{};
    t.arrastre = -1.0f;
    EXPECT_FALSE(config::validarSesionTuning(t));
    t = config::SesionTuning{};
    t.a_max = -10.0f;
    EXPECT_FALSE(config::validarSesionTuning(t));
    t = config::SesionTuning{};
    t.a_rev_max = -10.0f;
    EXPECT_FALSE(config::validarSesionTuning(t));
    t = config::SesionTuning{};
    t.tolerancia_asentamiento_deg = 0.0f;
    t.arrastre = 0.0f;
    EXPECT_TRUE(config::validarSesionTuning(t));
}
