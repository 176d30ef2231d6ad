/**
 * @file ModuloSesion.h
 * @brief Bucle de sesión a ~60 Hz: toma la última lectura del IMU, ejecuta un tick del
 *        motor y publica estado periódico y reporte final por Serial.
 */
#pragma once
#include <Arduino.h>
#include "core/Modulo.h"
#include "config/ConfigPerfil.h"
#include "control/Comandos.h"
#include "control/MotorSesion.h"
#include "control/VistaSesion.h"
#include "comms/SensorImuBT.h"

namespace modulos {

class ModuloSesion : public core::Modulo {
public:
    /** @param sensor Puede ser nullptr si el sensor está deshabilitado en el perfil. */
    ModuloSesion(const config::ConfigPerfil& perfil, comms::SensorImuBT* sensor)
        : sensor_cfg_(perfil.sensor), consola_cfg_(perfil.consola), motor_(perfil.sesion), sensor_(sensor) {}

    const char* nombre() const override { return "SESION"; }

    bool iniciar() override;
    void actualizar() override;
    /** Publica el reporte si quedó alguna repetición sin publicar. */
    void detener() override;

    /** @brief Entrada desde la consola (excepto SALIR, que gestiona main). */
    void onComando(control::Comando c);

    const control::MotorSesion& motor() const { return motor_; }

private:
    void imprimirEstado();
    void publicarReporte();

    config::SensorConfig sensor_cfg_;
    config::ConsolaConfig consola_cfg_;
    control::MotorSesion motor_;
    comms::SensorImuBT* sensor_;
    control::EstadoBateria bateria_{};
    bool bateria_baja_ = false;
    bool reporte_publicado_ = false;
    bool primer_tick_ = true;
    uint32_t t_prev_us_ = 0;
    uint32_t t_estado_ms_ = 0;
    uint32_t ticks_ = 0;
};

} // namespace modulos
