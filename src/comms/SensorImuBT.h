/**
 * @file SensorImuBT.h
 * @brief Lector del IMU de tobillo por Bluetooth Classic (SPP) en una tarea dedicada.
 *
 * La consola actúa como master y se conecta por nombre al IMU. La tarea lee líneas
 * `ANG:`/`VBAT:`, filtra el ángulo con un pasa-bajos y publica la última lectura en
 * `SensorPipeline`. Ante cualquier fallo cierra el enlace y reintenta según
 * `MaquinaReconexion`; el bucle de sesión nunca se bloquea por el sensor.
 */
#pragma once
#include <Arduino.h>
#include <BluetoothSerial.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include "core/Modulo.h"
#include "config/ConfigPerfil.h"
#include "comms/MaquinaReconexion.h"
#include "utils/Filtros.h"

namespace comms {

class SensorImuBT : public core::Modulo {
public:
    explicit SensorImuBT(const config::SensorConfig& cfg)
        : cfg_(cfg), reconexion_(cfg.backoff_fallo_ms, cfg.espera_sin_dispositivo_ms), filtro_(cfg.alpha_filtro) {}

    const char* nombre() const override { return "IMU_BT"; }

    /** @brief Crea el canal de publicación, arranca el stack BT y lanza la tarea en Core0. */
    bool iniciar() override;
    /** @brief Registra cambios de estado del enlace (la lectura la hace la tarea). */
    void actualizar() override;
    /** @brief Pide a la tarea que cierre el enlace y termine. */
    void detener() override;

    /** Pide al firmware del IMU que tome su ángulo actual como cero. Sin enlace no hace nada. */
    void solicitarCero();

    EstadoEnlace estadoEnlace() const { return estado_publicado_; }
    uint32_t lineasDescartadas() const { return descartadas_; }

private:
    config::SensorConfig cfg_;
    BluetoothSerial bt_;
    MaquinaReconexion reconexion_;
    utils::FiltroPasaBajos filtro_;
    TaskHandle_t task_handle_ = nullptr;

    PedidoEnlace pedido_cero_;
    volatile bool parar_ = false;
    volatile bool tarea_activa_ = false;
    volatile EstadoEnlace estado_publicado_ = EstadoEnlace::DESCONECTADO;
    volatile uint32_t descartadas_ = 0;
    EstadoEnlace ultimo_estado_log_ = EstadoEnlace::DESCONECTADO;

    // Última lectura completa (ángulo y batería se publican juntos)
    uint32_t seq_ = 0;
    float ultimo_angulo_ = 0.0f;
    bool hay_angulo_ = false;
    float bateria_v_ = 0.0f;
    bool hay_bateria_ = false;

    static void taskEntry(void* self);
    void taskLoop();
    bool intentarConexion();
    void cerrarEnlace();
    void publicar();
};

} // namespace comms
