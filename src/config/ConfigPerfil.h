/**
 * @file ConfigPerfil.h
 * @brief Estructuras agregadas de configuración de alto nivel (logging, sensor, sesión, consola).
 */
#pragma once
#include <cstdint>
#include "ConfigLogging.h"
#include "ConfigSesion.h"

namespace config {

/** @brief Enlace Bluetooth SPP con el IMU de tobillo y acondicionamiento en origen. */
struct SensorConfig {
    bool habilitar_sensor = true;
    const char* nombre_dispositivo = "ESP32_WROOM_IMU"; // nombre anunciado por el IMU
    const char* nombre_local = "RehabRacer";             // nombre de esta consola en modo master
    uint32_t timeout_lectura_ms = 1000;
    uint32_t backoff_fallo_ms = 800;        // tras perder el enlace
    uint32_t espera_sin_dispositivo_ms = 1000;
    float alpha_filtro = 0.25f;
    float umbral_bateria_baja_v = 3.6f;
    char comando_cero = 'z';                // pedido de cero en el firmware del IMU
    // Tarea
    uint32_t stack_tarea = 6144;
    uint8_t prioridad_tarea = 2;
    uint8_t core_tarea = 0;
};

/** @brief Consola serie (teclas de control) y cadencia del bucle de sesión. */
struct ConsolaConfig {
    uint32_t baudios = 115200;
    uint32_t periodo_tick_us = 16667;     // ~60 Hz
    uint32_t periodo_estado_ms = 5000;    // volcado periódico de estado
    bool eco_teclas = false;
};

// Perfil completo que agrupa todos los sub-configs
/** @brief Perfil completo del sistema combinando todos los sub-módulos. */
struct ConfigPerfil {
    LoggingConfig logging = obtenerLoggingConfigDefault();
    SensorConfig  sensor{};
    SesionTuning  sesion = obtenerSesionTuningDefault();
    ConsolaConfig consola{};
};

ConfigPerfil cargarConfigDefault(); // En futuro cargar desde NVS / archivo

} // namespace config
