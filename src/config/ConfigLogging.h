/**
 * @file ConfigLogging.h
 * @brief Parámetros del Logger: severidad mínima, destinos, archivo rotativo y buffer en RAM.
 */
#pragma once
#include <cstddef>
#include <cstdint>

namespace config {

/** @brief Severidad, en orden creciente. NONE no se emite nunca. */
enum class LogLevel : uint8_t { TRACE = 0, DEBUG, INFO, WARN, ERROR, CRITICAL, NONE };

/**
 * @brief Qué salidas registradas reciben líneas.
 *
 * Las salidas se conectan aparte (Serial/SPIFFS en el dispositivo, captura en
 * pruebas); el modo sólo elige cuáles se usan.
 */
enum class LogMode : uint8_t { DESHABILITADO = 0, SOLO_SERIAL, SOLO_ARCHIVO, SERIAL_Y_ARCHIVO };

struct LoggingConfig {
    LogLevel nivel_minimo = LogLevel::INFO;
    // El USB comparte puerto con el reporte JSON; el archivo se activa a mano
    LogMode  modo = LogMode::SOLO_SERIAL;
    const char* ruta_archivo = "/log.txt";    // SPIFFS
    size_t tam_max_archivo = 200*1024;         // al superarlo se rota a .old
    size_t lineas_recientes = 64;              // buffer circular en RAM
};

/** @brief Defaults; REHAB_LOG_LEVEL_DEFAULT (0..4) fija el nivel en compilación. */
LoggingConfig obtenerLoggingConfigDefault();

} // namespace config
