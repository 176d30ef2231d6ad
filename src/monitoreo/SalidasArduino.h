/**
 * @file SalidasArduino.h
 * @brief Conecta el Logger al hardware: Serial, archivo rotativo en SPIFFS y reloj millis().
 */
#pragma once
#include "config/ConfigLogging.h"

namespace monitoreo {

/**
 * @brief Registra las salidas físicas según el modo configurado y fija el reloj.
 * @return false si el modo pide archivo y SPIFFS no montó (Serial sigue activo).
 */
bool conectarSalidasArduino(const config::LoggingConfig& cfg);

/** @brief Código de esp_reset_reason() para registrarBoot(). */
int razonReinicio();

} // namespace monitoreo
