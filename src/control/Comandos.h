/**
 * @file Comandos.h
 * @brief Superficie de control: teclas de la consola -> comandos de sesión.
 */
#pragma once
#include <cstdint>
#include "control/MotorSesion.h"

namespace control {

enum class Comando : uint8_t {
    NINGUNO,
    INICIAR,           // espacio
    REINICIAR,         // r / R (sólo con la sesión completa)
    RECALIBRAR,        // c: ventana de cero en el host
    CERO_DISPOSITIVO,  // z: cero en el firmware del IMU
    ESTADO,            // s: volcado de estado
    SALIR              // q / ESC
};

Comando comandoDesdeTecla(char c);
const char* nombreComando(Comando c);

/**
 * @brief Aplica al motor los comandos que le corresponden (iniciar, reiniciar, recalibrar).
 * @return true si el motor aceptó el comando.
 */
bool aplicarComando(MotorSesion& motor, Comando c);

} // namespace control
