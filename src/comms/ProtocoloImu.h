/**
 * @file ProtocoloImu.h
 * @brief Decodificación de las líneas de texto que envía el IMU de tobillo por SPP.
 *
 * Formatos aceptados (una muestra por línea, terminada en '\n'):
 *  - `ANG:<float>`  ángulo en grados
 *  - `VBAT:<float>` tensión de batería en voltios
 *  - `<float>`      ángulo sin prefijo (firmware antiguo)
 * Cualquier otra cosa se descarta sin error.
 */
#pragma once
#include <cstdint>

namespace comms {

enum class TipoLinea : uint8_t { DESCARTADA, ANGULO, BATERIA };

struct LineaImu {
    TipoLinea tipo = TipoLinea::DESCARTADA;
    float valor = 0.0f;
};

/**
 * @brief Interpreta una línea recibida del IMU.
 * @param linea Texto terminado en '\0' (puede traer espacios o "\r").
 */
LineaImu parsearLinea(const char* linea);

} // namespace comms
