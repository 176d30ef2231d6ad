/**
 * @file ClasificadorDireccion.h
 * @brief Estado de comando {neutro, adelante, reversa} con histéresis de entrada/salida.
 */
#pragma once
#include <cstdint>

namespace control {

enum class Direccion : uint8_t { NEUTRO, ADELANTE, REVERSA };

const char* nombreDireccion(Direccion d);

class ClasificadorDireccion {
public:
    /**
     * @param umbral_entrada Ángulo |a| >= E para salir de neutro
     * @param umbral_salida  Ángulo bajo el cual se vuelve a neutro (X < E)
     */
    ClasificadorDireccion(float umbral_entrada, float umbral_salida)
        : entrada_(umbral_entrada), salida_(umbral_salida) {}

    Direccion actualizar(float angulo);
    void forzarNeutro() { estado_ = Direccion::NEUTRO; }
    Direccion estado() const { return estado_; }

private:
    float entrada_;
    float salida_;
    Direccion estado_ = Direccion::NEUTRO;
};

} // namespace control
