#include "ClasificadorDireccion.h"

namespace control {

const char* nombreDireccion(Direccion d) {
    switch (d) {
        case Direccion::ADELANTE: return "adelante";
        case Direccion::REVERSA:  return "reversa";
        default:                  return "neutro";
    }
}

Direccion ClasificadorDireccion::actualizar(float angulo) {
    switch (estado_) {
        case Direccion::NEUTRO:
            if (angulo >= entrada_)       estado_ = Direccion::ADELANTE;
            else if (angulo <= -entrada_) estado_ = Direccion::REVERSA;
            break;
        case Direccion::ADELANTE:
            if (angulo < salida_) estado_ = Direccion::NEUTRO;
            break;
        case Direccion::REVERSA:
            if (angulo > -salida_) estado_ = Direccion::NEUTRO;
            break;
    }
    return estado_;
}

} // namespace control
