#include "Comandos.h"

namespace control {

Comando comandoDesdeTecla(char c) {
    switch (c) {
        case ' ':            return Comando::INICIAR;
        case 'r': case 'R':  return Comando::REINICIAR;
        case 'c': case 'C':  return Comando::RECALIBRAR;
        case 'z': case 'Z':  return Comando::CERO_DISPOSITIVO;
        case 's': case 'S':  return Comando::ESTADO;
        case 'q': case 'Q':
        case 0x1B:           return Comando::SALIR;
        default:             return Comando::NINGUNO;
    }
}

const char* nombreComando(Comando c) {
    switch (c) {
        case Comando::INICIAR:          return "iniciar";
        case Comando::REINICIAR:        return "reiniciar";
        case Comando::RECALIBRAR:       return "recalibrar";
        case Comando::CERO_DISPOSITIVO: return "cero_dispositivo";
        case Comando::ESTADO:           return "estado";
        case Comando::SALIR:            return "salir";
        default:                        return "ninguno";
    }
}

bool aplicarComando(MotorSesion& motor, Comando c) {
    switch (c) {
        case Comando::INICIAR:    return motor.iniciar();
        case Comando::REINICIAR:  return motor.reiniciar();
        case Comando::RECALIBRAR: motor.recalibrar(); return true;
        default:                  return false;
    }
}

} // namespace control
