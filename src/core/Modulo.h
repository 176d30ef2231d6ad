#pragma once

namespace core {

// Clase base para todos los módulos del sistema. Permite un ciclo de vida homogéneo.
class Modulo {
public:
    virtual ~Modulo() = default;

    // Nombre corto usado en logs.
    virtual const char* nombre() const = 0;

    // Se invoca una sola vez durante el arranque del sistema.
    virtual bool iniciar() { return true; }

    // Se invoca en cada iteración del bucle principal.
    virtual void actualizar() {}

    // Se invoca antes de un apagado controlado (comando salir).
    virtual void detener() {}
};

} // namespace core
