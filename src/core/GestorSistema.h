/**
 * @file GestorSistema.h
 * @brief Gestor central que orquesta el ciclo de vida de los módulos registrados.
 */
#pragma once
#include <cstddef>
#include <vector>
#include "Modulo.h"

namespace core {

/** Gestor central: registra módulos y coordina su ciclo de vida (iniciar/loop/detener). */
class GestorSistema {
public:
    static GestorSistema& instancia();

    /** Agrega al final del orden de arranque. nullptr se ignora. */
    void registrar(Modulo* m);
    /**
     * @brief Inicia en orden de registro.
     * @return false ante el primer módulo que falla; lo ya iniciado se detiene en orden inverso.
     */
    bool iniciar();
    void loop();
    /** Apagado controlado en orden inverso. */
    void detener();

    bool iniciado() const { return iniciado_; }
    size_t cantidad() const { return modulos_.size(); }

    /** Vacía el registro (sólo para reconstruir el sistema, p.ej. en pruebas). */
    void limpiar();

private:
    GestorSistema() = default;
    std::vector<Modulo*> modulos_;
    size_t n_iniciados_ = 0;
    bool iniciado_ = false;
};

} // namespace core
