/**
 * @file CalibracionCero.h
 * @brief Ventana de calibración de cero en el host: promedia el ángulo crudo durante
 *        un tiempo fijo y fija el offset restado a todas las lecturas de control.
 */
#pragma once
#include "utils/Filtros.h"

namespace control {

class CalibracionCero {
public:
    explicit CalibracionCero(float duracion_s = 4.0f) : duracion_s_(duracion_s) {}

    /** @brief Abre (o reabre) la ventana: limpia buffer y temporizador. El cero previo se conserva hasta cerrar. */
    void iniciar() { activa_ = true; t_s_ = 0.0f; promedio_.reiniciar(); }

    /**
     * @brief Agrega una muestra y avanza el temporizador de la ventana.
     * @return true si en esta llamada la ventana se cerró y el cero cambió.
     */
    bool agregar(float muestra, float dt);

    bool activa() const { return activa_; }
    float cero() const { return cero_; }
    float transcurrido() const { return t_s_; }
    float duracion() const { return duracion_s_; }
    size_t muestras() const { return promedio_.cantidad(); }

private:
    float duracion_s_;
    bool  activa_ = false;
    float t_s_ = 0.0f;
    float cero_ = 0.0f;
    utils::PromedioAcumulado promedio_;
};

} // namespace control
