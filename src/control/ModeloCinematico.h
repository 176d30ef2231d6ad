/**
 * @file ModeloCinematico.h
 * @brief Modelo longitudinal del vehículo: acelerador/reversa + arrastre -> velocidad y distancia.
 */
#pragma once
#include "config/ConfigSesion.h"
#include "control/ClasificadorDireccion.h"
#include "control/MapeoActuacion.h"

namespace control {

struct EstadoCinematico {
    float aceleracion = 0.0f;   // px/s²
    float velocidad = 0.0f;     // px/s, en [-v_rev_max, v_max]
    float distancia = 0.0f;     // px con signo
    // Desplazamiento de capas de fondo (sólo presentación)
    float desplaz_ruta = 0.0f;
    float desplaz_medio = 0.0f;
    float desplaz_lejano = 0.0f;
    // Acumuladores para velocidad media absoluta
    float dist_abs_m = 0.0f;
    float t_activo_s = 0.0f;
};

class ModeloCinematico {
public:
    explicit ModeloCinematico(const config::SesionTuning& cfg) : cfg_(cfg) {}

    /**
     * @brief Integra un tick.
     * @param act Actuación del mapeo
     * @param dt Paso en segundos
     * @param habilitado false => aceleración y velocidad forzadas a 0, sin integrar distancia
     */
    void paso(const Actuacion& act, float dt, bool habilitado);
    void reiniciar() { st_ = EstadoCinematico{}; }

    const EstadoCinematico& estado() const { return st_; }
    float velocidadKmh() const;
    float velocidadMediaKmh() const;
    float distanciaM() const { return st_.distancia / cfg_.px_por_m; }
    /** @brief Movimiento real según la velocidad (banda ±8 px/s). */
    Direccion estadoMovimiento() const;

private:
    config::SesionTuning cfg_;
    EstadoCinematico st_{};
};

} // namespace control
