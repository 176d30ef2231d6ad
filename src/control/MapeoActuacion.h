/**
 * @file MapeoActuacion.h
 * @brief Ángulo calibrado -> (acelerador, reversa) con zona muerta y curva de potencia.
 */
#pragma once
#include "config/ConfigSesion.h"

namespace control {

// Fracciones 0..1 mutuamente excluyentes
struct Actuacion { float acelerador; float reversa; };

/**
 * @brief Mapea el ángulo calibrado a actuación.
 *
 * Plantar (positivo) acelera, dorsi (negativo) da reversa. Con gamma < 1 la respuesta
 * es más sensible cerca del borde de la zona muerta.
 */
Actuacion mapearActuacion(float angulo, const config::SesionTuning& cfg);

/** @brief px/s -> km/h usando la escala px_por_m. */
float kmhDesdePxps(float pxps, float px_por_m);

} // namespace control
