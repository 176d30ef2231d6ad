#include "MapeoActuacion.h"
#include <cmath>
#include "utils/Filtros.h"

namespace control {

Actuacion mapearActuacion(float angulo, const config::SesionTuning& cfg) {
    const float dz = cfg.zona_muerta_deg;
    if (std::fabs(angulo) < dz) return Actuacion{ 0.0f, 0.0f };
    const float a_eff = std::copysign(std::fabs(angulo) - dz, angulo);
    if (a_eff > 0.0f) {
        float t = utils::clip(a_eff / cfg.angulo_max_adelante_deg, 0.0f, 1.0f);
        return Actuacion{ std::pow(t, cfg.gamma_adelante), 0.0f };
    }
    float t = utils::clip(-a_eff / cfg.angulo_max_reversa_deg, 0.0f, 1.0f);
    return Actuacion{ 0.0f, std::pow(t, cfg.gamma_reversa) };
}

float kmhDesdePxps(float pxps, float px_por_m) {
    return (pxps / px_por_m) * 3.6f;
}

} // namespace control
