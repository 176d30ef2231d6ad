#include "ModeloCinematico.h"
#include <cmath>
#include "utils/Filtros.h"

namespace control {

static const float BANDA_MOVIMIENTO_PXPS = 8.0f;
static const float FACTOR_CAPA_LEJANA = 0.6f;

void ModeloCinematico::paso(const Actuacion& act, float dt, bool habilitado) {
    if (!habilitado) {
        // Reset duro, no decaimiento
        st_.aceleracion = 0.0f;
        st_.velocidad = 0.0f;
        return;
    }
    st_.aceleracion = cfg_.a_max*act.acelerador - cfg_.a_rev_max*act.reversa - cfg_.arrastre*(st_.velocidad / cfg_.v_max);
    st_.velocidad += st_.aceleracion * dt;
    st_.velocidad = utils::clip(st_.velocidad, -cfg_.v_rev_max, cfg_.v_max);

    const float dx = st_.velocidad * dt;
    st_.desplaz_ruta += dx;
    st_.desplaz_medio += dx;
    st_.desplaz_lejano += dx * FACTOR_CAPA_LEJANA;
    st_.distancia += dx;
    st_.dist_abs_m += std::fabs(st_.velocidad) * dt / cfg_.px_por_m;
    st_.t_activo_s += dt;
}

float ModeloCinematico::velocidadKmh() const {
    return kmhDesdePxps(std::fabs(st_.velocidad), cfg_.px_por_m);
}

float ModeloCinematico::velocidadMediaKmh() const {
    if (st_.t_activo_s <= 0.0f) return 0.0f;
    return st_.dist_abs_m / st_.t_activo_s * 3.6f;
}

Direccion ModeloCinematico::estadoMovimiento() const {
    if (st_.velocidad > BANDA_MOVIMIENTO_PXPS) return Direccion::ADELANTE;
    if (st_.velocidad < -BANDA_MOVIMIENTO_PXPS) return Direccion::REVERSA;
    return Direccion::NEUTRO;
}

} // namespace control
