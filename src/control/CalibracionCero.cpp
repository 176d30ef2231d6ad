#include "CalibracionCero.h"

namespace control {

bool CalibracionCero::agregar(float muestra, float dt) {
    if (!activa_) return false;
    promedio_.agregar(muestra);
    if (dt > 0.0f) t_s_ += dt;
    if (t_s_ < duracion_s_) return false;
    cero_ = promedio_.media();
    activa_ = false;
    return true;
}

} // namespace control
