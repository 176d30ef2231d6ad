#include "ConfigSesion.h"

namespace config {

SesionTuning obtenerSesionTuningDefault() {
    return SesionTuning{};
}

static bool fallar(const char** motivo, const char* texto) {
    if (motivo) *motivo = texto;
    return false;
}

bool validarSesionTuning(const SesionTuning& t, const char** motivo) {
    if (t.zona_muerta_deg < 0.0f) return fallar(motivo, "zona_muerta_deg negativa");
    if (t.angulo_max_adelante_deg <= 0.0f || t.angulo_max_reversa_deg <= 0.0f)
        return fallar(motivo, "angulo_max debe ser > 0");
    if (t.gamma_adelante <= 0.0f || t.gamma_reversa <= 0.0f) return fallar(motivo, "gamma debe ser > 0");
    if (t.v_max <= 0.0f || t.v_rev_max < 0.0f) return fallar(motivo, "limites de velocidad invalidos");
    if (t.a_max < 0.0f || t.a_rev_max < 0.0f) return fallar(motivo, "aceleracion negativa");
    if (t.arrastre < 0.0f) return fallar(motivo, "arrastre negativo");
    if (t.px_por_m <= 0.0f) return fallar(motivo, "px_por_m debe ser > 0");
    if (t.umbral_salida_deg >= t.umbral_entrada_deg)
        return fallar(motivo, "umbral_salida debe ser menor que umbral_entrada");
    if (t.reps_por_direccion == 0) return fallar(motivo, "reps_por_direccion = 0");
    if (t.t_repeticion_s <= 0.0f) return fallar(motivo, "t_repeticion_s debe ser > 0");
    if (t.t_descanso_s < 0.0f) return fallar(motivo, "t_descanso_s negativo");
    if (t.tolerancia_asentamiento_deg < 0.0f) return fallar(motivo, "tolerancia_asentamiento_deg negativa");
    if (t.t_asentamiento_s <= 0.0f || t.t_asentamiento_max_s <= 0.0f)
        return fallar(motivo, "tiempos de asentamiento invalidos");
    if (t.t_calibracion_s <= 0.0f) return fallar(motivo, "t_calibracion_s debe ser > 0");
    if (t.cuenta_regresiva_s < 0.0f) return fallar(motivo, "cuenta_regresiva_s negativa");
    return true;
}

} // namespace config
