/**
 * @file SecuenciaFases.h
 * @brief Protocolo de fases: bloques TRÁS / TRANSICIÓN / FRENTE / TRANSICIÓN.
 */
#pragma once
#include <cstdint>
#include <vector>
#include "config/ConfigSesion.h"

namespace control {

enum class TipoFase : uint8_t { REP_TRAS, REP_FRENTE, TRANSICION, DESCANSO };

struct DefinicionFase {
    TipoFase tipo;
    float duracion_s; // nominal; en TRANSICION es el máximo
};

/** @brief Genera 4*reps_por_direccion fases en orden determinista. */
std::vector<DefinicionFase> generarSecuencia(const config::SesionTuning& cfg);

const char* nombreFase(TipoFase t);
inline bool esRepeticion(TipoFase t) { return t == TipoFase::REP_TRAS || t == TipoFase::REP_FRENTE; }

} // namespace control
