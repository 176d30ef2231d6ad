#include "SecuenciaFases.h"

namespace control {

std::vector<DefinicionFase> generarSecuencia(const config::SesionTuning& cfg) {
    std::vector<DefinicionFase> seq;
    seq.reserve(4u * cfg.reps_por_direccion);
    for (uint8_t i = 0; i < cfg.reps_por_direccion; ++i) {
        seq.push_back(DefinicionFase{ TipoFase::REP_TRAS,   cfg.t_repeticion_s });
        seq.push_back(DefinicionFase{ TipoFase::TRANSICION, cfg.t_asentamiento_max_s });
        seq.push_back(DefinicionFase{ TipoFase::REP_FRENTE, cfg.t_repeticion_s });
        seq.push_back(DefinicionFase{ TipoFase::TRANSICION, cfg.t_asentamiento_max_s });
    }
    return seq;
}

const char* nombreFase(TipoFase t) {
    switch (t) {
        case TipoFase::REP_TRAS:   return "TRAS";
        case TipoFase::REP_FRENTE: return "FRENTE";
        case TipoFase::TRANSICION: return "TRANSICION";
        default:                   return "DESCANSO";
    }
}

} // namespace control
