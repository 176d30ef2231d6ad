#include "MaquinaReconexion.h"

namespace comms {

const char* nombreEstadoEnlace(EstadoEnlace e) {
    switch (e) {
        case EstadoEnlace::DESCONECTADO: return "DESCONECTADO";
        case EstadoEnlace::CONECTANDO:   return "CONECTANDO";
        default:                         return "CONECTADO";
    }
}

bool MaquinaReconexion::puedeIntentar(uint32_t ahora_ms) const {
    return estado_ == EstadoEnlace::DESCONECTADO && (uint32_t)(ahora_ms - t_evento_ms_) >= espera_ms_;
}

uint32_t MaquinaReconexion::esperaRestante(uint32_t ahora_ms) const {
    if (estado_ != EstadoEnlace::DESCONECTADO) return 0;
    uint32_t pasado = ahora_ms - t_evento_ms_;
    return pasado >= espera_ms_ ? 0 : espera_ms_ - pasado;
}

void MaquinaReconexion::inicioIntento(uint32_t ahora_ms) {
    estado_ = EstadoEnlace::CONECTANDO;
    t_evento_ms_ = ahora_ms;
    espera_ms_ = 0;
    intentos_++;
}

void MaquinaReconexion::conectado(uint32_t ahora_ms) {
    estado_ = EstadoEnlace::CONECTADO;
    t_evento_ms_ = ahora_ms;
    t_conexion_ms_ = ahora_ms;
    espera_ms_ = 0;
    if (hubo_conexion_) reconexiones_++;
    hubo_conexion_ = true;
}

void MaquinaReconexion::sinDispositivo(uint32_t ahora_ms) {
    estado_ = EstadoEnlace::DESCONECTADO;
    t_evento_ms_ = ahora_ms;
    espera_ms_ = espera_sin_dispositivo_ms_;
}

void MaquinaReconexion::fallo(uint32_t ahora_ms) {
    estado_ = EstadoEnlace::DESCONECTADO;
    t_evento_ms_ = ahora_ms;
    espera_ms_ = backoff_fallo_ms_;
    fallos_++;
}

} // namespace comms
