#include "VistaSesion.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include "utils/Filtros.h"

namespace control {

static const float UMBRAL_TENDENCIA_DEG_S = 1.0f;

const char* nombreAviso(Aviso a) {
    switch (a) {
        case Aviso::CALIBRANDO:       return "CALIBRANDO";
        case Aviso::BATERIA_BAJA:     return "BATERIA_BAJA";
        case Aviso::ESPERANDO_INICIO: return "ESPERANDO_INICIO";
        case Aviso::CUENTA_REGRESIVA: return "CUENTA_REGRESIVA";
        case Aviso::SESION_COMPLETA:  return "SESION_COMPLETA";
        case Aviso::FASE_TRAS:        return "TRAS";
        case Aviso::FASE_FRENTE:      return "FRENTE";
        case Aviso::FASE_TRANSICION:  return "TRANSICION";
        default:                      return "DESCANSO";
    }
}

static Aviso avisoDeFase(TipoFase t) {
    switch (t) {
        case TipoFase::REP_TRAS:   return Aviso::FASE_TRAS;
        case TipoFase::REP_FRENTE: return Aviso::FASE_FRENTE;
        case TipoFase::TRANSICION: return Aviso::FASE_TRANSICION;
        default:                   return Aviso::FASE_DESCANSO;
    }
}

VistaSesion construirVista(const MotorSesion& m, const EstadoBateria& bat, float umbral_bateria_v) {
    VistaSesion v;
    const EstadoSesion& st = m.estado();
    const config::SesionTuning& cfg = m.tuning();
    const DefinicionFase* fase = m.faseActual();

    v.bateria_baja = bateriaBaja(bat, umbral_bateria_v);
    v.bateria_v = bat.voltaje;

    if (m.calibracion().activa())                        v.aviso = Aviso::CALIBRANDO;
    else if (v.bateria_baja)                             v.aviso = Aviso::BATERIA_BAJA;
    else if (st.etapa == EtapaSesion::NO_INICIADA)       v.aviso = Aviso::ESPERANDO_INICIO;
    else if (st.etapa == EtapaSesion::CUENTA_REGRESIVA)  v.aviso = Aviso::CUENTA_REGRESIVA;
    else if (st.etapa == EtapaSesion::COMPLETA)          v.aviso = Aviso::SESION_COMPLETA;
    else if (fase)                                       v.aviso = avisoDeFase(fase->tipo);
    v.segundos_cuenta = (int)std::ceil(std::max(0.0f, st.cuenta_regresiva_s));

    if (fase && m.controlable()) {
        v.fase = fase->tipo;
        v.hay_barra = true;
        if (fase->tipo == TipoFase::TRANSICION) {
            // La barra muestra lo que falta de permanencia continua en el cero
            v.barra_total_s = std::max(cfg.t_asentamiento_s, 0.01f);
            v.barra_restante_s = std::max(0.0f, v.barra_total_s - st.t_en_cero);
        } else {
            v.barra_total_s = std::max(fase->duracion_s, 0.01f);
            v.barra_restante_s = std::max(0.0f, st.t_restante_fase);
        }
        v.barra_progreso = 1.0f - utils::clip(v.barra_restante_s / v.barra_total_s, 0.0f, 1.0f);

        if (fase->tipo == TipoFase::REP_FRENTE) {
            v.meta_visible = true;
            v.meta_deg = cfg.meta_frente_deg;
            v.meta_cumplida = st.angulo_control >= cfg.meta_frente_deg;
        } else if (fase->tipo == TipoFase::REP_TRAS) {
            v.meta_visible = true;
            v.meta_deg = cfg.meta_tras_deg;
            v.meta_cumplida = st.angulo_control <= cfg.meta_tras_deg;
        }
    }

    v.hay_tiempo = st.etapa != EtapaSesion::NO_INICIADA;
    v.t_sesion_s = st.t_sesion_s;
    v.reps_hechas = st.reps_completadas;
    v.reps_totales = m.repsTotales();
    v.vmedia_kmh = m.cinematica().velocidadMediaKmh();

    v.velocidad_kmh = m.cinematica().velocidadKmh();
    v.distancia_m = m.cinematica().distanciaM();
    v.angulo_deg = st.angulo_control;
    v.tasa_deg_s = st.tasa_angular;
    if (st.tasa_angular > UMBRAL_TENDENCIA_DEG_S) v.tendencia = TendenciaAngular::PLANTAR;
    else if (st.tasa_angular < -UMBRAL_TENDENCIA_DEG_S) v.tendencia = TendenciaAngular::DORSI;
    v.comando = m.direccionComando();
    v.movimiento = m.cinematica().estadoMovimiento();
    return v;
}

void formatearMmSs(float segundos, char* buf, size_t n) {
    unsigned total = segundos > 0.0f ? (unsigned)segundos : 0u;
    snprintf(buf, n, "%02u:%02u", total / 60u, total % 60u);
}

} // namespace control
