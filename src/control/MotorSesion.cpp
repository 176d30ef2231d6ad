#include "MotorSesion.h"
#include <algorithm>
#include <cmath>
#include "monitoreo/LogMacros.h"

namespace control {

const char* nombreEtapa(EtapaSesion e) {
    switch (e) {
        case EtapaSesion::NO_INICIADA:      return "NO_INICIADA";
        case EtapaSesion::CUENTA_REGRESIVA: return "CUENTA_REGRESIVA";
        case EtapaSesion::EN_CURSO:         return "EN_CURSO";
        default:                            return "COMPLETA";
    }
}

// ===================== PASO DE FASES =====================

static void siguienteFase(const std::vector<DefinicionFase>& seq, EstadoSesion& st, EventosFase& ev) {
    st.indice_fase++;
    if (st.indice_fase >= seq.size()) {
        st.etapa = EtapaSesion::COMPLETA;
        st.t_restante_fase = 0.0f;
        ev.completada = true;
        return;
    }
    st.t_restante_fase = seq[st.indice_fase].duracion_s;
    ev.cambio_fase = true;
}

static RegistroRep cerrarRepeticion(TipoFase tipo, EstadoSesion& st) {
    // Piso/techo en 0: una rep sin excursión hacia su lado registra 0
    float ext = st.rep.con_muestra ? st.rep.extremo : 0.0f;
    ext = (tipo == TipoFase::REP_FRENTE) ? std::max(0.0f, ext) : std::min(0.0f, ext);
    RegistroRep r{ tipo, ext, st.rep.meta_alcanzada, st.rep.meta_alcanzada ? st.rep.t_meta : 0.0f };
    st.reps_completadas++;
    st.rep = MetricasRep{};
    return r;
}

static void actualizarMetricas(const config::SesionTuning& cfg, TipoFase tipo, EstadoSesion& st, float angulo, float dt) {
    MetricasRep& m = st.rep;
    m.t_transcurrido += dt;
    if (!m.con_muestra) { m.extremo = angulo; m.con_muestra = true; }
    else if (tipo == TipoFase::REP_FRENTE) m.extremo = std::max(m.extremo, angulo);
    else m.extremo = std::min(m.extremo, angulo);
    if (!m.meta_alcanzada) {
        const bool cruzo = (tipo == TipoFase::REP_FRENTE) ? (angulo >= cfg.meta_frente_deg)
                                                          : (angulo <= cfg.meta_tras_deg);
        if (cruzo) { m.meta_alcanzada = true; m.t_meta = m.t_transcurrido; }
    }
}

EventosFase avanzarFases(const config::SesionTuning& cfg, const std::vector<DefinicionFase>& seq,
                         EstadoSesion& st, float angulo, float dt) {
    EventosFase ev;
    if (st.etapa == EtapaSesion::CUENTA_REGRESIVA) {
        st.cuenta_regresiva_s -= dt;
        if (st.cuenta_regresiva_s > 0.0f) return ev;
        st.cuenta_regresiva_s = 0.0f;
        ev.inicio_curso = true;
        if (seq.empty()) { st.etapa = EtapaSesion::COMPLETA; ev.completada = true; return ev; }
        st.etapa = EtapaSesion::EN_CURSO;
        st.indice_fase = 0;
        st.t_restante_fase = seq[0].duracion_s;
        st.t_en_cero = 0.0f;
        st.t_en_transicion = 0.0f;
    } else if (st.etapa == EtapaSesion::EN_CURSO) {
        const DefinicionFase& f = seq[st.indice_fase];
        switch (f.tipo) {
            case TipoFase::TRANSICION:
                st.t_en_transicion += dt;
                // La ventana de tolerancia debe ser continua
                if (std::fabs(angulo) <= cfg.tolerancia_asentamiento_deg) st.t_en_cero += dt;
                else st.t_en_cero = 0.0f;
                st.t_restante_fase -= dt;
                if (st.t_en_cero >= cfg.t_asentamiento_s || st.t_en_transicion >= cfg.t_asentamiento_max_s) {
                    st.t_en_cero = 0.0f;
                    st.t_en_transicion = 0.0f;
                    siguienteFase(seq, st, ev);
                }
                break;
            case TipoFase::REP_TRAS:
            case TipoFase::REP_FRENTE:
                st.t_restante_fase -= dt;
                if (st.t_restante_fase <= 0.0f) {
                    ev.registro = cerrarRepeticion(f.tipo, st);
                    ev.rep_cerrada = true;
                    siguienteFase(seq, st, ev);
                }
                break;
            case TipoFase::DESCANSO:
                st.t_restante_fase -= dt;
                if (st.t_restante_fase <= 0.0f) siguienteFase(seq, st, ev);
                break;
        }
    } else {
        return ev;
    }

    // Métricas sobre la fase que queda activa tras la transición de este tick
    if (st.etapa == EtapaSesion::EN_CURSO && esRepeticion(seq[st.indice_fase].tipo)) {
        actualizarMetricas(cfg, seq[st.indice_fase].tipo, st, angulo, dt);
    }
    return ev;
}

// ===================== MOTOR =====================

MotorSesion::MotorSesion(const config::SesionTuning& cfg)
    : cfg_(cfg),
      seq_(generarSecuencia(cfg)),
      cal_(cfg.t_calibracion_s),
      clasif_(cfg.umbral_entrada_deg, cfg.umbral_salida_deg),
      cine_(cfg) {
    // Al encender se calibra con el pie en reposo
    cal_.iniciar();
}

bool MotorSesion::controlable() const {
    return st_.etapa == EtapaSesion::EN_CURSO && !cal_.activa();
}

const DefinicionFase* MotorSesion::faseActual() const {
    if (st_.etapa != EtapaSesion::EN_CURSO || st_.indice_fase >= seq_.size()) return nullptr;
    return &seq_[st_.indice_fase];
}

bool MotorSesion::movimientoHabilitado() const {
    const DefinicionFase* f = faseActual();
    return controlable() && f && f->tipo != TipoFase::TRANSICION;
}

EventosFase MotorSesion::tick(const EntradaTick& in, float dt) {
    if (!std::isfinite(dt) || dt < 0.0f) dt = 0.0f;
    // Entrada ausente o corrupta => ángulo sin cambios
    if (in.hay_angulo && std::isfinite(in.angulo_crudo)) crudo_ = in.angulo_crudo;

    if (cal_.activa() && cal_.agregar(crudo_, dt)) {
        LOG_INFO("CAL", "Cero=%.2f deg (%u muestras)", cal_.cero(), (unsigned)cal_.muestras());
    }

    const bool ctrl = controlable();
    if (ctrl) {
        st_.angulo_control = crudo_ - cal_.cero();
        st_.tasa_angular = (st_.angulo_control - st_.angulo_previo) / std::max(1e-3f, dt);
    } else {
        st_.angulo_control = 0.0f;
        st_.tasa_angular = 0.0f;
    }
    st_.angulo_previo = st_.angulo_control;

    if (ctrl) clasif_.actualizar(st_.angulo_control);
    else clasif_.forzarNeutro();

    if (st_.etapa == EtapaSesion::CUENTA_REGRESIVA || st_.etapa == EtapaSesion::EN_CURSO) {
        st_.t_sesion_s += dt;
    }

    EventosFase ev;
    if (!cal_.activa()) ev = avanzarFases(cfg_, seq_, st_, st_.angulo_control, dt);

    if (ev.inicio_curso) LOG_INFO("SESION", "Inicio protocolo: %u fases", (unsigned)seq_.size());
    if (ev.rep_cerrada) {
        registros_.push_back(ev.registro);
        if (ev.registro.tiene_t_meta) {
            LOG_INFO("SESION", "Rep %u/%u %s ext=%.1f meta=%.2fs", (unsigned)st_.reps_completadas, (unsigned)repsTotales(),
                     nombreFase(ev.registro.direccion), ev.registro.extremo_deg, ev.registro.t_meta_s);
        } else {
            LOG_INFO("SESION", "Rep %u/%u %s ext=%.1f meta=-", (unsigned)st_.reps_completadas, (unsigned)repsTotales(),
                     nombreFase(ev.registro.direccion), ev.registro.extremo_deg);
        }
    }
    if (ev.cambio_fase) {
        LOG_DEBUG("SESION", "Fase %u/%u %s", (unsigned)(st_.indice_fase + 1), (unsigned)seq_.size(),
                  nombreFase(seq_[st_.indice_fase].tipo));
    }

    act_ = mapearActuacion(st_.angulo_control, cfg_);
    cine_.paso(act_, dt, movimientoHabilitado());

    if (ev.completada) {
        LOG_INFO("SESION", "Sesion completa reps=%u t=%.1fs vmed=%.1fkm/h", (unsigned)registros_.size(),
                 st_.t_sesion_s, cine_.velocidadMediaKmh());
    }
    return ev;
}

bool MotorSesion::iniciar() {
    if (st_.etapa != EtapaSesion::NO_INICIADA) {
        LOG_DEBUG("SESION", "Inicio ignorado en %s", nombreEtapa(st_.etapa));
        return false;
    }
    forzarReinicio();
    return true;
}

bool MotorSesion::reiniciar() {
    if (st_.etapa != EtapaSesion::COMPLETA) {
        LOG_DEBUG("SESION", "Reinicio ignorado en %s", nombreEtapa(st_.etapa));
        return false;
    }
    forzarReinicio();
    return true;
}

void MotorSesion::forzarReinicio() {
    st_ = EstadoSesion{};
    st_.etapa = EtapaSesion::CUENTA_REGRESIVA;
    st_.cuenta_regresiva_s = cfg_.cuenta_regresiva_s;
    registros_.clear();
    clasif_.forzarNeutro();
    cine_.reiniciar();
    act_ = Actuacion{ 0.0f, 0.0f };
    LOG_INFO("SESION", "Cuenta regresiva %.1fs", cfg_.cuenta_regresiva_s);
}

void MotorSesion::recalibrar() {
    cal_.iniciar();
    LOG_INFO("CAL", "Calibrando cero (%.1fs), mantener el pie quieto", cal_.duracion());
}

ReporteSesion MotorSesion::reporte() const {
    ReporteSesion r;
    r.reps = registros_;
    r.t_total_s = st_.t_sesion_s;
    r.vmedia_kmh = cine_.velocidadMediaKmh();
    r.reps_hechas = st_.reps_completadas;
    r.reps_totales = repsTotales();
    r.final = st_.etapa == EtapaSesion::COMPLETA;
    return r;
}

} // namespace control
