#include "ModuloSesion.h"
#include <string>
#include "comms/SensorPipeline.h"
#include "monitoreo/LogMacros.h"
#include "reporte/ReporteJson.h"

namespace modulos {

bool ModuloSesion::iniciar() {
    const char* motivo = nullptr;
    if (!config::validarSesionTuning(motor_.tuning(), &motivo)) {
        LOG_ERROR("SESION", "Sintonia invalida: %s", motivo ? motivo : "?");
        return false;
    }
    if (!SensorPipeline::init()) return false;
    LOG_INFO("SESION", "Protocolo %u reps x direccion, %u fases. ESPACIO para empezar",
             (unsigned)motor_.tuning().reps_por_direccion, (unsigned)motor_.secuencia().size());
    t_estado_ms_ = millis();
    return true;
}

void ModuloSesion::actualizar() {
    uint32_t ahora = micros();
    if (primer_tick_) { t_prev_us_ = ahora; primer_tick_ = false; return; }
    uint32_t transcurrido = ahora - t_prev_us_;
    if (transcurrido < consola_cfg_.periodo_tick_us) return;
    t_prev_us_ = ahora;
    const float dt = transcurrido * 1e-6f;

    control::EntradaTick in;
    LecturaSensor l;
    if (SensorPipeline::latest(l)) {
        in.angulo_crudo = l.angulo;
        in.hay_angulo = l.hay_angulo;
        bateria_.hay_lectura = l.hay_bateria;
        bateria_.voltaje = l.bateria_v;
    }
    control::EventosFase ev = motor_.tick(in, dt);
    ticks_++;

    const bool baja = control::bateriaBaja(bateria_, sensor_cfg_.umbral_bateria_baja_v);
    if (baja != bateria_baja_) {
        if (baja) LOG_WARN("BAT", "Bateria baja %.2fV (< %.2fV)", bateria_.voltaje, sensor_cfg_.umbral_bateria_baja_v);
        else LOG_INFO("BAT", "Bateria %.2fV", bateria_.voltaje);
        bateria_baja_ = baja;
    }

    if (ev.inicio_curso) reporte_publicado_ = false;
    if (ev.completada) publicarReporte();

    if (millis() - t_estado_ms_ >= consola_cfg_.periodo_estado_ms) {
        t_estado_ms_ = millis();
        imprimirEstado();
    }
}

void ModuloSesion::detener() {
    if (!reporte_publicado_ && !motor_.registros().empty()) publicarReporte();
}

void ModuloSesion::onComando(control::Comando c) {
    using control::Comando;
    switch (c) {
        case Comando::INICIAR:
        case Comando::REINICIAR:
        case Comando::RECALIBRAR:
            if (control::aplicarComando(motor_, c)) reporte_publicado_ = false;
            break;
        case Comando::CERO_DISPOSITIVO:
            if (sensor_) sensor_->solicitarCero();
            else LOG_WARN("SESION", "Sin sensor: cero ignorado");
            break;
        case Comando::ESTADO:
            imprimirEstado();
            monitoreo::Logger::instancia().volcarEstado();
            SensorPipeline::dumpStats();
            break;
        default:
            break;
    }
}

void ModuloSesion::imprimirEstado() {
    control::VistaSesion v = control::construirVista(motor_, bateria_, sensor_cfg_.umbral_bateria_baja_v);
    char t[12];
    control::formatearMmSs(v.t_sesion_s, t, sizeof(t));
    const char* enlace = sensor_ ? comms::nombreEstadoEnlace(sensor_->estadoEnlace()) : "OFF";
    if (v.aviso == control::Aviso::CUENTA_REGRESIVA) {
        LOG_INFO("HUD", "%s %ds enlace=%s", control::nombreAviso(v.aviso), v.segundos_cuenta, enlace);
        return;
    }
    LOG_INFO("HUD", "%s t=%s reps=%u/%u ang=%.1f tasa=%.1f cmd=%s mov=%s v=%.1fkm/h d=%.1fm vmed=%.1f meta=%s bat=%.2fV enlace=%s ticks=%lu",
             control::nombreAviso(v.aviso), t, (unsigned)v.reps_hechas, (unsigned)v.reps_totales,
             v.angulo_deg, v.tasa_deg_s, control::nombreDireccion(v.comando), control::nombreDireccion(v.movimiento),
             v.velocidad_kmh, v.distancia_m, v.vmedia_kmh,
             v.meta_visible ? (v.meta_cumplida ? "OK" : "--") : "n/a",
             v.bateria_v, enlace, (unsigned long)ticks_);
}

void ModuloSesion::publicarReporte() {
    std::string json;
    size_t n = reporte::serializarReporte(motor_.reporte(), json);
    if (n == 0) {
        LOG_ERROR("SESION", "No se pudo serializar el reporte");
        return;
    }
    Serial.println(json.c_str());
    reporte_publicado_ = true;
}

} // namespace modulos
