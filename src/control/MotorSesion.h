/**
 * @file MotorSesion.h
 * @brief Máquina de estados de la sesión de rehabilitación.
 *
 * Encadena por tick: calibración de cero -> ángulo de control -> histéresis de
 * dirección -> cuenta regresiva / fases / métricas por repetición -> mapeo y
 * cinemática con habilitación. Todo el estado mutable del protocolo vive en
 * `EstadoSesion`; `avanzarFases()` es una función pura sobre él para poder
 * probar un tick de forma aislada.
 *
 * Etapas: NO_INICIADA -> CUENTA_REGRESIVA -> EN_CURSO -> COMPLETA. La calibración
 * es una capa lateral: mientras está activa el ángulo de control es 0 y los
 * temporizadores de cuenta regresiva y fase quedan congelados.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "config/ConfigSesion.h"
#include "control/CalibracionCero.h"
#include "control/ClasificadorDireccion.h"
#include "control/MapeoActuacion.h"
#include "control/ModeloCinematico.h"
#include "control/SecuenciaFases.h"

namespace control {

enum class EtapaSesion : uint8_t { NO_INICIADA, CUENTA_REGRESIVA, EN_CURSO, COMPLETA };

const char* nombreEtapa(EtapaSesion e);

/** @brief Métricas de la repetición activa. */
struct MetricasRep {
    bool  con_muestra = false;     // extremo válido
    float extremo = 0.0f;          // max (FRENTE) / min (TRÁS)
    bool  meta_alcanzada = false;
    float t_transcurrido = 0.0f;   // dentro de la fase
    float t_meta = 0.0f;           // válido sólo si meta_alcanzada
};

/** @brief Registro inmutable de una repetición cerrada. */
struct RegistroRep {
    TipoFase direccion;
    float extremo_deg;
    bool  tiene_t_meta;
    float t_meta_s;
};

/** @brief Estado explícito del protocolo (todo lo que cambia tick a tick). */
struct EstadoSesion {
    EtapaSesion etapa = EtapaSesion::NO_INICIADA;
    float cuenta_regresiva_s = 0.0f;
    size_t indice_fase = 0;
    float t_restante_fase = 0.0f;
    float t_en_cero = 0.0f;         // asentamiento continuo en la transición
    float t_en_transicion = 0.0f;   // total en la transición actual
    uint16_t reps_completadas = 0;
    float t_sesion_s = 0.0f;
    MetricasRep rep{};
    // Señal de control
    float angulo_control = 0.0f;
    float angulo_previo = 0.0f;
    float tasa_angular = 0.0f;      // °/s
};

/** @brief Lo ocurrido durante un paso de fases. */
struct EventosFase {
    bool inicio_curso = false;   // terminó la cuenta regresiva
    bool cambio_fase = false;
    bool rep_cerrada = false;
    RegistroRep registro{};      // válido si rep_cerrada
    bool completada = false;
};

/**
 * @brief Avanza cuenta regresiva, fase activa y métricas de repetición un tick.
 * @param angulo Ángulo de control ya calibrado
 * @note No toca calibración, clasificador ni cinemática.
 */
EventosFase avanzarFases(const config::SesionTuning& cfg, const std::vector<DefinicionFase>& seq,
                         EstadoSesion& st, float angulo, float dt);

/** @brief Entrada de un tick (última muestra publicada por el sensor). */
struct EntradaTick {
    float angulo_crudo = 0.0f;
    bool  hay_angulo = false;   // false => se mantiene el último valor
};

/** @brief Reporte consumible por la capa de presentación / serialización. */
struct ReporteSesion {
    std::vector<RegistroRep> reps;
    float t_total_s = 0.0f;
    float vmedia_kmh = 0.0f;
    uint16_t reps_hechas = 0;
    uint16_t reps_totales = 0;
    bool final = false;
};

class MotorSesion {
public:
    explicit MotorSesion(const config::SesionTuning& cfg);

    /** @brief Ejecuta un tick completo del motor de sesión. dt medido, en segundos. */
    EventosFase tick(const EntradaTick& in, float dt);

    // ----- Comandos -----
    /** NO_INICIADA -> CUENTA_REGRESIVA. Ignorado en otra etapa. */
    bool iniciar();
    /** COMPLETA -> CUENTA_REGRESIVA. Ignorado en otra etapa. */
    bool reiniciar();
    /** Reinicio completo desde cualquier etapa: limpia reporte, fases, timers y cinemática. */
    void forzarReinicio();
    /** Reabre la ventana de calibración de cero. */
    void recalibrar();

    // ----- Observación -----
    const EstadoSesion& estado() const { return st_; }
    const config::SesionTuning& tuning() const { return cfg_; }
    const std::vector<DefinicionFase>& secuencia() const { return seq_; }
    const std::vector<RegistroRep>& registros() const { return registros_; }
    const CalibracionCero& calibracion() const { return cal_; }
    const ModeloCinematico& cinematica() const { return cine_; }
    Direccion direccionComando() const { return clasif_.estado(); }
    const Actuacion& actuacion() const { return act_; }
    float anguloCrudo() const { return crudo_; }
    /** Fase activa, o nullptr fuera de EN_CURSO. */
    const DefinicionFase* faseActual() const;
    bool controlable() const;
    bool movimientoHabilitado() const;
    uint16_t repsTotales() const { return (uint16_t)(2u * cfg_.reps_por_direccion); }
    ReporteSesion reporte() const;

private:
    config::SesionTuning cfg_;
    std::vector<DefinicionFase> seq_;
    EstadoSesion st_{};
    CalibracionCero cal_;
    ClasificadorDireccion clasif_;
    ModeloCinematico cine_;
    std::vector<RegistroRep> registros_;
    Actuacion act_{ 0.0f, 0.0f };
    float crudo_ = 0.0f;
};

} // namespace control
