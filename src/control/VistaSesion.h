/**
 * @file VistaSesion.h
 * @brief Instantánea de la sesión para la capa de presentación (aviso, barra de fase,
 *        meta, HUD y resumen). No modifica el motor.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include "control/MotorSesion.h"

namespace control {

// Prioridad de mayor a menor en el orden de declaración
enum class Aviso : uint8_t {
    CALIBRANDO,
    BATERIA_BAJA,
    ESPERANDO_INICIO,
    CUENTA_REGRESIVA,
    SESION_COMPLETA,
    FASE_TRAS,
    FASE_FRENTE,
    FASE_TRANSICION,
    FASE_DESCANSO
};

const char* nombreAviso(Aviso a);

enum class TendenciaAngular : uint8_t { ESTABLE, PLANTAR, DORSI };

struct EstadoBateria {
    bool  hay_lectura = false;
    float voltaje = 0.0f;
};

inline bool bateriaBaja(const EstadoBateria& b, float umbral_v) { return b.hay_lectura && b.voltaje < umbral_v; }

struct VistaSesion {
    Aviso aviso = Aviso::ESPERANDO_INICIO;
    int   segundos_cuenta = 0;          // ceil de la cuenta regresiva

    // Barra de fase
    bool  hay_barra = false;
    TipoFase fase = TipoFase::REP_TRAS;
    float barra_restante_s = 0.0f;
    float barra_total_s = 0.0f;
    float barra_progreso = 0.0f;        // 0..1

    // Meta de la fase
    bool  meta_visible = false;
    float meta_deg = 0.0f;
    bool  meta_cumplida = false;

    // Resumen de sesión
    bool  hay_tiempo = false;
    float t_sesion_s = 0.0f;
    uint16_t reps_hechas = 0;
    uint16_t reps_totales = 0;
    float vmedia_kmh = 0.0f;

    // HUD
    float velocidad_kmh = 0.0f;
    float distancia_m = 0.0f;
    float angulo_deg = 0.0f;
    float tasa_deg_s = 0.0f;
    TendenciaAngular tendencia = TendenciaAngular::ESTABLE;
    Direccion comando = Direccion::NEUTRO;
    Direccion movimiento = Direccion::NEUTRO;

    bool  bateria_baja = false;
    float bateria_v = 0.0f;
};

VistaSesion construirVista(const MotorSesion& m, const EstadoBateria& bat, float umbral_bateria_v);

/** @brief Tiempo de sesión como "mm:ss" (segundos truncados). */
void formatearMmSs(float segundos, char* buf, size_t n);

} // namespace control
