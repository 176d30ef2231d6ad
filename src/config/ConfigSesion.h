/**
 * @file ConfigSesion.h
 * @brief Parámetros de sintonía de la sesión de rehabilitación (mapeo, cinemática, protocolo).
 */
#pragma once
#include <cstdint>

namespace config {

/**
 * @brief Sintonía inmutable consumida por MotorSesion y sus componentes.
 *
 * Ángulos en grados, velocidades en px/s y aceleraciones en px/s² (la escala
 * física se obtiene con px_por_m). Tiempos en segundos.
 */
struct SesionTuning {
    // Mapeo ángulo -> actuación
    float zona_muerta_deg = 2.0f;
    float angulo_max_adelante_deg = 30.0f;  // plantar (positivo)
    float angulo_max_reversa_deg = 30.0f;   // dorsi (negativo)
    float gamma_adelante = 0.9f;
    float gamma_reversa = 0.9f;

    // Cinemática del vehículo
    float v_max = 980.0f;
    float v_rev_max = 600.0f;
    float a_max = 1200.0f;
    float a_rev_max = 900.0f;
    float arrastre = 180.0f;
    float px_por_m = 70.0f;

    // Histéresis de dirección
    float umbral_entrada_deg = 3.0f;
    float umbral_salida_deg = 2.0f;

    // Protocolo
    float cuenta_regresiva_s = 8.0f;
    float meta_frente_deg = 20.0f;
    float meta_tras_deg = -20.0f;
    float t_repeticion_s = 10.0f;
    float t_descanso_s = 2.0f;
    uint8_t reps_por_direccion = 5;

    // Transición (vuelta al cero)
    float tolerancia_asentamiento_deg = 2.5f;
    float t_asentamiento_s = 3.0f;
    float t_asentamiento_max_s = 6.0f;

    // Calibración de cero en el host
    float t_calibracion_s = 4.0f;
};

SesionTuning obtenerSesionTuningDefault();

/**
 * @brief Verifica coherencia de la sintonía.
 * @param motivo Si no es nulo recibe una descripción corta del primer problema.
 * @return true si la sintonía puede usarse.
 */
bool validarSesionTuning(const SesionTuning& t, const char** motivo = nullptr);

} // namespace config
