/**
 * @file Filtros.h
 * @brief Filtros y utilidades numéricas del acondicionamiento de señal.
 *
 * Provee:
 *  - Filtro pasa-bajos exponencial de primer orden (suavizado del ángulo crudo)
 *  - Promedio acumulado (ventana de calibración de cero)
 *  - Recorte de rango
 */
#pragma once
#include <cstddef>

namespace utils {

inline float clip(float v,float mn,float mx){ if(v<mn) return mn; if(v>mx) return mx; return v; }

// ===================== PASA-BAJOS =====================
/**
 * @brief Filtro exponencial y = a*x + (1-a)*y.
 *
 * La primera muestra inicializa el estado (sin transitorio desde 0).
 */
class FiltroPasaBajos {
public:
    explicit FiltroPasaBajos(float alpha = 0.25f) : a_(alpha) {}

    /**
     * @brief Incorpora una muestra y devuelve el valor filtrado.
     * @param x Muestra cruda
     */
    float actualizar(float x) {
        if (!init_) { y_ = x; init_ = true; }
        else        { y_ = a_*x + (1.0f - a_)*y_; }
        return y_;
    }
    /** @brief Olvida el estado; la próxima muestra vuelve a inicializar. */
    void reiniciar() { init_ = false; y_ = 0.0f; }
    float valor() const { return y_; }
    bool inicializado() const { return init_; }
    float alpha() const { return a_; }
private:
    float a_;
    float y_ = 0.0f;
    bool init_ = false;
};

// ===================== PROMEDIO ACUMULADO =====================
/** @brief Media aritmética de todas las muestras desde el último reinicio. */
class PromedioAcumulado {
public:
    void reiniciar() { suma_ = 0.0; n_ = 0; }
    void agregar(float v) { suma_ += v; n_++; }
    size_t cantidad() const { return n_; }
    /** @return Media, o 0 si no hay muestras. */
    float media() const { return n_ ? (float)(suma_ / (double)n_) : 0.0f; }
private:
    double suma_ = 0.0;
    size_t n_ = 0;
};

} // namespace utils
