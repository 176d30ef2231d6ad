/**
 * @file MaquinaReconexion.h
 * @brief Estados del enlace SPP con el IMU y temporización de reintentos.
 *
 * DESCONECTADO -> CONECTANDO -> CONECTADO. Un fallo (o la pérdida del enlace)
 * vuelve a DESCONECTADO con una espera de `backoff_fallo_ms`; si el dispositivo
 * no aparece la espera es `espera_sin_dispositivo_ms`. Los tiempos son millis()
 * de 32 bits y las restas toleran el desborde.
 */
#pragma once
#include <cstdint>

namespace comms {

enum class EstadoEnlace : uint8_t { DESCONECTADO, CONECTANDO, CONECTADO };

const char* nombreEstadoEnlace(EstadoEnlace e);

class MaquinaReconexion {
public:
    MaquinaReconexion(uint32_t backoff_fallo_ms, uint32_t espera_sin_dispositivo_ms)
        : backoff_fallo_ms_(backoff_fallo_ms), espera_sin_dispositivo_ms_(espera_sin_dispositivo_ms) {}

    /** @brief true si está desconectado y ya venció la espera. */
    bool puedeIntentar(uint32_t ahora_ms) const;
    void inicioIntento(uint32_t ahora_ms);
    void conectado(uint32_t ahora_ms);
    /** @brief No se encontró el dispositivo: reintento tras la espera larga. */
    void sinDispositivo(uint32_t ahora_ms);
    /** @brief Fallo de conexión, de lectura o cierre del enlace. */
    void fallo(uint32_t ahora_ms);
    /** @brief ms que faltan para poder reintentar (0 si ya puede o no está desconectado). */
    uint32_t esperaRestante(uint32_t ahora_ms) const;

    EstadoEnlace estado() const { return estado_; }
    uint32_t intentos() const { return intentos_; }
    uint32_t reconexiones() const { return reconexiones_; }
    uint32_t fallos() const { return fallos_; }
    uint32_t conectadoDesdeMs() const { return t_conexion_ms_; }

private:
    uint32_t backoff_fallo_ms_;
    uint32_t espera_sin_dispositivo_ms_;
    EstadoEnlace estado_ = EstadoEnlace::DESCONECTADO;
    uint32_t t_evento_ms_ = 0;
    uint32_t espera_ms_ = 0;      // espera vigente desde t_evento_ms_
    uint32_t t_conexion_ms_ = 0;
    uint32_t intentos_ = 0;
    uint32_t reconexiones_ = 0;   // conexiones exitosas después de la primera
    uint32_t fallos_ = 0;
    bool hubo_conexion_ = false;
};

/**
 * @brief Pedido de un solo uso hacia el IMU (p.ej. cero en el dispositivo).
 *
 * Sólo se acepta con el enlace CONECTADO; sin enlace se descarta en el acto y
 * nunca queda pendiente para una conexión posterior. `descartar()` se llama al
 * establecer cada enlace nuevo.
 */
class PedidoEnlace {
public:
    /** @return true si quedó pendiente de envío. */
    bool solicitar(EstadoEnlace estado) {
        if (estado != EstadoEnlace::CONECTADO) return false;
        pendiente_ = true;
        return true;
    }
    /** @brief Consume el pedido: true una sola vez por pedido aceptado. */
    bool tomar() {
        if (!pendiente_) return false;
        pendiente_ = false;
        return true;
    }
    void descartar() { pendiente_ = false; }
    bool pendiente() const { return pendiente_; }

private:
    volatile bool pendiente_ = false;
};

} // namespace comms
