/**
 * @file Logger.h
 * @brief Logger con soporte de niveles, buffer reciente en RAM y salidas conectables
 *        (Serial / archivo en el dispositivo, captura en pruebas).
 */
#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "config/ConfigLogging.h"

namespace monitoreo {

using config::LogLevel;
using config::LogMode;
using config::LoggingConfig;

// Línea genérica de log
struct LineaLog {
    uint32_t ts_ms;        // Timestamp relativo (millis)
    LogLevel nivel;        // Severidad
    std::string categoria; // Módulo / etiqueta
    std::string mensaje;   // Contenido
};

// Destino físico de una salida; LogMode decide cuáles reciben líneas
enum class DestinoLog : uint8_t { SERIE, ARCHIVO };

using SalidaLog = std::function<void(const char* linea)>;
using RelojMs = std::function<uint32_t()>;

class Logger {
public:
    static Logger& instancia();

    // Debe llamarse antes de cualquier log. Las salidas se registran aparte.
    bool iniciar(const LoggingConfig& cfg);

    // Registrar arranque (razon = código de reset del chip, -1 si no aplica)
    void registrarBoot(uint32_t duracion_init_ms, int razon_reinicio = -1);

    // Log genérico estilo printf
    void logf(LogLevel nivel, const char* categoria, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 4, 5)))
#endif
        ;

    void agregarSalida(DestinoLog destino, SalidaLog salida);
    void limpiarSalidas();
    void setReloj(RelojMs reloj);

    // Resumen por las salidas (arranques + ocupación del buffer)
    void volcarEstado();

    // Cambio dinámico del nivel mínimo
    void setNivelMinimo(LogLevel lvl);
    LogLevel getNivelMinimo() const;

    std::vector<LineaLog> lineasRecientes() const;
    uint32_t lineasDescartadas() const { return descartadas_; }

    static const char* nivelToString(LogLevel n);

private:
    Logger() = default;
    void escribirLinea(const LineaLog& l);
    uint32_t ahora() const;

    struct Salida { DestinoLog destino; SalidaLog fn; };

    mutable std::mutex mtx_;
    LoggingConfig config_{};
    bool iniciado_ = false;
    RelojMs reloj_{};
    std::vector<Salida> salidas_;
    std::deque<LineaLog> buffer_reciente_;
    std::vector<uint32_t> arranques_ms_;
    uint32_t descartadas_ = 0; // por nivel
};

} // namespace monitoreo
