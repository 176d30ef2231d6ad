#include "Logger.h"
#include <chrono>
#include <cstdarg>
#include <cstdio>

namespace monitoreo {

Logger& Logger::instancia() { static Logger L; return L; }

bool Logger::iniciar(const LoggingConfig& cfg) {
    std::lock_guard<std::mutex> lk(mtx_);
    config_ = cfg;
    if (config_.lineas_recientes == 0) config_.lineas_recientes = 1;
    buffer_reciente_.clear();
    descartadas_ = 0;
    iniciado_ = true;
    return true;
}

void Logger::registrarBoot(uint32_t duracion_init_ms, int razon_reinicio) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        arranques_ms_.push_back(duracion_init_ms);
    }
    logf(LogLevel::INFO, "BOOT", "ResetReason=%d init=%lums", razon_reinicio, (unsigned long)duracion_init_ms);
}

void Logger::logf(LogLevel nivel, const char* categoria, const char* fmt, ...) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!iniciado_ || config_.modo == LogMode::DESHABILITADO) return;
        if (nivel < config_.nivel_minimo || nivel == LogLevel::NONE) { descartadas_++; return; }
    }
    char buffer[256];
    va_list ap; va_start(ap, fmt); vsnprintf(buffer, sizeof(buffer), fmt, ap); va_end(ap);
    LineaLog l{ ahora(), nivel, categoria ? categoria : "?", buffer };
    escribirLinea(l);
}

void Logger::escribirLinea(const LineaLog& l) {
    std::lock_guard<std::mutex> lk(mtx_);
    // Guardar en buffer circular en RAM
    while (buffer_reciente_.size() >= config_.lineas_recientes) buffer_reciente_.pop_front();
    buffer_reciente_.push_back(l);

    // Formatear línea
    char linea[320];
    snprintf(linea, sizeof(linea), "%lu [%s] (%s) %s\n", (unsigned long)l.ts_ms, nivelToString(l.nivel), l.categoria.c_str(), l.mensaje.c_str());

    const bool a_serial  = config_.modo == LogMode::SOLO_SERIAL  || config_.modo == LogMode::SERIAL_Y_ARCHIVO;
    const bool a_archivo = config_.modo == LogMode::SOLO_ARCHIVO || config_.modo == LogMode::SERIAL_Y_ARCHIVO;
    for (const auto& s : salidas_) {
        if ((s.destino == DestinoLog::SERIE && a_serial) || (s.destino == DestinoLog::ARCHIVO && a_archivo)) {
            s.fn(linea);
        }
    }
}

void Logger::agregarSalida(DestinoLog destino, SalidaLog salida) {
    if (!salida) return;
    std::lock_guard<std::mutex> lk(mtx_);
    salidas_.push_back(Salida{ destino, salida });
}

void Logger::limpiarSalidas() {
    std::lock_guard<std::mutex> lk(mtx_);
    salidas_.clear();
}

void Logger::setReloj(RelojMs reloj) {
    std::lock_guard<std::mutex> lk(mtx_);
    reloj_ = reloj;
}

uint32_t Logger::ahora() const {
    RelojMs r;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        r = reloj_;
    }
    if (r) return r();
    static const auto t0 = std::chrono::steady_clock::now();
    return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
}

void Logger::volcarEstado() {
    size_t arranques, lineas;
    uint32_t descartadas;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        arranques = arranques_ms_.size();
        lineas = buffer_reciente_.size();
        descartadas = descartadas_;
    }
    logf(LogLevel::INFO, "LOGGER", "Arranques=%u lineas_recientes=%u descartadas=%lu",
         (unsigned)arranques, (unsigned)lineas, (unsigned long)descartadas);
}

void Logger::setNivelMinimo(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(mtx_);
    config_.nivel_minimo = lvl;
}

LogLevel Logger::getNivelMinimo() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return config_.nivel_minimo;
}

std::vector<LineaLog> Logger::lineasRecientes() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::vector<LineaLog>(buffer_reciente_.begin(), buffer_reciente_.end());
}

const char* Logger::nivelToString(LogLevel n) {
    switch(n) {
        case LogLevel::TRACE: return "TRC";
        case LogLevel::DEBUG: return "DBG";
        case LogLevel::INFO: return "INF";
        case LogLevel::WARN: return "WRN";
        case LogLevel::ERROR: return "ERR";
        case LogLevel::CRITICAL: return "CRT";
        default: return "???";
    }
}

} // namespace monitoreo
