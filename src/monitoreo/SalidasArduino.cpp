#include "SalidasArduino.h"
#include <Arduino.h>
#include <SPIFFS.h>
#include <esp_system.h>
#include "monitoreo/Logger.h"

namespace monitoreo {

static config::LoggingConfig cfg_archivo;

static void rotarSiNecesario() {
    if (!SPIFFS.exists(cfg_archivo.ruta_archivo)) return;
    File f = SPIFFS.open(cfg_archivo.ruta_archivo, FILE_READ);
    if (!f) return;
    size_t tam = f.size();
    f.close();
    if (tam < cfg_archivo.tam_max_archivo) return;
    // Rotación simple: renombrar log actual con sufijo .old y empezar nuevo
    String antiguo = String(cfg_archivo.ruta_archivo) + ".old";
    if (SPIFFS.exists(antiguo)) SPIFFS.remove(antiguo);
    SPIFFS.rename(cfg_archivo.ruta_archivo, antiguo);
}

static void escribirArchivo(const char* linea) {
    rotarSiNecesario();
    File f = SPIFFS.open(cfg_archivo.ruta_archivo, FILE_APPEND);
    if (f) { f.print(linea); f.close(); }
}

bool conectarSalidasArduino(const config::LoggingConfig& cfg) {
    Logger& L = Logger::instancia();
    L.setReloj([]() { return (uint32_t)millis(); });
    L.limpiarSalidas();
    L.agregarSalida(DestinoLog::SERIE, [](const char* linea) { Serial.print(linea); });

    const bool quiere_archivo = cfg.modo == config::LogMode::SOLO_ARCHIVO || cfg.modo == config::LogMode::SERIAL_Y_ARCHIVO;
    if (!quiere_archivo) return true;
    if (!SPIFFS.begin(true)) {
        Serial.println(F("[LOGGER] ERROR montando SPIFFS"));
        return false;
    }
    cfg_archivo = cfg;
    L.agregarSalida(DestinoLog::ARCHIVO, escribirArchivo);
    return true;
}

int razonReinicio() { return (int)esp_reset_reason(); }

} // namespace monitoreo
