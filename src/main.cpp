#include <Arduino.h>
#include "core/GestorSistema.h"
#include "monitoreo/Logger.h"
#include "monitoreo/LogMacros.h"
#include "monitoreo/SalidasArduino.h"
#include "config/ConfigPerfil.h"
#include "comms/SensorImuBT.h"
#include "modulos/ConsolaSerial.h"
#include "modulos/ModuloSesion.h"

using namespace core;
using namespace monitoreo;

static bool apagado = false;

void setup() {
    // Cargar perfil completo de configuración
    static config::ConfigPerfil perfil = config::cargarConfigDefault();

    Serial.begin(perfil.consola.baudios);
    delay(300);
    // Mensaje inicial solo para asegurar que el Serial está activo antes del logger
    Serial.println(F("[BOOT] Rehab Racer iniciando..."));

    auto t0 = millis();

    // Iniciar logger con la parte de logging del perfil
    Logger::instancia().iniciar(perfil.logging);
    if (!conectarSalidasArduino(perfil.logging)) {
        LOG_WARN("BOOT", "Log en archivo no disponible, sólo Serial");
    }

    // Instanciar módulos condicionalmente según el perfil
    static comms::SensorImuBT sensor(perfil.sensor);
    static modulos::ModuloSesion sesion(perfil, perfil.sensor.habilitar_sensor ? &sensor : nullptr);
    static modulos::ConsolaSerial consola(perfil.consola);

    if (perfil.sensor.habilitar_sensor)
        GestorSistema::instancia().registrar(&sensor);
    GestorSistema::instancia().registrar(&sesion);
    GestorSistema::instancia().registrar(&consola);

    // Teclas de la consola -> sesión; salir detiene todos los módulos
    consola.setCallback([&](control::Comando c) {
        if (c == control::Comando::SALIR) {
            LOG_INFO("CORE", "Salida pedida por consola");
            GestorSistema::instancia().detener();
            apagado = true;
            return;
        }
        sesion.onComando(c);
    });

    if (!GestorSistema::instancia().iniciar()) {
        LOG_ERROR("CORE", "Fallo inicializando modulos");
    } else {
        LOG_INFO("CORE", "Modulos iniciados");
    }
    auto t1 = millis();
    Logger::instancia().registrarBoot(t1 - t0, razonReinicio());
}

void loop() {
    if (apagado) { delay(100); return; }
    GestorSistema::instancia().loop();
    delay(1);
}
