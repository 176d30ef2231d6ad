#include "ConsolaSerial.h"
#include "monitoreo/LogMacros.h"

namespace modulos {

void ConsolaSerial::actualizar() {
    while (Serial.available() > 0) {
        int b = Serial.read();
        if (b < 0) break;
        // Fin de línea de terminales que envían con Enter
        if (b == '\r' || b == '\n') continue;
        control::Comando c = control::comandoDesdeTecla((char)b);
        if (c == control::Comando::NINGUNO) continue;
        if (cfg_.eco_teclas) LOG_DEBUG("CONSOLA", "Tecla '%c' -> %s", (char)b, control::nombreComando(c));
        if (callback_) callback_(c);
    }
}

} // namespace modulos
